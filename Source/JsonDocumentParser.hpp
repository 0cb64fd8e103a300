/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Errors.hpp"
#include "JsonCommon.hpp"
#include "Lib/ModuleRegistry.hpp"
#include "Modules.hpp"

namespace Json {
using namespace StdLib;

/** Where a parse failure happened, resolved from the parser's byte offset */
struct TextLocation {
    size_t Line = 1;
    size_t Column = 1;
    String LineText;
};

/** LocateByte - Resolves a 1-based byte offset as reported by nlohmann::json::parse_error::byte
 * The offset may point one past the end of text when the input ended unexpectedly.
 */
TextLocation LocateByte(const String& text, size_t byte);

/** ParserMessage - Strips the "[json.exception...] parse error at line L, column C: " prefix */
String ParserMessage(const String& what);

class JsonDocumentParser {
public:
    explicit JsonDocumentParser(const SharedPtr<ModuleRegistry>& moduleRegistry)
      : mModuleRegistry(moduleRegistry), mLog(moduleRegistry->LoggerRegistry()->Logger(Module::Name::JSON_PARSER)) {}

    /** Parse - Parses text as a single JSON document
     * @param label Names the document in diagnostics, e.g. "REQUEST"
     * @throw Errors::ParseError when text is not well-formed JSON
     */
    JSON Parse(const String& text, const String& label) const;

private:
    SharedPtr<ModuleRegistry> mModuleRegistry;
    SharedPtr<Log::SpdLogger> mLog;
}; // class JsonDocumentParser
} // namespace Json
