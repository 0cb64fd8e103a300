/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "JsonDocumentParser.hpp"

#include "Lib/Utils.hpp"

#include <algorithm>

namespace Json {
TextLocation LocateByte(const String& text, size_t byte) {
    // The parser counts the character it failed on, so the failing character sits at byte - 1
    const size_t offset = std::min(byte > 0 ? byte - 1 : 0, text.size());
    TextLocation location;
    size_t lineBegin = 0;
    for (size_t pos = 0; pos < offset; ++pos) {
        if (text[pos] == '\n') {
            ++location.Line;
            lineBegin = pos + 1;
        }
    }

    location.Column = offset - lineBegin + 1;
    const auto lines = Utils::fSplitLines(text);
    location.LineText = (location.Line <= lines.size()) ? lines[location.Line - 1] : String();
    return location;
}

String ParserMessage(const String& what) {
    static const String PARSE_ERROR_MARK = "parse error";
    const auto markPos = what.find(PARSE_ERROR_MARK);
    if (markPos == String::npos) {
        return what;
    }

    const auto separatorPos = what.find(": ", markPos);
    if (separatorPos == String::npos) {
        return what;
    }

    return what.substr(separatorPos + 2);
}

JSON JsonDocumentParser::Parse(const String& text, const String& label) const {
    try {
        auto jDocument = JSON::parse(text);
        if (mLog->should_log(spdlog::level::trace)) {
            mLog->trace("Successfully parsed {} document:\n{}", label, jDocument.dump(DEFAULT_OUTPUT_INDENT));
        }

        return jDocument;
    }
    catch (const JSON::parse_error& ex) {
        const auto location = LocateByte(text, ex.byte);
        Errors::ParseError parseError(label, location.Line, location.Column, location.LineText, ParserMessage(ex.what()));
        mLog->error("Failed to parse {} document at line {}, column {}. Error: {}", label, location.Line, location.Column, parseError.Message());
        throw parseError;
    }
}
} // namespace Json
