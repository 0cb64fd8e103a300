/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "FieldPath.hpp"
#include "JsonCommon.hpp"
#include "Lib/ModuleRegistry.hpp"
#include "Modules.hpp"

namespace Flatten {
using namespace StdLib;

/** A scalar leaf of a document and the path leading to it */
struct FlatEntry {
    FieldPath Path;
    Json::JSON Value;
};

using FlatDocument = Vector<FlatEntry>;

/** Turns a JSON tree into the ordered list of its scalar leaves.
 *
 * Traversal is pre-order depth-first: object keys in declaration order, array elements in
 * index order. Empty objects and arrays contribute nothing. A scalar document yields one
 * entry with an empty path.
 */
class Flattener {
public:
    explicit Flattener(const SharedPtr<ModuleRegistry>& moduleRegistry)
      : mModuleRegistry(moduleRegistry), mLog(moduleRegistry->LoggerRegistry()->Logger(Module::Name::FLATTENER)) {}

    FlatDocument Flatten(const Json::JSON& document) const;

private:
    SharedPtr<ModuleRegistry> mModuleRegistry;
    SharedPtr<Log::SpdLogger> mLog;
}; // class Flattener
} // namespace Flatten
