/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Lib/StdLib.hpp"

#include <nlohmann/json.hpp>

namespace Json {
using namespace StdLib;
// Keys keep their declaration order, the flattener relies on it
using JSON = nlohmann::ordered_json;

constexpr int DEFAULT_OUTPUT_INDENT = 4;

static inline bool IsScalar(const JSON& value) {
    return !value.is_object() && !value.is_array();
}

namespace ReportSchema {
namespace Field {
    static const String ROWS = "rows";
    static const String IDENTITY = "identity";
    static const String REQUEST = "request";
    static const String RESPONSE = "response";
    static const String STATUS = "status";
    static const String SUMMARY = "summary";
    static const String TOTAL = "total";
    static const String MATCHES = "matches";
    static const String DIFFERENCES = "differences";
    static const String MATCHING_FIELDS = "matching_fields";
    static const String DIFFERENT_FIELDS = "different_fields";
} // namespace Field
} // namespace ReportSchema
} // namespace Json
