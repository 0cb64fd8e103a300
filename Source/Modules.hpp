#pragma once

#include "Lib/StdLib.hpp"

namespace Module {
namespace Name {
    using namespace StdLib;
    const String CLI = "Cli";
    const String COMPARATOR = "Comparator";
    const String DATA_STORAGE = "DataStorage";
    const String FLATTENER = "Flattener";
    const String JSON_PARSER = "JsonParser";
    const String REPORT = "Report";
} // namespace Name
} // namespace Module
