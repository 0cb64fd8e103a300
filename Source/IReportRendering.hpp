/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Comparator.hpp"
#include "Lib/StdLib.hpp"

namespace Report {
using namespace StdLib;
class IReportRendering {
public:
    virtual ~IReportRendering() = default;
    virtual String Render(const Comparison::ComparisonReport& report) = 0;
}; // class IReportRendering
} // namespace Report
