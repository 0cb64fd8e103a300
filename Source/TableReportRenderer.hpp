/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "IReportRendering.hpp"
#include "Lib/ModuleRegistry.hpp"
#include "Modules.hpp"
#include "ReportCommon.hpp"

namespace Report {
using namespace StdLib;

/** Grid table of all rows followed by the summary and the lists of different and matching fields */
class TableReportRenderer : public IReportRendering {
public:
    TableReportRenderer(const bool useColor, const SharedPtr<ModuleRegistry>& moduleRegistry)
      : mUseColor(useColor), mModuleRegistry(moduleRegistry), mLog(moduleRegistry->LoggerRegistry()->Logger(Module::Name::REPORT)) {}
    virtual ~TableReportRenderer() = default;

    String Render(const Comparison::ComparisonReport& report) override;

    /** RenderTable - Grid with a '=' rule under the header, cells may span several lines
     * @param styles Per row style of the last column, applied only when color is enabled
     */
    String RenderTable(const Vector<String>& headers, const Vector<Vector<String>>& rows, const Vector<fmt::text_style>& styles) const;

private:
    String RenderSummary(const Comparison::ComparisonSummary& summary) const;

    bool mUseColor;
    SharedPtr<ModuleRegistry> mModuleRegistry;
    SharedPtr<Log::SpdLogger> mLog;
}; // class TableReportRenderer
} // namespace Report
