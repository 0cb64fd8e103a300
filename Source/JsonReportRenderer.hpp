/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "IReportRendering.hpp"
#include "JsonCommon.hpp"
#include "Lib/ModuleRegistry.hpp"
#include "Modules.hpp"
#include "ReportCommon.hpp"

namespace Report {
using namespace StdLib;

/** Same content as the table report, as a JSON document for other tools to consume */
class JsonReportRenderer : public IReportRendering {
public:
    explicit JsonReportRenderer(const SharedPtr<ModuleRegistry>& moduleRegistry, const int indent = Json::DEFAULT_OUTPUT_INDENT)
      : mIndent(indent), mModuleRegistry(moduleRegistry), mLog(moduleRegistry->LoggerRegistry()->Logger(Module::Name::REPORT)) {}
    virtual ~JsonReportRenderer() = default;

    String Render(const Comparison::ComparisonReport& report) override {
        return ToJson(report).dump(mIndent);
    }

    Json::JSON ToJson(const Comparison::ComparisonReport& report) const {
        using namespace Json::ReportSchema;
        auto jRows = Json::JSON::array();
        for (const auto& row : report.Rows) {
            Json::JSON jRow;
            jRow[Field::IDENTITY] = row.Identity;
            jRow[Field::REQUEST] = row.DisplayA;
            jRow[Field::RESPONSE] = row.DisplayB;
            jRow[Field::STATUS] = OutcomeLabel(row.Status);
            jRows.push_back(std::move(jRow));
        }

        Json::JSON jSummary;
        jSummary[Field::TOTAL] = report.Summary.Total;
        jSummary[Field::MATCHES] = report.Summary.Matches;
        jSummary[Field::DIFFERENCES] = report.Summary.Differences;
        jSummary[Field::DIFFERENT_FIELDS] = report.Summary.DifferentFields;
        jSummary[Field::MATCHING_FIELDS] = report.Summary.MatchingFields;

        Json::JSON jReport;
        jReport[Field::ROWS] = std::move(jRows);
        jReport[Field::SUMMARY] = std::move(jSummary);
        mLog->debug("Rendered JSON report with {} rows", report.Rows.size());
        return jReport;
    }

private:
    int mIndent;
    SharedPtr<ModuleRegistry> mModuleRegistry;
    SharedPtr<Log::SpdLogger> mLog;
}; // class JsonReportRenderer
} // namespace Report
