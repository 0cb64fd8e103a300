/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "TableReportRenderer.hpp"

#include "Lib/Utils.hpp"

#include <algorithm>

namespace Report {
namespace {
constexpr size_t BANNER_WIDTH = 60;
constexpr size_t DIFFERENCES_RULE_WIDTH = 30;
constexpr size_t MATCHES_RULE_WIDTH = 20;

String fRule(const Vector<size_t>& widths, const char fill) {
    String rule = "+";
    for (const auto width : widths) {
        rule += String(width + 2, fill) + "+";
    }

    return rule + "\n";
}

double fPercentOf(const size_t part, const size_t total) {
    if (total == 0) {
        return 0.0;
    }

    return (static_cast<double>(part) * 100.0) / static_cast<double>(total);
}
} // namespace

String TableReportRenderer::RenderTable(const Vector<String>& headers, const Vector<Vector<String>>& rows, const Vector<fmt::text_style>& styles) const {
    const auto columns = headers.size();
    Vector<size_t> widths(columns, 0);
    auto fitCells = [&widths, columns](const Vector<String>& cells) {
        for (size_t column = 0; (column < columns) && (column < cells.size()); ++column) {
            for (const auto& line : Utils::fSplitLines(cells[column])) {
                widths[column] = std::max(widths[column], Utils::fUtf8Length(line));
            }
        }
    };

    fitCells(headers);
    for (const auto& row : rows) {
        fitCells(row);
    }

    auto renderRow = [this, &widths, columns](const Vector<String>& cells, const fmt::text_style* lastColumnStyle) {
        Vector<Vector<String>> cellLines(columns);
        size_t height = 1;
        for (size_t column = 0; column < columns; ++column) {
            cellLines[column] = Utils::fSplitLines(column < cells.size() ? cells[column] : String());
            height = std::max(height, cellLines[column].size());
        }

        OStrStream rendered;
        for (size_t lineNo = 0; lineNo < height; ++lineNo) {
            rendered << "|";
            for (size_t column = 0; column < columns; ++column) {
                const auto& lines = cellLines[column];
                auto text = Utils::fPadRight(lineNo < lines.size() ? lines[lineNo] : String(), widths[column]);
                // Escape codes are added after padding so they do not count towards the width
                if ((lastColumnStyle != nullptr) && (column + 1 == columns)) {
                    text = Colorize(text, *lastColumnStyle, mUseColor);
                }

                rendered << " " << text << " |";
            }

            rendered << "\n";
        }

        return rendered.str();
    };

    OStrStream table;
    table << fRule(widths, '-');
    table << renderRow(headers, nullptr);
    table << fRule(widths, '=');
    for (size_t i = 0; i < rows.size(); ++i) {
        table << renderRow(rows[i], i < styles.size() ? &styles[i] : nullptr);
        table << fRule(widths, '-');
    }

    // A table without rows still gets closed
    if (rows.empty()) {
        table << fRule(widths, '-');
    }

    return table.str();
}

String TableReportRenderer::Render(const Comparison::ComparisonReport& report) {
    static const Vector<String> HEADERS = { "Field Path", "Request Value", "Response Value", "Status" };

    Vector<Vector<String>> rows;
    Vector<fmt::text_style> styles;
    rows.reserve(report.Rows.size());
    styles.reserve(report.Rows.size());
    for (const auto& row : report.Rows) {
        rows.push_back({ row.Identity, row.DisplayA, row.DisplayB, OutcomeLabel(row.Status) });
        styles.push_back(OutcomeStyle(row.Status));
    }

    OStrStream rendered;
    rendered << "\n"
        << "JSON REQUEST vs RESPONSE COMPARISON REPORT\n"
        << String(BANNER_WIDTH, '=') << "\n"
        << "\n"
        << RenderTable(HEADERS, rows, styles)
        << "\n"
        << RenderSummary(report.Summary);

    mLog->debug("Rendered table report with {} rows", report.Rows.size());
    return rendered.str();
}

String TableReportRenderer::RenderSummary(const Comparison::ComparisonSummary& summary) const {
    OStrStream rendered;
    rendered << "SUMMARY:\n"
        << String(BANNER_WIDTH, '=') << "\n"
        << fmt::format("Total Fields Compared: {}\n", summary.Total)
        << fmt::format("Matching Fields: {} ({:.1f}%)\n", summary.Matches, fPercentOf(summary.Matches, summary.Total))
        << fmt::format("Different/Missing Fields: {} ({:.1f}%)\n", summary.Differences, fPercentOf(summary.Differences, summary.Total))
        << "\n";

    if (!summary.DifferentFields.empty()) {
        rendered << "\nFIELDS WITH DIFFERENCES:\n" << String(DIFFERENCES_RULE_WIDTH, '-') << "\n";
        for (const auto& field : summary.DifferentFields) {
            rendered << "* " << field << "\n";
        }
    }

    if (!summary.MatchingFields.empty()) {
        rendered << "\nMATCHING FIELDS:\n" << String(MATCHES_RULE_WIDTH, '-') << "\n";
        for (const auto& field : summary.MatchingFields) {
            rendered << "* " << field << "\n";
        }
    }

    return rendered.str();
}
} // namespace Report
