/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "JsonReportRenderer.hpp"
#include "ReportCommon.hpp"
#include "TableReportRenderer.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <unistd.h>

using namespace Report;
using Comparison::Outcome;
using ::testing::HasSubstr;
using ::testing::Not;

namespace {
const String ESCAPE = "\x1b[";

Comparison::ComparisonReport fCompare(const String& request, const String& response) {
    Comparison::JsonComparator comparator(std::make_shared<ModuleRegistry>());
    return comparator.Compare(request, response);
}

Vector<String> fLines(const String& text) {
    Vector<String> lines;
    std::istringstream input(text);
    String line;
    while (std::getline(input, line)) {
        lines.push_back(line);
    }

    return lines;
}
} // namespace

TEST(OutcomeLabel, NamesEveryOutcome) {
    EXPECT_EQ(OutcomeLabel(Outcome::Match), "MATCH");
    EXPECT_EQ(OutcomeLabel(Outcome::DifferentValues), "DIFFERENT VALUES");
    EXPECT_EQ(OutcomeLabel(Outcome::MissingInA), "MISSING IN REQUEST");
    EXPECT_EQ(OutcomeLabel(Outcome::MissingInB), "MISSING IN RESPONSE");
}

TEST(Colorize, LeavesTextAloneWithoutColor) {
    EXPECT_EQ(Colorize("MATCH", OutcomeStyle(Outcome::Match), false), "MATCH");
    auto colored = Colorize("MATCH", OutcomeStyle(Outcome::Match), true);
    EXPECT_THAT(colored, HasSubstr(ESCAPE));
    EXPECT_THAT(colored, HasSubstr("MATCH"));
}

TEST(UseColorFor, RequiresEnabledColorAndTerminal) {
    int pipeEnds[2];
    ASSERT_EQ(::pipe(pipeEnds), 0);
    EXPECT_FALSE(UseColorFor(true, pipeEnds[1]));
    EXPECT_FALSE(UseColorFor(false, pipeEnds[1]));
    EXPECT_EQ(UseColorFor(true, STDERR_FILENO), ::isatty(STDERR_FILENO) != 0);
    EXPECT_FALSE(UseColorFor(false, STDERR_FILENO));
    ::close(pipeEnds[0]);
    ::close(pipeEnds[1]);
}

class TableReportRendererTest : public ::testing::Test {
protected:
    SharedPtr<ModuleRegistry> mModuleRegistry = std::make_shared<ModuleRegistry>();
};

TEST_F(TableReportRendererTest, RendersRowsAndSummary) {
    auto report = fCompare(R"({"a": 1, "b": "x", "c": true})", R"({"a": 1, "b": "y", "d": null})");
    TableReportRenderer renderer(false, mModuleRegistry);
    auto rendered = renderer.Render(report);

    EXPECT_THAT(rendered, HasSubstr("JSON REQUEST vs RESPONSE COMPARISON REPORT"));
    EXPECT_THAT(rendered, HasSubstr("| Field Path | Request Value | Response Value | Status"));
    EXPECT_THAT(rendered, HasSubstr("MATCH"));
    EXPECT_THAT(rendered, HasSubstr("DIFFERENT VALUES"));
    EXPECT_THAT(rendered, HasSubstr("MISSING IN RESPONSE"));
    EXPECT_THAT(rendered, HasSubstr("MISSING IN REQUEST"));
    EXPECT_THAT(rendered, HasSubstr("Total Fields Compared: 4"));
    EXPECT_THAT(rendered, HasSubstr("Matching Fields: 1 (25.0%)"));
    EXPECT_THAT(rendered, HasSubstr("Different/Missing Fields: 3 (75.0%)"));
    EXPECT_THAT(rendered, HasSubstr("FIELDS WITH DIFFERENCES:\n------------------------------\n* b\n* c\n* d\n"));
    EXPECT_THAT(rendered, HasSubstr("MATCHING FIELDS:\n--------------------\n* a\n"));
    EXPECT_THAT(rendered, Not(HasSubstr(ESCAPE)));
}

TEST_F(TableReportRendererTest, GridLinesShareOneWidth) {
    TableReportRenderer renderer(false, mModuleRegistry);
    auto table = renderer.RenderTable({ "Field Path", "Request Value", "Response Value", "Status" },
        { { "short", "1", "2", "DIFFERENT VALUES" }, { "a_much_longer_field_name", "some longer value", "MISSING", "MISSING IN RESPONSE" } }, {});

    auto lines = fLines(table);
    ASSERT_EQ(lines.size(), 7u);
    for (const auto& line : lines) {
        EXPECT_EQ(line.size(), lines.front().size()) << line;
    }

    EXPECT_EQ(lines[0].front(), '+');
    EXPECT_THAT(lines[2], HasSubstr("+====="));
    EXPECT_THAT(lines[3], HasSubstr("| short                    | 1 "));
}

TEST_F(TableReportRendererTest, MultiLineValuesKeepAlignment) {
    TableReportRenderer renderer(false, mModuleRegistry);
    auto table = renderer.RenderTable({ "A", "B" }, { { "first\nsecond line", "x" } }, {});
    auto lines = fLines(table);
    ASSERT_EQ(lines.size(), 6u);
    EXPECT_EQ(lines[3], "| first       | x |");
    EXPECT_EQ(lines[4], "| second line |   |");
}

TEST_F(TableReportRendererTest, ColorsOnlyTheStatusColumn) {
    auto report = fCompare(R"({"a": 1})", R"({"a": 2})");
    TableReportRenderer renderer(true, mModuleRegistry);
    auto rendered = renderer.Render(report);
    EXPECT_THAT(rendered, HasSubstr(ESCAPE));
    EXPECT_THAT(rendered, HasSubstr("| a          | 1             | 2              | " + ESCAPE));
}

TEST_F(TableReportRendererTest, EmptyReportHasZeroPercentages) {
    TableReportRenderer renderer(false, mModuleRegistry);
    auto rendered = renderer.Render(Comparison::ComparisonReport {});
    EXPECT_THAT(rendered, HasSubstr("Total Fields Compared: 0"));
    EXPECT_THAT(rendered, HasSubstr("Matching Fields: 0 (0.0%)"));
    EXPECT_THAT(rendered, Not(HasSubstr("FIELDS WITH DIFFERENCES")));
    EXPECT_THAT(rendered, Not(HasSubstr("MATCHING FIELDS:")));
}

TEST(JsonReportRenderer, CarriesRowsAndSummary) {
    auto report = fCompare(R"({"a": 1, "tags": ["x"]})", R"({"a": "1"})");
    JsonReportRenderer renderer(std::make_shared<ModuleRegistry>());
    auto jReport = Json::JSON::parse(renderer.Render(report));

    ASSERT_EQ(jReport["rows"].size(), 2u);
    EXPECT_EQ(jReport["rows"][0]["identity"], "a");
    EXPECT_EQ(jReport["rows"][0]["request"], "1");
    EXPECT_EQ(jReport["rows"][0]["response"], "1");
    EXPECT_EQ(jReport["rows"][0]["status"], "DIFFERENT VALUES");
    EXPECT_EQ(jReport["rows"][1]["identity"], "tags_item");
    EXPECT_EQ(jReport["rows"][1]["response"], "MISSING");
    EXPECT_EQ(jReport["rows"][1]["status"], "MISSING IN RESPONSE");
    EXPECT_EQ(jReport["summary"]["total"], 2);
    EXPECT_EQ(jReport["summary"]["matches"], 0);
    EXPECT_EQ(jReport["summary"]["differences"], 2);
    EXPECT_EQ(jReport["summary"]["different_fields"], Json::JSON::array({ "a", "tags_item" }));
    EXPECT_TRUE(jReport["summary"]["matching_fields"].empty());
}

TEST(FormatParseError, ShowsLocationLineAndPointer) {
    Errors::ParseError error("REQUEST", 4, 3, "  \"age\": 28", "syntax error while parsing object");
    auto diagnostic = FormatParseError(error, false);
    EXPECT_THAT(diagnostic, HasSubstr("REQUEST PARSING ERROR:"));
    EXPECT_THAT(diagnostic, HasSubstr("Line 4, Column 3: syntax error while parsing object"));
    EXPECT_THAT(diagnostic, HasSubstr("  4 |   \"age\": 28\n"));
    EXPECT_THAT(diagnostic, HasSubstr("    |   ^\n"));
    EXPECT_THAT(diagnostic, Not(HasSubstr(ESCAPE)));
    EXPECT_THAT(FormatParseError(error, true), HasSubstr(ESCAPE));
}
