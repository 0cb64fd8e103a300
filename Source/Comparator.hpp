/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Errors.hpp"
#include "Flattener.hpp"
#include "JsonCommon.hpp"
#include "JsonDocumentParser.hpp"
#include "Lib/ModuleRegistry.hpp"
#include "Modules.hpp"

namespace Comparison {
using namespace StdLib;
using Flatten::FlatDocument;
using Flatten::FlatEntry;

enum class Outcome {
    Match,
    DifferentValues,
    MissingInA,
    MissingInB
};

static constexpr inline bool IsMatch(const Outcome outcome) { return outcome == Outcome::Match; }

/** Entries of both documents that share one leaf identity, each side in flatten order */
struct ComparisonGroup {
    String Identity;
    Vector<FlatEntry> FromA;
    Vector<FlatEntry> FromB;
};

struct ComparisonRow {
    String Identity;
    String DisplayA;
    String DisplayB;
    Outcome Status;
};

struct ComparisonSummary {
    size_t Total = 0;
    size_t Matches = 0;
    // Every row that is not a match, missing ones included
    size_t Differences = 0;
    Vector<String> DifferentFields;
    Vector<String> MatchingFields;
};

struct ComparisonReport {
    Vector<ComparisonRow> Rows;
    ComparisonSummary Summary;
};

struct ComparatorOptions {
    static constexpr size_t DEFAULT_MAX_DISPLAY_LENGTH = 50;

    size_t MaxDisplayLength = DEFAULT_MAX_DISPLAY_LENGTH;
    String MissingMarker = "MISSING";
    String Ellipsis = "...";
    String LabelA = "REQUEST";
    String LabelB = "RESPONSE";
};

/** RenderValue - Text of a scalar: strings raw, anything else as JSON ("null", "true", "1.5")
 * Text longer than maxLength code points is cut to maxLength and ellipsis is appended.
 */
String RenderValue(const Json::JSON& value, size_t maxLength, const String& ellipsis = "...");

/** GroupByIdentity - One group per identity present in either document, ordered by identity */
Vector<ComparisonGroup> GroupByIdentity(const FlatDocument& flatA, const FlatDocument& flatB);

/** Aligns the leaves of two documents by leaf identity and classifies every group.
 *
 * Nothing is kept between calls: each Classify/Compare builds and returns its own report,
 * so one instance may serve independent comparisons.
 */
class JsonComparator {
public:
    explicit JsonComparator(const SharedPtr<ModuleRegistry>& moduleRegistry, ComparatorOptions options = {})
      : mOptions(std::move(options)), mParser(moduleRegistry), mFlattener(moduleRegistry),
        mModuleRegistry(moduleRegistry), mLog(moduleRegistry->LoggerRegistry()->Logger(Module::Name::COMPARATOR)) {}

    /** Classify - Groups both flat documents by leaf identity and classifies the groups
     * @throw Errors::ComparisonError on unexpected internal failure
     */
    ComparisonReport Classify(const FlatDocument& flatA, const FlatDocument& flatB) const;

    /** Compare - Parses, flattens and classifies two JSON texts
     * @throw Errors::ParseError when either text is malformed, no report is produced then
     * @throw Errors::ComparisonError on unexpected internal failure
     */
    ComparisonReport Compare(const String& textA, const String& textB) const;

    const ComparatorOptions& Options() const { return mOptions; }

private:
    void ClassifyGroup(const ComparisonGroup& group, ComparisonReport& report) const;
    String DisplayWithSources(const Vector<FlatEntry>& entries) const;

    ComparatorOptions mOptions;
    Json::JsonDocumentParser mParser;
    Flatten::Flattener mFlattener;
    SharedPtr<ModuleRegistry> mModuleRegistry;
    SharedPtr<Log::SpdLogger> mLog;
}; // class JsonComparator
} // namespace Comparison
