/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "Comparator.hpp"

#include "FieldPath.hpp"
#include "Lib/Utils.hpp"

namespace Comparison {
String RenderValue(const Json::JSON& value, size_t maxLength, const String& ellipsis) {
    String text = value.is_string() ? value.get<String>() : value.dump();
    if (Utils::fUtf8Length(text) > maxLength) {
        return Utils::fUtf8Prefix(text, maxLength) + ellipsis;
    }

    return text;
}

Vector<ComparisonGroup> GroupByIdentity(const FlatDocument& flatA, const FlatDocument& flatB) {
    // std::map keeps identities in ascending byte order, which is the order rows are reported in
    Map<String, ComparisonGroup> groupByIdentity;
    for (const auto& entry : flatA) {
        auto identity = Flatten::LeafIdentity(entry.Path);
        auto& group = groupByIdentity[identity];
        group.Identity = identity;
        group.FromA.push_back(entry);
    }

    for (const auto& entry : flatB) {
        auto identity = Flatten::LeafIdentity(entry.Path);
        auto& group = groupByIdentity[identity];
        group.Identity = identity;
        group.FromB.push_back(entry);
    }

    Vector<ComparisonGroup> groups;
    groups.reserve(groupByIdentity.size());
    for (auto& [_, group] : groupByIdentity) {
        groups.push_back(std::move(group));
    }

    return groups;
}

ComparisonReport JsonComparator::Classify(const FlatDocument& flatA, const FlatDocument& flatB) const {
    try {
        ComparisonReport report;
        for (const auto& group : GroupByIdentity(flatA, flatB)) {
            ClassifyGroup(group, report);
        }

        report.Summary.Total = report.Rows.size();
        mLog->debug("Classified {} rows: {} matching, {} different or missing",
            report.Summary.Total, report.Summary.Matches, report.Summary.Differences);
        return report;
    }
    catch (const Errors::ComparatorError&) {
        throw;
    }
    catch (const Exception &ex) {
        mLog->error("Failed to classify flattened documents. Error: {}", ex.what());
        throw Errors::ComparisonError(ex.what());
    }
}

ComparisonReport JsonComparator::Compare(const String& textA, const String& textB) const {
    // A parse failure on either side ends the comparison here, before anything is classified
    const auto jDocumentA = mParser.Parse(textA, mOptions.LabelA);
    const auto jDocumentB = mParser.Parse(textB, mOptions.LabelB);

    FlatDocument flatA;
    FlatDocument flatB;
    try {
        flatA = mFlattener.Flatten(jDocumentA);
        flatB = mFlattener.Flatten(jDocumentB);
    }
    catch (const Exception &ex) {
        mLog->error("Failed to flatten documents. Error: {}", ex.what());
        throw Errors::ComparisonError(ex.what());
    }

    mLog->trace("Comparing {} {} leaves against {} {} leaves", flatA.size(), mOptions.LabelA, flatB.size(), mOptions.LabelB);
    return Classify(flatA, flatB);
}

void JsonComparator::ClassifyGroup(const ComparisonGroup& group, ComparisonReport& report) const {
    auto addRow = [&report, &group](String displayA, String displayB, Outcome outcome) {
        report.Rows.push_back(ComparisonRow { group.Identity, std::move(displayA), std::move(displayB), outcome });
        if (IsMatch(outcome)) {
            ++report.Summary.Matches;
            report.Summary.MatchingFields.push_back(group.Identity);
        }
        else {
            ++report.Summary.Differences;
            report.Summary.DifferentFields.push_back(group.Identity);
        }
    };

    if (group.FromA.empty()) {
        for (const auto& entry : group.FromB) {
            addRow(mOptions.MissingMarker, RenderValue(entry.Value, mOptions.MaxDisplayLength, mOptions.Ellipsis), Outcome::MissingInA);
        }

        return;
    }

    if (group.FromB.empty()) {
        for (const auto& entry : group.FromA) {
            addRow(RenderValue(entry.Value, mOptions.MaxDisplayLength, mOptions.Ellipsis), mOptions.MissingMarker, Outcome::MissingInB);
        }

        return;
    }

    // First occurrence on each side represents the group, the others only show up in the sources list
    const auto& representativeA = group.FromA.front().Value;
    const auto& representativeB = group.FromB.front().Value;
    const auto outcome = (representativeA == representativeB) ? Outcome::Match : Outcome::DifferentValues;
    if (!IsMatch(outcome)) {
        mLog->trace("Field '{}' differs: {} vs {}", group.Identity, representativeA.dump(), representativeB.dump());
    }

    addRow(DisplayWithSources(group.FromA), DisplayWithSources(group.FromB), outcome);
}

String JsonComparator::DisplayWithSources(const Vector<FlatEntry>& entries) const {
    auto display = RenderValue(entries.front().Value, mOptions.MaxDisplayLength, mOptions.Ellipsis);
    if (entries.size() > 1) {
        Vector<String> paths;
        paths.reserve(entries.size());
        for (const auto& entry : entries) {
            paths.push_back(entry.Path.ToString());
        }

        display += " (found in: " + Utils::fJoin(paths, ", ") + ")";
    }

    return display;
}
} // namespace Comparison
