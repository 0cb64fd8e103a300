/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "FieldPath.hpp"

#include "Lib/Utils.hpp"

#include <algorithm>
#include <cctype>

namespace Flatten {
namespace {
// Longer digit runs cannot be an index of an in-memory array
constexpr size_t MAX_INDEX_DIGITS = 18;

Optional<size_t> fParseIndex(const String& digits) {
    if (digits.empty() || (digits.size() > MAX_INDEX_DIGITS)) {
        return {};
    }

    size_t index = 0;
    for (const char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return {};
        }

        index = (index * 10) + static_cast<size_t>(c - '0');
    }

    return index;
}

/** Splits "name[1][2]" into "name" and {1, 2} */
Pair<String, Vector<size_t>> fPeelIndices(String piece) {
    Vector<size_t> indices;
    while (!piece.empty() && (piece.back() == ']')) {
        const auto openPos = piece.rfind('[');
        if (openPos == String::npos) {
            break;
        }

        auto index = fParseIndex(piece.substr(openPos + 1, piece.size() - openPos - 2));
        if (!index.has_value()) {
            break;
        }

        indices.push_back(index.value());
        piece.erase(openPos);
    }

    std::reverse(indices.begin(), indices.end());
    return { piece, indices };
}
} // namespace

FieldPath FieldPath::Parse(const String& text) {
    Vector<PathSegment> segments;
    if (text.empty()) {
        return FieldPath(segments);
    }

    size_t pieceBegin = 0;
    for (;;) {
        const auto dotPos = text.find('.', pieceBegin);
        const auto piece = text.substr(pieceBegin, (dotPos == String::npos) ? String::npos : dotPos - pieceBegin);
        auto [name, indices] = fPeelIndices(piece);
        // "[0]" at the root or after a separator carries no field name
        if (!name.empty() || indices.empty()) {
            segments.push_back(PathSegment::Field(name));
        }

        for (const auto index : indices) {
            segments.push_back(PathSegment::Index(index));
        }

        if (dotPos == String::npos) {
            break;
        }

        pieceBegin = dotPos + 1;
    }

    return FieldPath(segments);
}

FieldPath FieldPath::WithField(const String& name) const {
    auto segments = mSegments;
    segments.push_back(PathSegment::Field(name));
    return FieldPath(std::move(segments));
}

FieldPath FieldPath::WithIndex(size_t index) const {
    auto segments = mSegments;
    segments.push_back(PathSegment::Index(index));
    return FieldPath(std::move(segments));
}

String FieldPath::ToString() const {
    String rendered;
    bool isFirst = true;
    for (const auto& segment : mSegments) {
        if (segment.IsIndex()) {
            rendered += "[" + std::to_string(segment.Position()) + "]";
        }
        else {
            if (!isFirst) {
                rendered += ".";
            }

            rendered += segment.Name();
        }

        isFirst = false;
    }

    return rendered;
}

String LeafIdentity(const FieldPath& path) {
    // Keys holding '.' or "[n]" are read as separators, as in the rendered path
    return LeafIdentity(path.ToString());
}

String LeafIdentity(const String& path) {
    const auto segments = FieldPath::Parse(path).Segments();
    if (segments.empty()) {
        return {};
    }

    Vector<String> fieldNames;
    for (const auto& segment : segments) {
        if (segment.IsField()) {
            fieldNames.push_back(segment.Name());
        }
    }

    if (segments.back().IsIndex()) {
        if (fieldNames.empty() || fieldNames.back().empty()) {
            return Identity::ARRAY_ITEM;
        }

        return fieldNames.back() + Identity::ITEM_SUFFIX;
    }

    const auto keep = std::min(fieldNames.size(), Identity::MAX_FIELD_SEGMENTS);
    return Utils::fJoin(Vector<String>(fieldNames.end() - keep, fieldNames.end()), ".");
}
} // namespace Flatten
