/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Lib/StdLib.hpp"

namespace Flatten {
using namespace StdLib;

/** A single step into a JSON tree: an object key or an array index */
class PathSegment {
public:
    static PathSegment Field(String name) { return PathSegment(std::move(name)); }
    static PathSegment Index(size_t index) { return PathSegment(index); }

    bool IsField() const { return std::holds_alternative<String>(mStep); }
    bool IsIndex() const { return std::holds_alternative<size_t>(mStep); }
    const String& Name() const { return std::get<String>(mStep); }
    size_t Position() const { return std::get<size_t>(mStep); }

    bool operator==(const PathSegment& other) const { return mStep == other.mStep; }
    bool operator!=(const PathSegment& other) const { return !(*this == other); }

private:
    explicit PathSegment(String name) : mStep(std::move(name)) {}
    explicit PathSegment(size_t index) : mStep(index) {}

    Variant<String, size_t> mStep;
};

/** Ordered list of segments from the document root down to a value */
class FieldPath {
public:
    FieldPath() = default;
    explicit FieldPath(Vector<PathSegment> segments) : mSegments(std::move(segments)) {}

    /** Parse - Reads a rendered path back into segments
     * Fields are separated by '.', an index is a "[digits]" suffix. Text that does not
     * form a valid index stays part of the field name.
     */
    static FieldPath Parse(const String& text);

    FieldPath WithField(const String& name) const;
    FieldPath WithIndex(size_t index) const;

    const Vector<PathSegment>& Segments() const { return mSegments; }
    bool Empty() const { return mSegments.empty(); }
    size_t Size() const { return mSegments.size(); }

    /** ToString - Renders "a.b[0].c"; an index at the root renders as "[0]" */
    String ToString() const;

    bool operator==(const FieldPath& other) const { return mSegments == other.mSegments; }
    bool operator!=(const FieldPath& other) const { return !(*this == other); }

private:
    Vector<PathSegment> mSegments;
};

/** Grouping key used to align fields of two documents.
 *
 * A path ending with an array index maps to "<array name>_item" ("array_item" when the
 * array has no name). Any other path drops its indices and keeps at most its last two
 * field names joined with '.'.
 *
 * Identity depends on the rendered path only: a key "a.b" yields the same identity as
 * nested keys "a" and "b", a key "tags[0]" the same as element 0 of "tags".
 *
 * Two unrelated fields sharing the same parent and field name end up in one group, e.g.
 * "Customer.Address.Street" and "Supplier.Address.Street" are both "Address.Street".
 */
String LeafIdentity(const FieldPath& path);
String LeafIdentity(const String& path);

namespace Identity {
    static constexpr auto ARRAY_ITEM = "array_item";
    static constexpr auto ITEM_SUFFIX = "_item";
    static constexpr size_t MAX_FIELD_SEGMENTS = 2;
} // namespace Identity
} // namespace Flatten
