/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "Flattener.hpp"

#include <algorithm>
#include <limits>

namespace Flatten {
FlatDocument Flattener::Flatten(const Json::JSON& document) const {
    // Every member stores only its own segment linked to its parent's, the full path is
    // assembled for scalars alone
    struct PathLink {
        size_t Parent;
        PathSegment Segment;
    };

    struct PendingNode {
        const Json::JSON* Value;
        size_t Link;
    };

    static constexpr size_t NO_LINK = std::numeric_limits<size_t>::max();

    Vector<PathLink> links;
    auto buildPath = [&links](size_t link) {
        Vector<PathSegment> segments;
        for (; link != NO_LINK; link = links[link].Parent) {
            segments.push_back(links[link].Segment);
        }

        std::reverse(segments.begin(), segments.end());
        return FieldPath(std::move(segments));
    };

    FlatDocument entries;
    // Explicit stack instead of recursion, nesting depth of the input is not bounded
    Stack<PendingNode> pendingNodes;
    pendingNodes.push(PendingNode { &document, NO_LINK });
    while (!pendingNodes.empty()) {
        const auto node = pendingNodes.top();
        pendingNodes.pop();

        if (Json::IsScalar(*node.Value)) {
            entries.push_back(FlatEntry { buildPath(node.Link), *node.Value });
        }
        else if (node.Value->is_object()) {
            Vector<PendingNode> children;
            children.reserve(node.Value->size());
            for (auto memberIt = node.Value->cbegin(); memberIt != node.Value->cend(); ++memberIt) {
                links.push_back(PathLink { node.Link, PathSegment::Field(memberIt.key()) });
                children.push_back(PendingNode { &memberIt.value(), links.size() - 1 });
            }

            // Reversed so that the first key is popped first
            for (auto childIt = children.rbegin(); childIt != children.rend(); ++childIt) {
                pendingNodes.push(*childIt);
            }
        }
        else {
            for (size_t i = node.Value->size(); i > 0; --i) {
                links.push_back(PathLink { node.Link, PathSegment::Index(i - 1) });
                pendingNodes.push(PendingNode { &(*node.Value)[i - 1], links.size() - 1 });
            }
        }
    }

    mLog->trace("Flattened document into {} leaf entries", entries.size());
    return entries;
}
} // namespace Flatten
