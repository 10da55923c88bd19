#pragma once

#include <astkg/core/types.h>
#include <astkg/search/search_types.h>

#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace astkg::graph {

// Edit distance between two strings (two-row dynamic programming)
size_t levenshteinDistance(std::string_view s1, std::string_view s2);

struct NameMatch {
    NodeId nodeId;
    std::string key; // Matched (lower-cased) name
    search::MatchKind kind = search::MatchKind::Exact;
    size_t distance = 0; // Edit distance for fuzzy matches
};

/**
 * Case-insensitive name lookup for graph nodes.
 *
 * Exact and prefix lookups use an ordered key map; fuzzy lookups walk a
 * BK-tree (Burkhard-Keller) keyed by edit distance and prune children with
 * the triangle inequality. Not synchronized: the owning store guards it.
 */
class NameIndex {
public:
    NameIndex() = default;
    NameIndex(NameIndex&&) noexcept = default;
    NameIndex& operator=(NameIndex&&) noexcept = default;

    void add(std::string_view name, const NodeId& id);
    void clear();

    std::vector<NameMatch> exact(std::string_view name) const;
    std::vector<NameMatch> prefix(std::string_view prefix, size_t limit) const;
    std::vector<NameMatch> wildcard(std::string_view pattern, size_t limit) const;
    // Matches within maxDistance edits, closest first; exact keys excluded
    std::vector<NameMatch> fuzzy(std::string_view term, size_t maxDistance, size_t limit) const;

    size_t keyCount() const noexcept { return keys_.size(); }

private:
    struct BKNode {
        std::string value;
        std::unordered_map<size_t, std::unique_ptr<BKNode>> children;

        explicit BKNode(std::string val) : value(std::move(val)) {}
    };

    void addToTree(const std::string& key);
    void searchTree(const BKNode* node, const std::string& query, size_t maxDistance,
                    std::vector<std::pair<std::string, size_t>>& out) const;
    void appendIds(const std::string& key, search::MatchKind kind, size_t distance,
                   std::vector<NameMatch>& out, size_t limit) const;

    std::map<std::string, std::set<NodeId>> keys_;
    std::unique_ptr<BKNode> root_;
};

} // namespace astkg::graph
