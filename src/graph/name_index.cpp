#include <astkg/graph/name_index.h>

#include <astkg/common/text_utils.h>

#include <algorithm>

namespace astkg::graph {

size_t levenshteinDistance(std::string_view s1, std::string_view s2) {
    const size_t m = s1.length();
    const size_t n = s2.length();

    if (m == 0)
        return n;
    if (n == 0)
        return m;

    std::vector<size_t> prevRow(n + 1);
    std::vector<size_t> currRow(n + 1);
    for (size_t j = 0; j <= n; ++j) {
        prevRow[j] = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        currRow[0] = i;
        for (size_t j = 1; j <= n; ++j) {
            size_t cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;
            currRow[j] = std::min({
                prevRow[j] + 1,       // deletion
                currRow[j - 1] + 1,   // insertion
                prevRow[j - 1] + cost // substitution
            });
        }
        std::swap(prevRow, currRow);
    }
    return prevRow[n];
}

void NameIndex::add(std::string_view name, const NodeId& id) {
    auto key = common::to_lower(common::trim(name));
    if (key.empty())
        return;
    auto [it, inserted] = keys_.try_emplace(key);
    it->second.insert(id);
    if (inserted)
        addToTree(key);
}

void NameIndex::clear() {
    keys_.clear();
    root_.reset();
}

void NameIndex::addToTree(const std::string& key) {
    if (!root_) {
        root_ = std::make_unique<BKNode>(key);
        return;
    }
    BKNode* node = root_.get();
    for (;;) {
        const size_t dist = levenshteinDistance(node->value, key);
        if (dist == 0)
            return;
        auto it = node->children.find(dist);
        if (it == node->children.end()) {
            node->children[dist] = std::make_unique<BKNode>(key);
            return;
        }
        node = it->second.get();
    }
}

void NameIndex::searchTree(const BKNode* node, const std::string& query, size_t maxDistance,
                           std::vector<std::pair<std::string, size_t>>& out) const {
    const size_t dist = levenshteinDistance(node->value, query);
    if (dist <= maxDistance) {
        out.emplace_back(node->value, dist);
    }

    // Triangle inequality bounds the child edge distances worth visiting
    const size_t minDist = (dist > maxDistance) ? dist - maxDistance : 0;
    const size_t maxDist = dist + maxDistance;
    for (const auto& [childDist, child] : node->children) {
        if (childDist >= minDist && childDist <= maxDist) {
            searchTree(child.get(), query, maxDistance, out);
        }
    }
}

void NameIndex::appendIds(const std::string& key, search::MatchKind kind, size_t distance,
                          std::vector<NameMatch>& out, size_t limit) const {
    auto it = keys_.find(key);
    if (it == keys_.end())
        return;
    for (const auto& id : it->second) {
        if (out.size() >= limit)
            return;
        out.push_back(NameMatch{id, key, kind, distance});
    }
}

std::vector<NameMatch> NameIndex::exact(std::string_view name) const {
    std::vector<NameMatch> out;
    appendIds(common::to_lower(common::trim(name)), search::MatchKind::Exact, 0, out,
              static_cast<size_t>(-1));
    return out;
}

std::vector<NameMatch> NameIndex::prefix(std::string_view prefix, size_t limit) const {
    std::vector<NameMatch> out;
    const auto p = common::to_lower(common::trim(prefix));
    if (p.empty())
        return out;
    for (auto it = keys_.lower_bound(p); it != keys_.end() && out.size() < limit; ++it) {
        if (it->first.compare(0, p.size(), p) != 0)
            break;
        if (it->first.size() == p.size())
            continue; // exact, reported separately
        appendIds(it->first, search::MatchKind::Prefix, 0, out, limit);
    }
    return out;
}

std::vector<NameMatch> NameIndex::wildcard(std::string_view pattern, size_t limit) const {
    std::vector<NameMatch> out;
    for (const auto& [key, ids] : keys_) {
        if (out.size() >= limit)
            break;
        if (common::wildcard_match_ci(key, pattern))
            appendIds(key, search::MatchKind::Wildcard, 0, out, limit);
    }
    return out;
}

std::vector<NameMatch> NameIndex::fuzzy(std::string_view term, size_t maxDistance,
                                        size_t limit) const {
    std::vector<NameMatch> out;
    if (!root_ || maxDistance == 0)
        return out;
    const auto query = common::to_lower(common::trim(term));
    std::vector<std::pair<std::string, size_t>> keys;
    searchTree(root_.get(), query, maxDistance, keys);
    std::sort(keys.begin(), keys.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second)
            return a.second < b.second;
        return a.first < b.first;
    });
    for (const auto& [key, dist] : keys) {
        if (dist == 0)
            continue;
        if (out.size() >= limit)
            break;
        appendIds(key, search::MatchKind::Fuzzy, dist, out, limit);
    }
    return out;
}

} // namespace astkg::graph
