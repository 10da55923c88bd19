#include <astkg/graph/memory_graph_store.h>

#include <astkg/common/text_utils.h>
#include <astkg/common/vector_math.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace astkg::graph {

using search::MatchKind;
using search::SearchHit;
using search::SearchSignal;

namespace {

void addWords(std::map<std::string, std::set<NodeId>>& index, const std::string& text,
              const NodeId& id) {
    for (auto& w : common::split_identifier(text)) {
        if (w.size() > 1)
            index[w].insert(id);
    }
}

bool sortHits(const SearchHit& a, const SearchHit& b) {
    if (a.score != b.score)
        return a.score > b.score;
    return a.nodeId < b.nodeId;
}

} // namespace

MemoryGraphStore::MemoryGraphStore(MemoryGraphStoreConfig config) : config_(config) {}

Result<void> MemoryGraphStore::addNode(GraphNode node) {
    if (node.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "node id must not be empty"};
    }
    std::unique_lock lock(mutex_);
    if (nodes_.count(node.id)) {
        return Error{ErrorCode::InvalidArgument, "duplicate node id: " + node.id};
    }
    indexNodeLocked(node);
    auto id = node.id;
    nodes_.emplace(std::move(id), std::move(node));
    return {};
}

Result<void> MemoryGraphStore::addEdge(GraphEdge edge) {
    std::unique_lock lock(mutex_);
    if (!nodes_.count(edge.fromId) || !nodes_.count(edge.toId)) {
        return Error{ErrorCode::NotFound,
                     "edge endpoint missing: " + edge.fromId + " -> " + edge.toId};
    }
    if (edge.type.empty()) {
        return Error{ErrorCode::InvalidArgument, "edge type must not be empty"};
    }
    const size_t idx = edges_.size();
    incident_[edge.fromId].push_back(idx);
    if (edge.toId != edge.fromId)
        incident_[edge.toId].push_back(idx);
    edges_.push_back(std::move(edge));
    return {};
}

Result<void> MemoryGraphStore::setEmbedding(const NodeId& id, Embedding embedding) {
    std::unique_lock lock(mutex_);
    if (!nodes_.count(id)) {
        return Error{ErrorCode::NotFound, "unknown node: " + id};
    }
    if (embedding.empty()) {
        embeddings_.erase(id);
        return {};
    }
    embeddings_[id] = std::move(embedding);
    return {};
}

size_t MemoryGraphStore::nodeCount() const {
    std::shared_lock lock(mutex_);
    return nodes_.size();
}

size_t MemoryGraphStore::edgeCount() const {
    std::shared_lock lock(mutex_);
    return edges_.size();
}

void MemoryGraphStore::indexNodeLocked(const GraphNode& node) {
    const auto name = node.name();
    names_.add(name, node.id);
    if (node.id != name)
        names_.add(node.id, node.id);
    addWords(nameWords_, name, node.id);
    for (const char* key : {prop::Signature, prop::Summary, prop::Details, prop::Content}) {
        auto it = node.properties.find(key);
        if (it != node.properties.end())
            addWords(textWords_, it->second, node.id);
    }
}

SearchHit MemoryGraphStore::makeHit(const GraphNode& node, double score, SearchSignal signal,
                                    MatchKind kind) const {
    SearchHit hit;
    hit.nodeId = node.id;
    hit.score = score;
    hit.signal = signal;
    hit.matchKind = kind;
    hit.name = node.name();
    hit.signature = node.signature();
    hit.nodeType = node.type;
    return hit;
}

void MemoryGraphStore::scoreTermLocked(
    const std::string& rawTerm, TermRole role,
    std::map<NodeId, std::map<std::string, SearchHit>>& acc) const {
    const auto term = common::to_lower(common::trim(rawTerm));
    if (term.empty())
        return;

    auto record = [&](const NodeId& id, double score, MatchKind kind) {
        auto nit = nodes_.find(id);
        if (nit == nodes_.end())
            return;
        const auto& node = nit->second;
        if ((role == TermRole::Class && !node.isType()) ||
            (role == TermRole::Method && !node.isMethod()) ||
            (role == TermRole::Package && node.type != node_type::Package)) {
            score *= config_.role_mismatch_factor;
        }
        auto& best = acc[id][term];
        if (best.nodeId.empty() || score > best.score)
            best = makeHit(node, score, SearchSignal::Lexical, kind);
    };

    const size_t unbounded = nodes_.size();
    if (common::has_wildcards(term)) {
        for (const auto& m : names_.wildcard(term, unbounded))
            record(m.nodeId, config_.wildcard_score, MatchKind::Wildcard);
        return;
    }

    for (const auto& m : names_.exact(term))
        record(m.nodeId, config_.exact_score, MatchKind::Exact);
    for (const auto& m : names_.prefix(term, unbounded))
        record(m.nodeId, config_.prefix_score, MatchKind::Prefix);
    if (term.size() >= config_.fuzzy_min_length) {
        const size_t maxEdits = term.size() >= 8 ? 2 : 1;
        for (const auto& m : names_.fuzzy(term, maxEdits, unbounded)) {
            const double score =
                config_.fuzzy_score - config_.fuzzy_step * static_cast<double>(m.distance - 1);
            record(m.nodeId, score, MatchKind::Fuzzy);
        }
    }
    if (auto it = nameWords_.find(term); it != nameWords_.end()) {
        for (const auto& id : it->second)
            record(id, config_.name_word_score, MatchKind::Exact);
    }
    if (auto it = textWords_.find(term); it != textWords_.end()) {
        for (const auto& id : it->second)
            record(id, config_.text_word_score, MatchKind::Exact);
    }
}

Result<std::vector<SearchHit>> MemoryGraphStore::lexicalSearch(const search::ExtractedTerms& terms,
                                                               size_t limit) {
    std::vector<SearchHit> hits;
    if (terms.empty() || limit == 0)
        return hits;

    std::shared_lock lock(mutex_);
    std::map<NodeId, std::map<std::string, SearchHit>> acc;
    for (const auto& t : terms.classNames)
        scoreTermLocked(t, TermRole::Class, acc);
    for (const auto& t : terms.methodNames)
        scoreTermLocked(t, TermRole::Method, acc);
    for (const auto& t : terms.packageNames)
        scoreTermLocked(t, TermRole::Package, acc);
    for (const auto& t : terms.freeTerms)
        scoreTermLocked(t, TermRole::Free, acc);

    hits.reserve(acc.size());
    for (auto& [id, perTerm] : acc) {
        const SearchHit* best = nullptr;
        for (const auto& [term, hit] : perTerm) {
            if (!best || hit.score > best->score)
                best = &hit;
        }
        SearchHit merged = *best;
        merged.score = std::min(
            1.0, best->score + config_.extra_term_bonus * static_cast<double>(perTerm.size() - 1));
        hits.push_back(std::move(merged));
    }
    std::sort(hits.begin(), hits.end(), sortHits);
    if (hits.size() > limit)
        hits.resize(limit);
    spdlog::debug("[MemoryGraphStore] lexical search: {} terms -> {} hits", terms.allTerms().size(),
                  hits.size());
    return hits;
}

Result<std::vector<SearchHit>> MemoryGraphStore::vectorSearch(const Embedding& embedding,
                                                              size_t limit) {
    if (embedding.empty()) {
        return Error{ErrorCode::InvalidArgument, "query embedding is empty"};
    }
    std::vector<SearchHit> hits;
    if (limit == 0)
        return hits;

    std::shared_lock lock(mutex_);
    size_t mismatched = 0;
    for (const auto& [id, vec] : embeddings_) {
        if (vec.size() != embedding.size()) {
            ++mismatched;
            continue;
        }
        const double score = common::clamp01(common::cosineSimilarity(embedding, vec));
        if (score <= 0.0)
            continue;
        hits.push_back(makeHit(nodes_.at(id), score, SearchSignal::Vector, MatchKind::Semantic));
    }
    if (mismatched > 0) {
        spdlog::warn("[MemoryGraphStore] skipped {} embeddings with dimension != {}", mismatched,
                     embedding.size());
    }
    std::sort(hits.begin(), hits.end(), sortHits);
    if (hits.size() > limit)
        hits.resize(limit);
    return hits;
}

bool MemoryGraphStore::edgeAllowed(const GraphEdge& edge,
                                   const std::set<std::string>& allowed) const {
    return allowed.empty() || allowed.count(common::to_lower(edge.type)) > 0;
}

Result<SubGraph> MemoryGraphStore::expand(const std::vector<NodeId>& seedIds, size_t maxHops,
                                          size_t cap,
                                          const std::vector<std::string>& relationshipTypes) {
    SubGraph sg;
    if (cap == 0 || seedIds.empty())
        return sg;

    std::set<std::string> allowed;
    for (const auto& t : relationshipTypes)
        allowed.insert(common::to_lower(t));

    std::shared_lock lock(mutex_);
    bool capped = false;
    std::vector<NodeId> frontier;
    for (const auto& seed : seedIds) {
        auto it = nodes_.find(seed);
        if (it == nodes_.end())
            continue;
        if (sg.addNode(it->second)) {
            sg.setHop(seed, 0, seed);
            frontier.push_back(seed);
        }
        if (sg.nodeCount() >= cap) {
            capped = true;
            break;
        }
    }

    for (size_t hop = 1; hop <= maxHops && !frontier.empty() && !capped; ++hop) {
        std::vector<NodeId> next;
        for (const auto& id : frontier) {
            auto inc = incident_.find(id);
            if (inc == incident_.end())
                continue;
            std::set<NodeId> neighbors;
            for (size_t idx : inc->second) {
                const auto& e = edges_[idx];
                if (edgeAllowed(e, allowed))
                    neighbors.insert(e.fromId == id ? e.toId : e.fromId);
            }
            const NodeId origin = sg.originOf(id).value_or(id);
            for (const auto& nb : neighbors) {
                if (sg.hasNode(nb))
                    continue;
                sg.addNode(nodes_.at(nb));
                sg.setHop(nb, hop, origin);
                next.push_back(nb);
                if (sg.nodeCount() >= cap) {
                    capped = true;
                    break;
                }
            }
            if (capped)
                break;
        }
        frontier = std::move(next);
    }

    std::set<size_t> edgeIdx;
    for (const auto& [id, node] : sg.nodes()) {
        auto inc = incident_.find(id);
        if (inc == incident_.end())
            continue;
        for (size_t idx : inc->second) {
            const auto& e = edges_[idx];
            if (edgeAllowed(e, allowed) && sg.hasNode(e.fromId) && sg.hasNode(e.toId))
                edgeIdx.insert(idx);
        }
    }
    for (size_t idx : edgeIdx)
        sg.addEdge(edges_[idx]);

    sg.metadata["truncated"] = capped ? "true" : "false";
    return sg;
}

std::set<NodeId> MemoryGraphStore::resolveNameLocked(const std::string& name) const {
    std::set<NodeId> ids;
    const auto trimmed = std::string(common::trim(name));
    if (trimmed.empty())
        return ids;
    if (nodes_.count(trimmed))
        ids.insert(trimmed);
    for (const auto& m : names_.exact(trimmed))
        ids.insert(m.nodeId);

    // Qualified member reference: "AuthService.login" or "AuthService#login"
    const auto sep = trimmed.find_last_of(".#");
    if (ids.empty() && sep != std::string::npos && sep + 1 < trimmed.size()) {
        const auto owner = common::to_lower(trimmed.substr(0, sep));
        for (const auto& m : names_.exact(trimmed.substr(sep + 1))) {
            if (common::to_lower(m.nodeId).find(owner) != std::string::npos)
                ids.insert(m.nodeId);
        }
    }
    return ids;
}

Result<bool> MemoryGraphStore::edgeExists(const std::string& fromName, const std::string& toName,
                                          const std::string& relType) {
    if (relType.empty()) {
        return Error{ErrorCode::InvalidArgument, "relationship type must not be empty"};
    }
    const auto wanted = common::to_lower(relType);

    std::shared_lock lock(mutex_);
    const auto from = resolveNameLocked(fromName);
    if (from.empty())
        return false;
    const auto to = resolveNameLocked(toName);
    if (to.empty())
        return false;

    for (const auto& id : from) {
        auto inc = incident_.find(id);
        if (inc == incident_.end())
            continue;
        for (size_t idx : inc->second) {
            const auto& e = edges_[idx];
            if (e.fromId == id && to.count(e.toId) && common::to_lower(e.type) == wanted)
                return true;
        }
    }
    return false;
}

Result<std::optional<GraphNode>> MemoryGraphStore::getNode(const NodeId& id) {
    std::shared_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end())
        return std::optional<GraphNode>{};
    return std::optional<GraphNode>{it->second};
}

Result<std::optional<Embedding>> MemoryGraphStore::getNodeEmbedding(const NodeId& id) {
    std::shared_lock lock(mutex_);
    auto it = embeddings_.find(id);
    if (it == embeddings_.end())
        return std::optional<Embedding>{};
    return std::optional<Embedding>{it->second};
}

} // namespace astkg::graph
