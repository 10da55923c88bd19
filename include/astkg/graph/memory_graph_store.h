#pragma once

#include <astkg/graph/graph_store.h>
#include <astkg/graph/name_index.h>

#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace astkg::graph {

struct MemoryGraphStoreConfig {
    // Lexical match scores per kind
    double exact_score = 1.0;
    double prefix_score = 0.75;
    double wildcard_score = 0.7;
    double fuzzy_score = 0.6;        // One edit away; each extra edit subtracts fuzzy_step
    double fuzzy_step = 0.1;
    double name_word_score = 0.5;    // Term equals one word of a camelCase name
    double text_word_score = 0.3;    // Term appears in signature/summary/content
    double extra_term_bonus = 0.1;   // Per additional term matching the same node
    double role_mismatch_factor = 0.8; // Class term matched a method, or vice versa
    // Minimum term length before fuzzy matching is attempted
    size_t fuzzy_min_length = 5;
};

/**
 * In-process GraphStore.
 *
 * Owns nodes, edges, embeddings and the lexical indexes. Readers share a
 * std::shared_mutex; loading takes the exclusive lock. All query paths are
 * deterministic: ties are broken by node id.
 */
class MemoryGraphStore final : public GraphStore {
public:
    explicit MemoryGraphStore(MemoryGraphStoreConfig config = {});

    // Write side (used by loaders and tests)
    Result<void> addNode(GraphNode node);
    Result<void> addEdge(GraphEdge edge);
    Result<void> setEmbedding(const NodeId& id, Embedding embedding);

    size_t nodeCount() const;
    size_t edgeCount() const;

    // GraphStore
    Result<std::vector<search::SearchHit>> lexicalSearch(const search::ExtractedTerms& terms,
                                                         size_t limit) override;
    Result<std::vector<search::SearchHit>> vectorSearch(const Embedding& embedding,
                                                        size_t limit) override;
    Result<SubGraph> expand(const std::vector<NodeId>& seedIds, size_t maxHops, size_t cap,
                            const std::vector<std::string>& relationshipTypes) override;
    Result<bool> edgeExists(const std::string& fromName, const std::string& toName,
                            const std::string& relType) override;
    Result<std::optional<GraphNode>> getNode(const NodeId& id) override;
    Result<std::optional<Embedding>> getNodeEmbedding(const NodeId& id) override;

private:
    enum class TermRole { Class, Method, Package, Free };

    void indexNodeLocked(const GraphNode& node);
    void scoreTermLocked(const std::string& term, TermRole role,
                         std::map<NodeId, std::map<std::string, search::SearchHit>>& acc) const;
    std::set<NodeId> resolveNameLocked(const std::string& name) const;
    bool edgeAllowed(const GraphEdge& edge, const std::set<std::string>& allowed) const;
    search::SearchHit makeHit(const GraphNode& node, double score, search::SearchSignal signal,
                              search::MatchKind kind) const;

    MemoryGraphStoreConfig config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<NodeId, GraphNode> nodes_;
    std::unordered_map<NodeId, Embedding> embeddings_;
    std::vector<GraphEdge> edges_;
    std::unordered_map<NodeId, std::vector<size_t>> incident_; // node -> edge indexes
    NameIndex names_;
    std::map<std::string, std::set<NodeId>> nameWords_;
    std::map<std::string, std::set<NodeId>> textWords_;
};

} // namespace astkg::graph
