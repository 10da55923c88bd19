#pragma once

#include <astkg/core/types.h>
#include <astkg/graph/graph_types.h>
#include <astkg/search/search_types.h>

#include <optional>
#include <string>
#include <vector>

namespace astkg::graph {

/**
 * Read interface over the code graph.
 *
 * Implementations must be safe for concurrent calls: the retriever issues the
 * lexical and vector queries from different worker threads, and traversal and
 * claim checks may overlap with them. Every call is read-only.
 */
class GraphStore {
public:
    virtual ~GraphStore() = default;

    // Exact/prefix/wildcard/fuzzy matching over names, signatures and text.
    // Hits are ordered by score descending, then nodeId.
    virtual Result<std::vector<search::SearchHit>>
    lexicalSearch(const search::ExtractedTerms& terms, size_t limit) = 0;

    // Cosine top-K over node embeddings
    virtual Result<std::vector<search::SearchHit>> vectorSearch(const Embedding& embedding,
                                                                size_t limit) = 0;

    // Breadth-first traversal from the seeds, up to maxHops and at most cap
    // nodes (seeds included). An empty relationshipTypes follows every edge.
    virtual Result<SubGraph> expand(const std::vector<NodeId>& seedIds, size_t maxHops, size_t cap,
                                    const std::vector<std::string>& relationshipTypes) = 0;

    // True when an edge of relType connects a node named fromName to a node
    // named toName. Names match node names or fully qualified ids.
    virtual Result<bool> edgeExists(const std::string& fromName, const std::string& toName,
                                    const std::string& relType) = 0;

    virtual Result<std::optional<GraphNode>> getNode(const NodeId& id) = 0;

    virtual Result<std::optional<Embedding>> getNodeEmbedding(const NodeId& id) = 0;
};

} // namespace astkg::graph
