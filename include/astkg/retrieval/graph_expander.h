#pragma once

#include <astkg/common/worker_pool.h>
#include <astkg/graph/graph_store.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace astkg::retrieval {

struct ExpansionConfig {
    size_t depth = 1;
    size_t node_cap = 50; // Seeds count toward the cap
    std::chrono::milliseconds call_timeout{1000};
    std::vector<std::string> relationship_types; // empty = all
};

/**
 * Bounded, level-synchronous breadth-first expansion from ranked seeds.
 *
 * Each hop is fetched node by node through GraphStore::expand(.., 1, ..) so
 * every store call carries its own timeout. The frontier of each level is
 * ordered by the rank of the seed it descends from, so when the cap cuts a
 * level short the nodes closest to the best seeds are the ones kept.
 *
 * A failed or timed-out call ends the traversal; what was collected so far is
 * returned with metadata["partial"] = "true".
 */
class GraphExpander {
public:
    GraphExpander(std::shared_ptr<graph::GraphStore> store,
                  std::shared_ptr<common::WorkerPool> pool);

    graph::SubGraph expand(const std::vector<NodeId>& orderedSeeds,
                           const ExpansionConfig& config) const;

private:
    Result<graph::SubGraph> fetch(const std::vector<NodeId>& ids, size_t hops, size_t cap,
                                  const ExpansionConfig& config) const;

    std::shared_ptr<graph::GraphStore> store_;
    std::shared_ptr<common::WorkerPool> pool_;
};

} // namespace astkg::retrieval
