#include <astkg/retrieval/graph_expander.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>

namespace astkg::retrieval {

GraphExpander::GraphExpander(std::shared_ptr<graph::GraphStore> store,
                             std::shared_ptr<common::WorkerPool> pool)
    : store_(std::move(store)), pool_(std::move(pool)) {}

Result<graph::SubGraph> GraphExpander::fetch(const std::vector<NodeId>& ids, size_t hops,
                                             size_t cap, const ExpansionConfig& config) const {
    auto fut = pool_->submit([store = store_, ids, hops, cap, rels = config.relationship_types]() {
        return store->expand(ids, hops, cap, rels);
    });
    return common::awaitResult(fut, config.call_timeout, "graph expansion");
}

graph::SubGraph GraphExpander::expand(const std::vector<NodeId>& orderedSeeds,
                                      const ExpansionConfig& config) const {
    graph::SubGraph sg;
    auto finish = [&](bool truncated, const std::string& error) {
        sg.metadata["startNodeCount"] = std::to_string(orderedSeeds.size());
        sg.metadata["expansionDepth"] = std::to_string(config.depth);
        sg.metadata["totalNodes"] = std::to_string(sg.nodeCount());
        sg.metadata["totalEdges"] = std::to_string(sg.edgeCount());
        sg.metadata["truncated"] = truncated ? "true" : "false";
        sg.metadata["partial"] = error.empty() ? "false" : "true";
        if (!error.empty())
            sg.metadata["error"] = error;
        spdlog::debug("[GraphExpander] {} seeds -> {} nodes, {} edges (depth={}, cap={}{})",
                      orderedSeeds.size(), sg.nodeCount(), sg.edgeCount(), config.depth,
                      config.node_cap, error.empty() ? "" : ", partial");
        return std::move(sg);
    };

    if (config.node_cap == 0 || orderedSeeds.empty()) {
        return finish(false, {});
    }

    std::map<NodeId, size_t> seedRank;
    std::vector<NodeId> seeds;
    for (const auto& id : orderedSeeds) {
        if (seedRank.emplace(id, seedRank.size()).second)
            seeds.push_back(id);
    }

    // Level 0: the seeds themselves, in rank order, up to the cap
    auto level0 = fetch(seeds, 0, config.node_cap, config);
    if (!level0) {
        spdlog::warn("[GraphExpander] seed lookup failed: {}", level0.error().message);
        return finish(false, level0.error().message);
    }
    std::vector<NodeId> frontier;
    for (const auto& id : seeds) {
        if (sg.nodeCount() >= config.node_cap)
            break;
        if (const auto* node = level0.value().findNode(id); node && sg.addNode(*node)) {
            sg.setHop(id, 0, id);
            frontier.push_back(id);
        }
    }
    for (const auto& e : level0.value().edges())
        sg.addEdge(e);

    bool truncated = sg.nodeCount() >= config.node_cap && frontier.size() < seeds.size();
    auto rankOf = [&](const NodeId& id) {
        auto origin = sg.originOf(id).value_or(id);
        auto it = seedRank.find(origin);
        return it == seedRank.end() ? seedRank.size() : it->second;
    };

    for (size_t hop = 1; hop <= config.depth && !frontier.empty() && !truncated; ++hop) {
        std::stable_sort(frontier.begin(), frontier.end(),
                         [&](const NodeId& a, const NodeId& b) { return rankOf(a) < rankOf(b); });
        std::vector<NodeId> next;
        for (const auto& id : frontier) {
            auto step = fetch({id}, 1, config.node_cap + 1, config);
            if (!step) {
                spdlog::warn("[GraphExpander] traversal from {} failed at hop {}: {}", id, hop,
                             step.error().message);
                return finish(truncated, step.error().message);
            }
            const NodeId origin = sg.originOf(id).value_or(id);
            for (const auto& [nid, node] : step.value().nodes()) {
                if (sg.hasNode(nid))
                    continue;
                if (sg.nodeCount() >= config.node_cap) {
                    truncated = true;
                    break;
                }
                sg.addNode(node);
                sg.setHop(nid, hop, origin);
                next.push_back(nid);
            }
            for (const auto& e : step.value().edges())
                sg.addEdge(e);
            if (truncated)
                break;
        }
        frontier = std::move(next);
    }

    // Close over edges between collected nodes that no hop call returned
    std::vector<NodeId> all;
    all.reserve(sg.nodeCount());
    for (const auto& [id, node] : sg.nodes())
        all.push_back(id);
    if (auto closure = fetch(all, 0, all.size(), config); closure) {
        for (const auto& e : closure.value().edges())
            sg.addEdge(e);
    } else {
        spdlog::debug("[GraphExpander] edge closure skipped: {}", closure.error().message);
    }
    return finish(truncated, {});
}

} // namespace astkg::retrieval
