#include <astkg/graph/graph_types.h>

#include <algorithm>

namespace astkg::graph {

bool SubGraph::addNode(GraphNode node) {
    auto id = node.id;
    return nodes_.emplace(std::move(id), std::move(node)).second;
}

bool SubGraph::addEdge(GraphEdge edge) {
    if (!hasNode(edge.fromId) || !hasNode(edge.toId))
        return false;
    if (!edgeKeys_.emplace(edge.fromId, edge.toId, edge.type).second)
        return false;
    edges_.push_back(std::move(edge));
    return true;
}

size_t SubGraph::removeNodes(const std::set<NodeId>& ids) {
    size_t removed = 0;
    for (const auto& id : ids) {
        removed += nodes_.erase(id);
        hops_.erase(id);
    }
    if (removed == 0)
        return 0;
    auto dangling = [&](const GraphEdge& e) {
        return ids.count(e.fromId) > 0 || ids.count(e.toId) > 0;
    };
    for (const auto& e : edges_) {
        if (dangling(e))
            edgeKeys_.erase(EdgeKey{e.fromId, e.toId, e.type});
    }
    edges_.erase(std::remove_if(edges_.begin(), edges_.end(), dangling), edges_.end());
    return removed;
}

void SubGraph::merge(const SubGraph& other) {
    for (const auto& [id, node] : other.nodes_)
        addNode(node);
    for (const auto& e : other.edges_)
        addEdge(e);
}

const GraphNode* SubGraph::findNode(const NodeId& id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

size_t SubGraph::degree(const NodeId& id) const {
    return static_cast<size_t>(
        std::count_if(edges_.begin(), edges_.end(), [&](const GraphEdge& e) { return e.touches(id); }));
}

std::vector<NodeId> SubGraph::neighbors(const NodeId& id) const {
    std::set<NodeId> out;
    for (const auto& e : edges_) {
        if (e.fromId == id)
            out.insert(e.toId);
        else if (e.toId == id)
            out.insert(e.fromId);
    }
    return {out.begin(), out.end()};
}

void SubGraph::setHop(const NodeId& id, size_t hop, const NodeId& originSeed) {
    auto it = hops_.find(id);
    if (it == hops_.end() || hop < it->second.first)
        hops_[id] = {hop, originSeed};
}

std::optional<size_t> SubGraph::hopOf(const NodeId& id) const {
    auto it = hops_.find(id);
    if (it == hops_.end())
        return std::nullopt;
    return it->second.first;
}

std::optional<NodeId> SubGraph::originOf(const NodeId& id) const {
    auto it = hops_.find(id);
    if (it == hops_.end())
        return std::nullopt;
    return it->second.second;
}

bool SubGraph::isConsistent() const {
    return std::all_of(edges_.begin(), edges_.end(),
                       [&](const GraphEdge& e) { return hasNode(e.fromId) && hasNode(e.toId); });
}

} // namespace astkg::graph
