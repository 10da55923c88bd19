#pragma once

#include <astkg/core/types.h>

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace astkg::graph {

// Well-known node types and property keys of the code graph
namespace node_type {
inline constexpr const char* Method = "Method";
inline constexpr const char* Class = "Class";
inline constexpr const char* Interface = "Interface";
inline constexpr const char* Enum = "Enum";
inline constexpr const char* Field = "Field";
inline constexpr const char* Package = "Package";
inline constexpr const char* Description = "Description";
} // namespace node_type

namespace prop {
inline constexpr const char* Name = "name";
inline constexpr const char* Signature = "signature";
inline constexpr const char* Summary = "summary";
inline constexpr const char* Details = "details";
inline constexpr const char* Content = "content";
inline constexpr const char* IsAbstract = "isAbstract";
inline constexpr const char* IsPublic = "isPublic";
inline constexpr const char* Tags = "tags";
} // namespace prop

struct GraphNode {
    NodeId id;
    std::string type;
    std::set<std::string> labels;
    std::map<std::string, std::string> properties;

    std::string property(const std::string& key, const std::string& fallback = {}) const {
        auto it = properties.find(key);
        return it == properties.end() ? fallback : it->second;
    }

    std::string name() const { return property(prop::Name, id); }
    std::string signature() const { return property(prop::Signature); }

    bool hasLabel(const std::string& label) const { return labels.count(label) > 0; }
    bool isMethod() const { return type == node_type::Method; }
    bool isType() const {
        return type == node_type::Class || type == node_type::Interface ||
               type == node_type::Enum;
    }
};

struct GraphEdge {
    NodeId fromId;
    NodeId toId;
    std::string type;
    std::map<std::string, std::string> properties;

    bool touches(const NodeId& id) const { return fromId == id || toId == id; }
};

/**
 * Connected fragment of the code graph.
 *
 * Nodes and edges are only reachable through accessors so that every edge's
 * endpoints are guaranteed to be members of the node set: addEdge rejects
 * dangling edges and removeNodes drops the edges it orphans.
 */
class SubGraph {
public:
    // Returns false if a node with that id was already present (first wins)
    bool addNode(GraphNode node);

    // Returns false for a duplicate (from, to, type) or a missing endpoint
    bool addEdge(GraphEdge edge);

    // Removes the nodes and every edge touching them; returns nodes removed
    size_t removeNodes(const std::set<NodeId>& ids);

    // Adds every node of `other`, then every edge whose endpoints are present
    void merge(const SubGraph& other);

    bool hasNode(const NodeId& id) const { return nodes_.count(id) > 0; }
    const GraphNode* findNode(const NodeId& id) const;

    const std::map<NodeId, GraphNode>& nodes() const noexcept { return nodes_; }
    const std::vector<GraphEdge>& edges() const noexcept { return edges_; }

    size_t nodeCount() const noexcept { return nodes_.size(); }
    size_t edgeCount() const noexcept { return edges_.size(); }
    bool empty() const noexcept { return nodes_.empty(); }

    size_t degree(const NodeId& id) const;
    std::vector<NodeId> neighbors(const NodeId& id) const;

    // Hop distance from the nearest seed, recorded by the expander
    void setHop(const NodeId& id, size_t hop, const NodeId& originSeed);
    std::optional<size_t> hopOf(const NodeId& id) const;
    std::optional<NodeId> originOf(const NodeId& id) const;

    // True when every edge endpoint is a member node
    bool isConsistent() const;

    Metadata metadata;

private:
    using EdgeKey = std::tuple<NodeId, NodeId, std::string>;

    std::map<NodeId, GraphNode> nodes_;
    std::vector<GraphEdge> edges_;
    std::set<EdgeKey> edgeKeys_;
    std::map<NodeId, std::pair<size_t, NodeId>> hops_;
};

} // namespace astkg::graph
