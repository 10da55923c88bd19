#include <astkg/graph/graph_loader.h>

#include <spdlog/spdlog.h>

#include <fstream>

namespace astkg::graph {

namespace {

std::map<std::string, std::string> readProperties(const nlohmann::json& j) {
    std::map<std::string, std::string> props;
    if (!j.is_object())
        return props;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_string())
            props[it.key()] = it.value().get<std::string>();
        else if (!it.value().is_null())
            props[it.key()] = it.value().dump();
    }
    return props;
}

} // namespace

Result<LoadStats> loadGraphJson(const nlohmann::json& doc, MemoryGraphStore& store) {
    if (!doc.is_object() || !doc.contains("nodes") || !doc["nodes"].is_array()) {
        return Error{ErrorCode::InvalidData, "graph snapshot must contain a 'nodes' array"};
    }

    LoadStats stats;
    for (const auto& jn : doc["nodes"]) {
        if (!jn.is_object() || !jn.contains("id") || !jn["id"].is_string()) {
            return Error{ErrorCode::InvalidData, "node without string 'id': " + jn.dump()};
        }
        GraphNode node;
        node.id = jn["id"].get<std::string>();
        node.type = jn.value("type", std::string{});
        if (auto it = jn.find("labels"); it != jn.end() && it->is_array()) {
            for (const auto& l : *it) {
                if (l.is_string())
                    node.labels.insert(l.get<std::string>());
            }
        }
        if (!node.type.empty())
            node.labels.insert(node.type);
        if (auto it = jn.find("properties"); it != jn.end())
            node.properties = readProperties(*it);

        const auto id = node.id;
        if (auto r = store.addNode(std::move(node)); !r) {
            return r.error();
        }
        ++stats.nodes;

        if (auto it = jn.find("embedding"); it != jn.end() && it->is_array() && !it->empty()) {
            Embedding emb;
            emb.reserve(it->size());
            for (const auto& v : *it) {
                if (!v.is_number()) {
                    return Error{ErrorCode::InvalidData, "non-numeric embedding for " + id};
                }
                emb.push_back(v.get<float>());
            }
            if (auto r = store.setEmbedding(id, std::move(emb)); !r) {
                return r.error();
            }
            ++stats.embeddings;
        }
    }

    if (auto it = doc.find("edges"); it != doc.end() && it->is_array()) {
        for (const auto& je : *it) {
            GraphEdge edge;
            edge.fromId = je.value("from", std::string{});
            edge.toId = je.value("to", std::string{});
            edge.type = je.value("type", std::string{});
            if (auto p = je.find("properties"); p != je.end())
                edge.properties = readProperties(*p);
            if (auto r = store.addEdge(std::move(edge)); !r) {
                spdlog::warn("[GraphLoader] skipping edge: {}", r.error().message);
                ++stats.rejectedEdges;
                continue;
            }
            ++stats.edges;
        }
    }
    return stats;
}

Result<std::shared_ptr<MemoryGraphStore>> loadGraphFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::NotFound, "cannot open graph file: " + path.string()};
    }
    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        return Error{ErrorCode::ParseError, "invalid JSON in " + path.string()};
    }
    auto store = std::make_shared<MemoryGraphStore>();
    auto stats = loadGraphJson(doc, *store);
    if (!stats) {
        return stats.error();
    }
    const auto& s = stats.value();
    spdlog::info("[GraphLoader] loaded {} nodes, {} edges, {} embeddings from {} ({} edges rejected)",
                 s.nodes, s.edges, s.embeddings, path.string(), s.rejectedEdges);
    return store;
}

} // namespace astkg::graph
