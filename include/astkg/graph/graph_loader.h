#pragma once

#include <astkg/core/types.h>
#include <astkg/graph/memory_graph_store.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>

namespace astkg::graph {

struct LoadStats {
    size_t nodes = 0;
    size_t edges = 0;
    size_t embeddings = 0;
    size_t rejectedEdges = 0;
};

/**
 * Fill a store from a graph snapshot:
 *
 *   {"nodes": [{"id", "type", "labels": [...], "properties": {...},
 *               "embedding": [...]}],
 *    "edges": [{"from", "to", "type", "properties": {...}}]}
 *
 * Non-string property values are stored as their JSON text. Edges whose
 * endpoints are unknown are skipped with a warning; malformed nodes fail the
 * load.
 */
Result<LoadStats> loadGraphJson(const nlohmann::json& doc, MemoryGraphStore& store);

Result<std::shared_ptr<MemoryGraphStore>> loadGraphFile(const std::filesystem::path& path);

} // namespace astkg::graph
