#pragma once

#include <astkg/config/config_helpers.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace astkg::config {

/**
 * Tunables for retrieval and the query pipeline.
 *
 * Defaults are conservative: shallow expansion (one hop) and equal lexical and
 * vector weights. Every field maps to a key in config.toml (see loadQueryConfig).
 */
struct QueryConfig {
    // [retrieval]
    double score_threshold = 0.1; // Minimum combinedScore for a seed
    size_t initial_limit = 20;    // Maximum seeds taken from the fused list
    size_t lexical_limit = 50;    // Hits requested from the lexical branch
    size_t vector_limit = 50;     // Hits requested from the vector branch
    // Fusion weights (should sum to 1.0)
    double lexical_weight = 0.5;
    double vector_weight = 0.5;
    // Applied to nodes found by one signal only; must stay below 1.0 so
    // corroborated evidence wins
    double single_signal_discount = 0.8;
    bool normalize_lexical = true;
    bool enable_lexical = true;
    bool enable_vector = true;
    std::chrono::milliseconds search_timeout{2000};
    // Let intent profiles replace the fusion weights, score threshold and
    // relationship filter above
    bool intent_profiles = false;

    // [expansion]
    size_t expansion_depth = 1;
    size_t expansion_node_cap = 50;
    std::chrono::milliseconds expansion_call_timeout{1000};
    std::vector<std::string> relationship_types; // empty = follow every edge type

    // [scoring]
    double seed_blend = 0.6;         // combinedScore share in a seed's final score
    double expansion_discount = 0.3; // Extra factor on surviving expansion-only nodes
    double expansion_ceiling = 0.9;  // Expansion scores stay below ceiling * min seed score
    double degree_weight = 0.2;      // Share of local degree in structural weight

    // [rerank]
    bool enable_reranking = true;
    double relevance_floor = 0.3;
    size_t rerank_final_limit = 0; // 0 = no cap on surviving expansion-only nodes
    bool keep_unembedded = true;
    double unembedded_score = 0.5;

    // [pipeline]
    size_t max_refinements = 3;
    size_t worker_threads = 0; // 0 = auto-detect
    bool redistill_on_refine = false;
    std::chrono::milliseconds claim_timeout{1000};
    std::chrono::milliseconds answer_timeout{60000};
    std::chrono::milliseconds embed_timeout{5000};

    // [distill]
    size_t distill_max_contexts = 20;
    std::chrono::milliseconds distill_timeout{30000};

    bool isValid() const {
        const double w_sum = lexical_weight + vector_weight;
        return lexical_weight >= 0 && vector_weight >= 0 && w_sum > 0 && score_threshold >= 0 &&
               score_threshold <= 1.0 && initial_limit > 0 && single_signal_discount > 0 &&
               single_signal_discount < 1.0 && expansion_ceiling > 0 && expansion_ceiling < 1.0 &&
               seed_blend >= 0 && seed_blend <= 1.0 && expansion_discount > 0 &&
               expansion_discount <= 1.0 && relevance_floor >= 0 && relevance_floor <= 1.0;
    }

    // Normalize fusion weights to sum to 1.0
    void normalizeWeights() {
        const double sum = lexical_weight + vector_weight;
        if (sum > 0) {
            lexical_weight /= sum;
            vector_weight /= sum;
        }
    }
};

// Build a config from parsed key/values. Unknown keys are ignored; malformed or
// out-of-range values keep the default and log a warning.
QueryConfig loadQueryConfig(const ConfigMap& values);

// Missing file -> defaults
QueryConfig loadQueryConfig(const std::filesystem::path& path);

// ASTKG_MAX_REFINEMENTS, ASTKG_EXPANSION_DEPTH, ASTKG_DISABLE_VECTOR,
// ASTKG_DISABLE_LEXICAL
void applyEnvironmentOverrides(QueryConfig& cfg);

} // namespace astkg::config
