#include <astkg/config/query_config.h>

#include <spdlog/spdlog.h>

#include <functional>
#include <utility>

namespace astkg::config {

namespace {

using Setter = std::function<bool(QueryConfig&, const std::string&)>;

Setter fraction(double QueryConfig::*field, double lo = 0.0, double hi = 1.0) {
    return [=](QueryConfig& cfg, const std::string& raw) {
        auto v = parse_double(raw);
        if (!v || *v < lo || *v > hi)
            return false;
        cfg.*field = *v;
        return true;
    };
}

Setter count(size_t QueryConfig::*field, long long lo = 0) {
    return [=](QueryConfig& cfg, const std::string& raw) {
        auto v = parse_integer(raw);
        if (!v || *v < lo)
            return false;
        cfg.*field = static_cast<size_t>(*v);
        return true;
    };
}

Setter flag(bool QueryConfig::*field) {
    return [=](QueryConfig& cfg, const std::string& raw) {
        auto v = parse_bool(raw);
        if (!v)
            return false;
        cfg.*field = *v;
        return true;
    };
}

Setter millis(std::chrono::milliseconds QueryConfig::*field) {
    return [=](QueryConfig& cfg, const std::string& raw) {
        auto v = parse_ms(raw);
        if (!v || v->count() == 0)
            return false;
        cfg.*field = *v;
        return true;
    };
}

const std::vector<std::pair<std::string, Setter>>& bindings() {
    static const std::vector<std::pair<std::string, Setter>> table = {
        {"retrieval.score_threshold", fraction(&QueryConfig::score_threshold)},
        {"retrieval.initial_limit", count(&QueryConfig::initial_limit, 1)},
        {"retrieval.lexical_limit", count(&QueryConfig::lexical_limit, 1)},
        {"retrieval.vector_limit", count(&QueryConfig::vector_limit, 1)},
        {"retrieval.lexical_weight", fraction(&QueryConfig::lexical_weight, 0.0, 1e6)},
        {"retrieval.vector_weight", fraction(&QueryConfig::vector_weight, 0.0, 1e6)},
        {"retrieval.single_signal_discount", fraction(&QueryConfig::single_signal_discount, 0.01, 0.99)},
        {"retrieval.normalize_lexical", flag(&QueryConfig::normalize_lexical)},
        {"retrieval.enable_lexical", flag(&QueryConfig::enable_lexical)},
        {"retrieval.enable_vector", flag(&QueryConfig::enable_vector)},
        {"retrieval.search_timeout_ms", millis(&QueryConfig::search_timeout)},
        {"retrieval.intent_profiles", flag(&QueryConfig::intent_profiles)},
        {"expansion.depth", count(&QueryConfig::expansion_depth)},
        {"expansion.node_cap", count(&QueryConfig::expansion_node_cap)},
        {"expansion.call_timeout_ms", millis(&QueryConfig::expansion_call_timeout)},
        {"expansion.relationship_types",
         [](QueryConfig& cfg, const std::string& raw) {
             cfg.relationship_types = parse_string_list(raw);
             return true;
         }},
        {"scoring.seed_blend", fraction(&QueryConfig::seed_blend)},
        {"scoring.expansion_discount", fraction(&QueryConfig::expansion_discount, 0.01, 1.0)},
        {"scoring.expansion_ceiling", fraction(&QueryConfig::expansion_ceiling, 0.01, 0.99)},
        {"scoring.degree_weight", fraction(&QueryConfig::degree_weight)},
        {"rerank.enabled", flag(&QueryConfig::enable_reranking)},
        {"rerank.relevance_floor", fraction(&QueryConfig::relevance_floor)},
        {"rerank.final_limit", count(&QueryConfig::rerank_final_limit)},
        {"rerank.keep_unembedded", flag(&QueryConfig::keep_unembedded)},
        {"rerank.unembedded_score", fraction(&QueryConfig::unembedded_score)},
        {"pipeline.max_refinements", count(&QueryConfig::max_refinements)},
        {"pipeline.worker_threads", count(&QueryConfig::worker_threads)},
        {"pipeline.redistill_on_refine", flag(&QueryConfig::redistill_on_refine)},
        {"pipeline.claim_timeout_ms", millis(&QueryConfig::claim_timeout)},
        {"pipeline.answer_timeout_ms", millis(&QueryConfig::answer_timeout)},
        {"pipeline.embed_timeout_ms", millis(&QueryConfig::embed_timeout)},
        {"distill.max_contexts", count(&QueryConfig::distill_max_contexts, 1)},
        {"distill.timeout_ms", millis(&QueryConfig::distill_timeout)},
    };
    return table;
}

} // namespace

QueryConfig loadQueryConfig(const ConfigMap& values) {
    QueryConfig cfg;
    for (const auto& [key, setter] : bindings()) {
        auto it = values.find(key);
        if (it == values.end())
            continue;
        if (!setter(cfg, it->second)) {
            spdlog::warn("[QueryConfig] invalid value '{}' for {}; keeping default", it->second,
                         key);
        }
    }
    if (cfg.lexical_weight + cfg.vector_weight <= 0) {
        spdlog::warn("[QueryConfig] fusion weights sum to zero; using equal weights");
        cfg.lexical_weight = 0.5;
        cfg.vector_weight = 0.5;
    }
    cfg.normalizeWeights();
    return cfg;
}

QueryConfig loadQueryConfig(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("[QueryConfig] no config at '{}'; using defaults", path.string());
        return QueryConfig{};
    }
    spdlog::info("[QueryConfig] loading {}", path.string());
    return loadQueryConfig(parse_config_file(path));
}

void applyEnvironmentOverrides(QueryConfig& cfg) {
    if (const char* env = std::getenv("ASTKG_MAX_REFINEMENTS"); env && *env) {
        if (auto v = parse_integer(env); v && *v >= 0) {
            cfg.max_refinements = static_cast<size_t>(*v);
        } else {
            spdlog::warn("[QueryConfig] ignoring ASTKG_MAX_REFINEMENTS='{}'", env);
        }
    }
    if (const char* env = std::getenv("ASTKG_EXPANSION_DEPTH"); env && *env) {
        if (auto v = parse_integer(env); v && *v >= 0) {
            cfg.expansion_depth = static_cast<size_t>(*v);
        } else {
            spdlog::warn("[QueryConfig] ignoring ASTKG_EXPANSION_DEPTH='{}'", env);
        }
    }
    if (const char* env = std::getenv("ASTKG_DISABLE_VECTOR"); env && *env) {
        if (parse_bool(env).value_or(false))
            cfg.enable_vector = false;
    }
    if (const char* env = std::getenv("ASTKG_DISABLE_LEXICAL"); env && *env) {
        if (parse_bool(env).value_or(false))
            cfg.enable_lexical = false;
    }
}

} // namespace astkg::config
