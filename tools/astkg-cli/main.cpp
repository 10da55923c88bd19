#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <astkg/common/worker_pool.h>
#include <astkg/config/query_config.h>
#include <astkg/graph/graph_loader.h>
#include <astkg/llm/command_adapters.h>
#include <astkg/llm/heuristic_entity_extractor.h>
#include <astkg/query/query_orchestrator.h>
#include <astkg/retrieval/hybrid_retriever.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

struct CommonOptions {
    std::string graphPath;
    std::string query;
    std::string embedCmd;
    std::string configPath;
    bool json = false;
};

void setupLogging(const std::string& level, const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!logFile.empty()) {
        sinks.push_back(
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFile, 10 * 1024 * 1024, 3));
    }
    auto logger = std::make_shared<spdlog::logger>("astkg", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (level == "trace")
        spdlog::set_level(spdlog::level::trace);
    else if (level == "debug")
        spdlog::set_level(spdlog::level::debug);
    else if (level == "info")
        spdlog::set_level(spdlog::level::info);
    else if (level == "warn")
        spdlog::set_level(spdlog::level::warn);
    else if (level == "error")
        spdlog::set_level(spdlog::level::err);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
}

astkg::config::QueryConfig loadConfig(const std::string& overridePath) {
    auto path = astkg::config::get_config_path(overridePath);
    auto cfg = astkg::config::loadQueryConfig(path);
    astkg::config::applyEnvironmentOverrides(cfg);
    return cfg;
}

std::shared_ptr<astkg::llm::EmbeddingModel>
makeEmbedder(const std::string& cmd, const astkg::config::QueryConfig& cfg) {
    if (cmd.empty())
        return nullptr;
    return std::make_shared<astkg::llm::CommandEmbeddingModel>(cmd, cfg.embed_timeout);
}

int runRetrieve(const CommonOptions& opts) {
    auto store = astkg::graph::loadGraphFile(opts.graphPath);
    if (!store) {
        spdlog::error("Failed to load graph: {}", store.error().message);
        return 1;
    }
    auto cfg = loadConfig(opts.configPath);
    auto pool = std::make_shared<astkg::common::WorkerPool>(cfg.worker_threads);
    astkg::retrieval::HybridRetriever retriever(store.value(), pool, cfg);

    astkg::llm::HeuristicEntityExtractor extractor;
    auto terms = extractor.extract(opts.query);
    if (!terms) {
        spdlog::error("Entity extraction failed: {}", terms.error().message);
        return 1;
    }

    astkg::Embedding embedding;
    if (auto embedder = makeEmbedder(opts.embedCmd, cfg)) {
        auto emb = embedder->embed(opts.query);
        if (emb) {
            embedding = std::move(emb).value();
        } else {
            spdlog::warn("Embedding failed: {}; lexical search only", emb.error().message);
        }
    }

    auto result = retriever.retrieve(terms.value(), embedding);

    if (opts.json) {
        nlohmann::json out;
        out["query"] = opts.query;
        out["seeds"] = nlohmann::json::array();
        for (const auto& s : result.seeds) {
            out["seeds"].push_back({{"nodeId", s.nodeId},
                                    {"name", s.name},
                                    {"type", s.nodeType},
                                    {"lexicalScore", s.lexicalScore},
                                    {"vectorScore", s.vectorScore},
                                    {"combinedScore", s.combinedScore},
                                    {"score", result.scoreOf(s.nodeId)}});
        }
        out["nodes"] = nlohmann::json::array();
        for (const auto& [id, node] : result.subGraph.nodes()) {
            out["nodes"].push_back(
                {{"id", id}, {"type", node.type}, {"name", node.name()}, {"score", result.scoreOf(id)}});
        }
        out["edges"] = nlohmann::json::array();
        for (const auto& e : result.subGraph.edges()) {
            out["edges"].push_back({{"from", e.fromId}, {"to", e.toId}, {"type", e.type}});
        }
        out["metadata"] = result.metadata;
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    std::cout << "Seeds (" << result.seeds.size() << "):\n";
    for (const auto& s : result.seeds) {
        std::cout << fmt::format("  {:.4f}  {:<10} {}\n", result.scoreOf(s.nodeId), s.nodeType,
                                 s.nodeId);
    }
    std::cout << fmt::format("Subgraph: {} nodes, {} edges\n", result.subGraph.nodeCount(),
                             result.subGraph.edgeCount());
    for (const auto& [k, v] : result.metadata) {
        std::cout << "  " << k << ": " << v << "\n";
    }
    return 0;
}

int runAsk(const CommonOptions& opts, const std::string& answerCmd) {
    auto store = astkg::graph::loadGraphFile(opts.graphPath);
    if (!store) {
        spdlog::error("Failed to load graph: {}", store.error().message);
        return 1;
    }
    auto cfg = loadConfig(opts.configPath);

    astkg::query::QueryServices services;
    services.extractor = std::make_shared<astkg::llm::HeuristicEntityExtractor>();
    services.embedder = makeEmbedder(opts.embedCmd, cfg);
    services.answerer = std::make_shared<astkg::llm::CommandAnswerer>(answerCmd, cfg.answer_timeout);
    services.distillAnswerer =
        std::make_shared<astkg::llm::CommandAnswerer>(answerCmd, cfg.distill_timeout);

    astkg::query::QueryOrchestrator orchestrator(store.value(), std::move(services), cfg);
    auto result = orchestrator.query(opts.query);

    if (opts.json) {
        nlohmann::json out = result;
        std::cout << out.dump(2) << std::endl;
    } else {
        std::cout << result.summary << "\n\n";
        for (const auto& c : result.components) {
            std::cout << fmt::format("  [{}] {} ({:.2f})\n", c.type, c.name, c.relevanceScore);
        }
        for (const auto& claim : result.claims) {
            std::cout << fmt::format("  {} -{}-> {} {}\n", claim.fromComponent,
                                     claim.relationshipType, claim.toComponent,
                                     claim.verified ? "[verified]" : "[unverified]");
        }
        std::cout << fmt::format("\nconfidence {:.2f}, verified {}, refinements {}\n",
                                 result.confidence, result.verified,
                                 result.metadata["refinementCount"]);
    }
    return result.error ? 2 : 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"astkg - question answering over a code knowledge graph"};
    app.require_subcommand(1);

    std::string logLevel = "warn";
    std::string logFile;
    app.add_option("-l,--log-level", logLevel, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}))
        ->default_val("warn");
    app.add_option("--log-file", logFile, "Log file path (optional)");

    CommonOptions opts;
    auto addCommon = [&opts](CLI::App* sub) {
        sub->add_option("-g,--graph", opts.graphPath, "Graph snapshot (JSON)")
            ->required()
            ->check(CLI::ExistingFile);
        sub->add_option("-q,--query", opts.query, "Question to answer")->required();
        sub->add_option("--embed-cmd", opts.embedCmd,
                        "Command that reads text on stdin and prints a JSON float array");
        sub->add_option("-c,--config", opts.configPath, "Path to config.toml");
        sub->add_flag("--json", opts.json, "Print JSON output");
    };

    auto* retrieve = app.add_subcommand("retrieve", "Run hybrid retrieval and print the subgraph");
    addCommon(retrieve);

    std::string answerCmd;
    auto* ask = app.add_subcommand("ask", "Answer a question with the full query pipeline");
    addCommon(ask);
    ask->add_option("--answer-cmd", answerCmd,
                    "Command that reads a prompt on stdin and prints the completion")
        ->required();

    CLI11_PARSE(app, argc, argv);

    try {
        setupLogging(logLevel, logFile);
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    try {
        if (retrieve->parsed())
            return runRetrieve(opts);
        return runAsk(opts, answerCmd);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
