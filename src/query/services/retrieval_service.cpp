#include <astkg/query/services/retrieval_service.h>

#include <astkg/common/text_utils.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace astkg::query {

RetrievalService::RetrievalService(std::shared_ptr<retrieval::HybridRetriever> retriever,
                                   std::shared_ptr<llm::EntityExtractor> extractor,
                                   std::shared_ptr<llm::EmbeddingModel> embedder,
                                   std::shared_ptr<common::WorkerPool> pool,
                                   std::chrono::milliseconds embedTimeout)
    : retriever_(std::move(retriever)),
      extractor_(std::move(extractor)),
      embedder_(std::move(embedder)),
      pool_(std::move(pool)),
      embedTimeout_(embedTimeout) {}

search::ExtractedTerms RetrievalService::extractTerms(const std::string& query) const {
    if (extractor_) {
        auto terms = extractor_->extract(query);
        if (terms) {
            return std::move(terms).value();
        }
        spdlog::warn("[RetrievalService] entity extraction failed: {}; using raw words",
                     terms.error().message);
    }
    search::ExtractedTerms fallback;
    std::string word;
    auto flush = [&] {
        if (word.size() > 2)
            fallback.freeTerms.push_back(common::to_lower(word));
        word.clear();
    };
    for (char c : query) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_')
            word.push_back(c);
        else
            flush();
    }
    flush();
    return fallback;
}

Embedding RetrievalService::embedQuery(const std::string& query) const {
    if (!embedder_)
        return {};
    auto fut = pool_->submit([embedder = embedder_, query]() { return embedder->embed(query); });
    auto emb = common::awaitResult(fut, embedTimeout_, "query embedding");
    if (!emb) {
        spdlog::warn("[RetrievalService] {}; continuing lexical-only", emb.error().message);
        return {};
    }
    return std::move(emb).value();
}

Result<void> RetrievalService::retrieve(QueryExecutionContext& ctx) const {
    if (!retriever_) {
        return Error{ErrorCode::NotInitialized, "no retriever configured"};
    }
    if (!ctx.extractedTerms) {
        ctx.extractedTerms = extractTerms(ctx.originalQuery());
    }
    if (ctx.queryEmbedding.empty()) {
        ctx.queryEmbedding = embedQuery(ctx.originalQuery());
    }

    auto result = retriever_->retrieve(*ctx.extractedTerms, ctx.queryEmbedding);

    size_t methods = 0;
    for (const auto& [id, node] : result.subGraph.nodes()) {
        if (node.isMethod())
            ++methods;
    }
    const double topScore =
        result.seedNodeIds.empty() ? 0.0 : result.scoreOf(result.seedNodeIds.front());
    ctx.metadata["retrievedNodeCount"] = std::to_string(result.subGraph.nodeCount());
    ctx.metadata["retrievedMethodCount"] = std::to_string(methods);
    ctx.metadata["retrievalScore"] = fmt::format("{:.4f}", topScore);
    ctx.metadata["queryIntent"] = search::toString(ctx.extractedTerms->intent);
    for (const auto& [k, v] : result.metadata)
        ctx.metadata["retrieval." + k] = v;

    ctx.retrievalResult = std::move(result);
    return {};
}

} // namespace astkg::query
