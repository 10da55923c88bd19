#include <astkg/query/services/generation_service.h>

#include <astkg/common/vector_math.h>
#include <astkg/query/context_distiller.h>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cctype>

namespace astkg::query {

namespace {

constexpr const char* kNoContextSummary = "No relevant context found for the query.";

std::string stringField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return {};
    return it->is_string() ? it->get<std::string>() : it->dump();
}

GeneratedAnswer degradedAnswer(std::string summary, const std::string& flag,
                               const std::string& reason) {
    GeneratedAnswer a;
    a.summary = std::move(summary);
    a.degraded = true;
    a.metadata[flag] = "true";
    a.metadata["degradedReason"] = reason;
    return a;
}

} // namespace

GenerationService::GenerationService(std::shared_ptr<llm::Answerer> answerer,
                                     std::shared_ptr<common::WorkerPool> pool,
                                     std::chrono::milliseconds answerTimeout)
    : answerer_(std::move(answerer)), pool_(std::move(pool)), answerTimeout_(answerTimeout) {}

std::string GenerationService::buildPrompt(const QueryExecutionContext& ctx) {
    std::string p;
    p += "Answer the question about the codebase using only the code context below.\n\n";
    p += "QUESTION: " + ctx.originalQuery() + "\n\n";
    p += "CODE CONTEXT:\n";
    if (ctx.distilledContext) {
        for (const auto& rc : *ctx.distilledContext) {
            const auto& c = rc.candidate;
            std::string type = c.type;
            for (auto& ch : type)
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            p += fmt::format("=== {}: {} ===\n", type, c.name);
            p += "Signature: " + c.signature + "\n";
            p += "Summary: " + (c.summary.empty() ? std::string("N/A") : c.summary) + "\n";
            if (!c.details.empty())
                p += "Details: " + c.details + "\n";
            p += fmt::format("Relevance: {:.2f}\n\n", rc.relevanceScore);
        }
    }

    if (ctx.refinementCount() > 0) {
        p += fmt::format("REFINEMENT CONTEXT (attempt {} of {}):\n", ctx.refinementCount() + 1,
                         ctx.maxRefinements() + 1);
        p += "The previous answer made relationship claims the code graph does not support:\n";
        for (const auto& e : ctx.verificationErrors)
            p += "- " + e + "\n";
        p += "Only state relationships that appear in the context above.\n\n";
    }

    p += "Reply with a single JSON object and nothing else:\n"
         "{\n"
         "  \"summary\": \"...\",\n"
         "  \"components\": [{\"type\": \"method|class\", \"name\": \"...\", \"signature\": \"...\", "
         "\"summary\": \"...\", \"relevanceScore\": 0.0-1.0}],\n"
         "  \"relationships\": [{\"fromComponent\": \"...\", \"toComponent\": \"...\", "
         "\"relationshipType\": \"CALLS|USES|EXTENDS|IMPLEMENTS|HAS_METHOD|...\", "
         "\"description\": \"...\"}],\n"
         "  \"metadata\": {}\n"
         "}\n";
    return p;
}

Result<GeneratedAnswer> GenerationService::parseAnswer(const std::string& text) {
    auto j = nlohmann::json::parse(stripCodeFence(text), nullptr, false);
    if (j.is_discarded()) {
        return Error{ErrorCode::ParseError, "answer is not valid JSON"};
    }
    if (!j.is_object() || !j.contains("summary")) {
        return Error{ErrorCode::InvalidData, "answer has no summary"};
    }

    GeneratedAnswer a;
    a.summary = stringField(j, "summary");
    if (auto it = j.find("components"); it != j.end() && it->is_array()) {
        for (const auto& cj : *it) {
            if (!cj.is_object())
                continue;
            RelevantComponent c;
            c.type = stringField(cj, "type");
            c.name = stringField(cj, "name");
            c.signature = stringField(cj, "signature");
            c.summary = stringField(cj, "summary");
            if (auto s = cj.find("relevanceScore"); s != cj.end() && s->is_number())
                c.relevanceScore = common::clamp01(s->get<double>());
            if (!c.name.empty())
                a.components.push_back(std::move(c));
        }
    }
    if (auto it = j.find("relationships"); it != j.end() && it->is_array()) {
        for (const auto& rj : *it) {
            if (!rj.is_object())
                continue;
            RelationshipClaim claim;
            claim.fromComponent = stringField(rj, "fromComponent");
            claim.toComponent = stringField(rj, "toComponent");
            claim.relationshipType = stringField(rj, "relationshipType");
            claim.description = stringField(rj, "description");
            if (!claim.fromComponent.empty() && !claim.toComponent.empty())
                a.claims.push_back(std::move(claim));
        }
    }
    if (auto it = j.find("metadata"); it != j.end() && it->is_object()) {
        for (const auto& [k, v] : it->items())
            a.metadata[k] = v.is_string() ? v.get<std::string>() : v.dump();
    }
    return a;
}

Result<void> GenerationService::generate(QueryExecutionContext& ctx) const {
    ++ctx.generationAttempts;
    ctx.metadata["generationAttempt"] = std::to_string(ctx.generationAttempts);

    if (!ctx.distilledContext || ctx.distilledContext->empty()) {
        GeneratedAnswer a;
        a.summary = kNoContextSummary;
        a.metadata["noContext"] = "true";
        ctx.generatedAnswer = std::move(a);
        ctx.metadata["promptLength"] = "0";
        ctx.metadata["responseLength"] = "0";
        spdlog::info("[GenerationService] {}: no context, skipping answer generation",
                     ctx.executionId());
        return {};
    }
    if (!answerer_) {
        return Error{ErrorCode::NotInitialized, "no answerer configured"};
    }

    const auto prompt = buildPrompt(ctx);
    ctx.metadata["promptLength"] = std::to_string(prompt.size());

    auto fut = pool_->submit([answerer = answerer_, prompt]() { return answerer->generate(prompt); });
    auto text = common::awaitResult(fut, answerTimeout_, "answer generation");
    if (!text) {
        spdlog::warn("[GenerationService] {}: {}", ctx.executionId(), text.error().message);
        ctx.metadata["responseLength"] = "0";
        ctx.generatedAnswer = degradedAnswer(
            "Failed to generate an answer: " + text.error().message, "generationError",
            text.error().message);
        return {};
    }

    ctx.metadata["responseLength"] = std::to_string(text.value().size());
    auto parsed = parseAnswer(text.value());
    if (!parsed) {
        spdlog::warn("[GenerationService] {}: unreadable answer ({})", ctx.executionId(),
                     parsed.error().message);
        ctx.generatedAnswer = degradedAnswer("Failed to parse response: " + parsed.error().message,
                                             "parseError", parsed.error().message);
        return {};
    }

    auto answer = std::move(parsed).value();
    spdlog::debug("[GenerationService] {}: {} components, {} claims (attempt {})",
                  ctx.executionId(), answer.components.size(), answer.claims.size(),
                  ctx.generationAttempts);
    ctx.generatedAnswer = std::move(answer);
    return {};
}

} // namespace astkg::query
