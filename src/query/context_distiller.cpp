#include <astkg/query/context_distiller.h>

#include <astkg/common/text_utils.h>
#include <astkg/common/vector_math.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <set>

namespace astkg::query {

namespace {

using Clock = std::chrono::steady_clock;

bool isKeyType(const graph::GraphNode& node, bool isSeed) {
    if (!node.isType())
        return false;
    if (isSeed || node.type == graph::node_type::Interface)
        return true;
    if (node.property(graph::prop::IsAbstract) == "true")
        return true;
    const auto name = node.name();
    return common::ends_with(name, "Service") || common::ends_with(name, "Controller") ||
           common::ends_with(name, "Repository");
}

CandidateContext toCandidate(const graph::GraphNode& node, double score) {
    CandidateContext c;
    c.nodeId = node.id;
    c.type = node.isMethod() ? "method" : "class";
    c.name = node.name();
    c.signature = node.signature().empty() ? node.id : node.signature();
    c.summary = node.property(graph::prop::Summary);
    c.details = node.property(graph::prop::Details);
    if (!node.isMethod()) {
        if (c.summary.empty())
            c.summary = "Class: " + node.id;
        if (c.details.empty())
            c.details = "Type: " + node.type;
    }
    c.tags = common::split_csv(node.property(graph::prop::Tags));
    c.retrievalScore = score;
    return c;
}

} // namespace

std::string stripCodeFence(const std::string& text) {
    auto body = std::string(common::trim(text));
    if (body.rfind("```", 0) != 0)
        return body;
    auto firstNl = body.find('\n');
    if (firstNl == std::string::npos)
        return body;
    auto close = body.rfind("```");
    if (close == std::string::npos || close <= firstNl)
        return body.substr(firstNl + 1);
    return std::string(common::trim(std::string_view(body).substr(firstNl + 1, close - firstNl - 1)));
}

ContextDistiller::ContextDistiller(std::shared_ptr<llm::Answerer> answerer,
                                   std::shared_ptr<common::WorkerPool> pool,
                                   DistillerConfig config)
    : answerer_(std::move(answerer)), pool_(std::move(pool)), config_(config) {}

std::vector<CandidateContext>
ContextDistiller::candidates(const retrieval::RetrievalResult& retrieval) const {
    std::set<NodeId> seeds(retrieval.seedNodeIds.begin(), retrieval.seedNodeIds.end());
    std::vector<CandidateContext> out;
    for (const auto& [id, node] : retrieval.subGraph.nodes()) {
        if (node.isMethod() || isKeyType(node, seeds.count(id) > 0))
            out.push_back(toCandidate(node, retrieval.scoreOf(id)));
    }
    std::sort(out.begin(), out.end(), [](const CandidateContext& a, const CandidateContext& b) {
        if (a.retrievalScore != b.retrievalScore)
            return a.retrievalScore > b.retrievalScore;
        return a.nodeId < b.nodeId;
    });
    return out;
}

std::string ContextDistiller::buildRelevancePrompt(const std::string& query,
                                                   const CandidateContext& candidate) {
    std::string tags;
    for (const auto& t : candidate.tags) {
        if (!tags.empty())
            tags += ", ";
        tags += t;
    }
    std::string p;
    p += "Decide whether this code context helps answer the question.\n\n";
    p += "Question: \"" + query + "\"\n\n";
    p += "Context type: " + candidate.type + "\n";
    p += "Name: " + candidate.name + "\n";
    p += "Signature: " + candidate.signature + "\n";
    p += "Summary: " + (candidate.summary.empty() ? std::string("N/A") : candidate.summary) + "\n";
    p += "Details: " + (candidate.details.empty() ? std::string("N/A") : candidate.details) + "\n";
    p += "Tags: " + (tags.empty() ? std::string("none") : tags) + "\n\n";
    p += "Reply with a single JSON object and nothing else:\n";
    p += "{\"relevant\": true|false, \"relevanceScore\": 0.0-1.0, \"reason\": \"...\"}\n";
    return p;
}

RelevantContext ContextDistiller::parseVerdict(const CandidateContext& candidate,
                                               const std::string& text) const {
    RelevantContext rc{candidate, config_.parse_fallback_score, "Unparsed verdict"};
    auto j = nlohmann::json::parse(stripCodeFence(text), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return rc;
    }
    if (j.contains("relevant") && j["relevant"].is_boolean() && !j["relevant"].get<bool>()) {
        rc.relevanceScore = -1.0; // Marks a rejection
        rc.reason = j.value("reason", std::string("Not relevant"));
        return rc;
    }
    if (auto it = j.find("relevanceScore"); it != j.end() && it->is_number())
        rc.relevanceScore = common::clamp01(it->get<double>());
    rc.reason = j.value("reason", std::string("Relevant"));
    return rc;
}

std::vector<RelevantContext>
ContextDistiller::distill(const std::string& query,
                          const std::vector<CandidateContext>& candidates) const {
    std::vector<RelevantContext> kept;
    if (candidates.empty())
        return kept;

    if (!answerer_) {
        for (const auto& c : candidates)
            kept.push_back(RelevantContext{c, common::clamp01(c.retrievalScore), "Retrieval score"});
    } else {
        std::vector<std::future<Result<std::string>>> futures;
        futures.reserve(candidates.size());
        for (const auto& c : candidates) {
            futures.push_back(pool_->submit([answerer = answerer_, prompt = buildRelevancePrompt(query, c)]() {
                return answerer->generate(prompt);
            }));
        }

        const auto deadline = Clock::now() + config_.timeout;
        for (size_t i = 0; i < candidates.size(); ++i) {
            const auto remaining = std::max(
                std::chrono::milliseconds(0),
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()));
            auto verdict = common::awaitResult(futures[i], remaining, "relevance check");
            if (!verdict) {
                spdlog::warn("[ContextDistiller] {} for {}", verdict.error().message,
                             candidates[i].nodeId);
                kept.push_back(
                    RelevantContext{candidates[i], config_.error_fallback_score, "Evaluation error"});
                continue;
            }
            auto rc = parseVerdict(candidates[i], verdict.value());
            if (rc.relevanceScore >= 0.0)
                kept.push_back(std::move(rc));
        }
    }

    std::stable_sort(kept.begin(), kept.end(), [](const RelevantContext& a, const RelevantContext& b) {
        if (a.relevanceScore != b.relevanceScore)
            return a.relevanceScore > b.relevanceScore;
        if (a.candidate.retrievalScore != b.candidate.retrievalScore)
            return a.candidate.retrievalScore > b.candidate.retrievalScore;
        return a.candidate.nodeId < b.candidate.nodeId;
    });
    if (kept.size() > config_.max_contexts)
        kept.resize(config_.max_contexts);

    spdlog::info("[ContextDistiller] kept {} of {} candidates", kept.size(), candidates.size());
    return kept;
}

} // namespace astkg::query
