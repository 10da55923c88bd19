#include <astkg/search/result_combiner.h>

#include <astkg/common/vector_math.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>

namespace astkg::search {

ResultCombiner::ResultCombiner(FusionConfig config) : config_(config) {
    const double sum = config_.lexical_weight + config_.vector_weight;
    if (config_.lexical_weight < 0 || config_.vector_weight < 0 || sum <= 0) {
        spdlog::warn("[ResultCombiner] invalid weights ({}, {}); using equal weights",
                     config_.lexical_weight, config_.vector_weight);
        config_.lexical_weight = 0.5;
        config_.vector_weight = 0.5;
    } else {
        config_.lexical_weight /= sum;
        config_.vector_weight /= sum;
    }
    if (config_.single_signal_discount <= 0 || config_.single_signal_discount >= 1.0) {
        spdlog::warn("[ResultCombiner] single-signal discount {} outside (0, 1); using 0.8",
                     config_.single_signal_discount);
        config_.single_signal_discount = 0.8;
    }
}

double ResultCombiner::singleSignalScore(SearchSignal signal, double score) const {
    const double w =
        signal == SearchSignal::Lexical ? config_.lexical_weight : config_.vector_weight;
    return w * common::clamp01(score) * config_.single_signal_discount;
}

double ResultCombiner::dualSignalScore(double lexicalScore, double vectorScore) const {
    return config_.lexical_weight * common::clamp01(lexicalScore) +
           config_.vector_weight * common::clamp01(vectorScore);
}

std::vector<RankedResult> ResultCombiner::combine(const std::vector<SearchHit>& lexical,
                                                  const std::vector<SearchHit>& vector) const {
    double lexScale = 1.0;
    if (config_.normalize_lexical) {
        double maxLex = 0.0;
        for (const auto& h : lexical)
            maxLex = std::max(maxLex, h.score);
        if (maxLex > 1.0)
            lexScale = 1.0 / maxLex;
    }

    std::map<NodeId, RankedResult> merged;
    auto absorb = [&](const SearchHit& hit, double score) {
        auto& r = merged[hit.nodeId];
        if (r.nodeId.empty()) {
            r.nodeId = hit.nodeId;
            r.name = hit.name;
            r.signature = hit.signature;
            r.nodeType = hit.nodeType;
        }
        if (hit.signal == SearchSignal::Lexical) {
            r.lexicalScore = std::max(r.lexicalScore, score);
            r.foundByLexical = true;
        } else {
            r.vectorScore = std::max(r.vectorScore, score);
            r.foundByVector = true;
        }
    };
    for (const auto& h : lexical) {
        SearchHit tagged = h;
        tagged.signal = SearchSignal::Lexical;
        absorb(tagged, common::clamp01(h.score * lexScale));
    }
    for (const auto& h : vector) {
        SearchHit tagged = h;
        tagged.signal = SearchSignal::Vector;
        absorb(tagged, common::clamp01(h.score));
    }

    std::vector<RankedResult> out;
    out.reserve(merged.size());
    size_t both = 0;
    for (auto& [id, r] : merged) {
        if (r.foundByLexical && r.foundByVector) {
            r.combinedScore = dualSignalScore(r.lexicalScore, r.vectorScore);
            ++both;
        } else if (r.foundByLexical) {
            r.combinedScore = singleSignalScore(SearchSignal::Lexical, r.lexicalScore);
        } else {
            r.combinedScore = singleSignalScore(SearchSignal::Vector, r.vectorScore);
        }
        out.push_back(std::move(r));
    }
    std::sort(out.begin(), out.end());
    spdlog::debug("[ResultCombiner] fused {} lexical + {} vector hits -> {} results ({} in both)",
                  lexical.size(), vector.size(), out.size(), both);
    return out;
}

} // namespace astkg::search
