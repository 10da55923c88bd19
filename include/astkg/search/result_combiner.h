#pragma once

#include <astkg/search/search_types.h>

#include <vector>

namespace astkg::search {

struct FusionConfig {
    double lexical_weight = 0.5;
    double vector_weight = 0.5;
    double single_signal_discount = 0.8; // (0, 1)
    bool normalize_lexical = true;       // Max-normalize lexical lists scored above 1.0
};

/**
 * Fuses the lexical and vector hit lists into one list keyed by node id.
 *
 *   both signals:  lexical_weight * lexical + vector_weight * vector
 *   one signal:    weight * score * single_signal_discount
 *
 * Weights are normalized to sum to 1. Scores are clamped to [0, 1] first, and
 * a node listed twice in the same branch keeps its best score. Output is sorted
 * by combinedScore descending with node id as the tie-break, so identical
 * inputs always produce identical order.
 */
class ResultCombiner {
public:
    explicit ResultCombiner(FusionConfig config = {});

    std::vector<RankedResult> combine(const std::vector<SearchHit>& lexical,
                                      const std::vector<SearchHit>& vector) const;

    double singleSignalScore(SearchSignal signal, double score) const;
    double dualSignalScore(double lexicalScore, double vectorScore) const;

    const FusionConfig& config() const noexcept { return config_; }

private:
    FusionConfig config_;
};

} // namespace astkg::search
