#pragma once

#include <astkg/core/types.h>

#include <cmath>
#include <cstddef>

namespace astkg::common {

// Cosine similarity in [-1, 1]; 0 when either vector is empty, zero-norm or the
// dimensions disagree.
[[nodiscard]] inline double cosineSimilarity(const Embedding& a, const Embedding& b) noexcept {
    if (a.empty() || a.size() != b.size())
        return 0.0;
    double dot = 0.0;
    double na = 0.0;
    double nb = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na <= 0.0 || nb <= 0.0)
        return 0.0;
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

[[nodiscard]] inline double clamp01(double v) noexcept {
    return v < 0.0 ? 0.0 : (v > 1.0 ? 1.0 : v);
}

} // namespace astkg::common
