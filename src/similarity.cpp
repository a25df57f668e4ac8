#include "similarity.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace convmem {

float cosine(const std::vector<float>& u, const std::vector<float>& v) {
    if (u.size() != v.size()) throw DimensionMismatch(u.size(), v.size());

    double dot = 0.0, norm_u = 0.0, norm_v = 0.0;
    for (size_t i = 0; i < u.size(); i++) {
        dot += static_cast<double>(u[i]) * v[i];
        norm_u += static_cast<double>(u[i]) * u[i];
        norm_v += static_cast<double>(v[i]) * v[i];
    }

    if (!std::isfinite(dot) || !std::isfinite(norm_u) || !std::isfinite(norm_v)) return 0.0f;
    if (norm_u == 0.0 || norm_v == 0.0) return 0.0f;
    double sim = dot / (std::sqrt(norm_u) * std::sqrt(norm_v));
    return static_cast<float>(std::clamp(sim, -1.0, 1.0));
}

std::vector<RankedSlot> LinearRanker::rank(const std::vector<float>& query,
                                           const std::vector<RankCandidate>& candidates,
                                           size_t k) const {
    std::vector<RankedSlot> scored;
    scored.reserve(candidates.size());
    for (auto& [slot, vec] : candidates) {
        scored.push_back({slot, cosine(query, *vec)});
    }

    std::sort(scored.begin(), scored.end(),
                     [](const RankedSlot& a, const RankedSlot& b) {
                         if (a.score != b.score) return a.score > b.score;
                         return a.slot < b.slot;
                     });

    if (scored.size() > k) scored.resize(k);
    return scored;
}

} // namespace convmem
