#pragma once
#include <vector>
#include <utility>
#include <cstddef>

namespace convmem {

// Cosine similarity in [-1, 1]. Throws DimensionMismatch when lengths differ;
// returns 0 when either vector has zero magnitude.
float cosine(const std::vector<float>& u, const std::vector<float>& v);

struct RankedSlot {
    size_t slot;
    float score;
};

using RankCandidate = std::pair<size_t, const std::vector<float>*>;

// Nearest-neighbour seam behind VectorStore::search. Candidates arrive in
// insertion order; results are score-descending with ties on ascending slot.
class Ranker {
public:
    virtual ~Ranker() = default;
    virtual std::vector<RankedSlot> rank(const std::vector<float>& query,
                                         const std::vector<RankCandidate>& candidates,
                                         size_t k) const = 0;
};

// Brute-force scan. Fine for conversation-sized stores.
class LinearRanker : public Ranker {
public:
    std::vector<RankedSlot> rank(const std::vector<float>& query,
                                 const std::vector<RankCandidate>& candidates,
                                 size_t k) const override;
};

} // namespace convmem
