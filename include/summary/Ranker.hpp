#pragma once
#include <vector>

#include "summary/SimilarityGraph.hpp"

namespace summary {

struct RankConfig {
    // Fixed walk length; there is no convergence check so cost stays predictable.
    int iterations = 50;
    double damping = 0.85;
};

// Each row divided by its sum; all-zero rows are left as they are.
Matrix row_normalize(const Matrix& m);

// PageRank-style scores, one per node. Empty matrix -> empty result.
std::vector<double> rank_units(const Matrix& similarity, const RankConfig& cfg = {});

}  // namespace summary
