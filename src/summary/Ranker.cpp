#include "summary/Ranker.hpp"

namespace summary {

Matrix row_normalize(const Matrix& m) {
    Matrix out = m;
    for (auto& row : out) {
        double sum = 0.0;
        for (double v : row) sum += v;
        if (sum == 0.0) continue;
        for (double& v : row) v /= sum;
    }
    return out;
}

std::vector<double> rank_units(const Matrix& similarity, const RankConfig& cfg) {
    const size_t n = similarity.size();
    if (n == 0) return {};

    const Matrix norm = row_normalize(similarity);
    const double dn = static_cast<double>(n);
    const double base = (1.0 - cfg.damping) / dn;

    std::vector<double> scores(n, 1.0 / dn);
    std::vector<double> next(n, 0.0);

    for (int iter = 0; iter < cfg.iterations; ++iter) {
        for (size_t i = 0; i < n; ++i) {
            double sum = 0.0;
            for (size_t j = 0; j < n; ++j) {
                const double w = norm[j][i];
                if (w > 0.0) sum += w * scores[j];
            }
            next[i] = base + cfg.damping * sum;
        }
        scores.swap(next);
    }

    return scores;
}

}  // namespace summary
