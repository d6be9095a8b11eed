#include "summary/SimilarityGraph.hpp"
#include "text/TextUtil.hpp"

#include <unordered_set>

namespace summary {

const char* const kCodeToken = "__code_block__";

std::vector<std::string> tokenize_unit(const Unit& unit) {
    if (unit.is_code) return {kCodeToken};
    return textutil::tokenize(textutil::normalize(unit.text), 3);
}

double jaccard(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    if (a.empty() || b.empty()) return 0.0;

    std::unordered_set<std::string> sa(a.begin(), a.end());
    std::unordered_set<std::string> sb(b.begin(), b.end());

    size_t inter = 0;
    for (const auto& t : sa) {
        if (sb.count(t)) ++inter;
    }

    const size_t uni = sa.size() + sb.size() - inter;
    if (uni == 0) return 0.0;
    return static_cast<double>(inter) / static_cast<double>(uni);
}

Matrix build_similarity_matrix(const std::vector<std::vector<std::string>>& tokens) {
    const size_t n = tokens.size();
    Matrix m(n, std::vector<double>(n, 0.0));

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            const double sim = jaccard(tokens[i], tokens[j]);
            m[i][j] = sim;
            m[j][i] = sim;
        }
    }
    return m;
}

}  // namespace summary
