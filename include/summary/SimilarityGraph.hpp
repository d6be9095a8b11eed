#pragma once
#include <string>
#include <vector>

#include "summary/Segmenter.hpp"

namespace summary {

using Matrix = std::vector<std::vector<double>>;

// Token standing in for a whole code block: it joins the graph, adds no lexical signal.
extern const char* const kCodeToken;

// lowercase alphanumeric tokens of 3+ characters; code units -> { kCodeToken }
std::vector<std::string> tokenize_unit(const Unit& unit);

// |A n B| / |A u B| over token sets, 0 when either side is empty
double jaccard(const std::vector<std::string>& a, const std::vector<std::string>& b);

// Symmetric N x N overlap matrix, zero diagonal.
Matrix build_similarity_matrix(const std::vector<std::vector<std::string>>& tokens);

}  // namespace summary
