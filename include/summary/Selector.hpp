#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "summary/Segmenter.hpp"

namespace summary {

// Text units always kept, whatever the ratio.
constexpr size_t kMinTextUnits = 2;

struct SelectionDecision {
    size_t index = 0;
    bool accepted = false;
    std::string reason;     // "code" | "top_ranked" | "below_cut"
};

struct SelectionResult {
    std::vector<Unit> selected;                  // original order
    std::vector<SelectionDecision> decisions;    // one per unit, in unit order
};

// min(n_text, max(2, ceil(n_text * ratio)))
size_t text_units_to_keep(size_t n_text, double ratio);

// Keeps every code unit plus the best-scored text units, then restores source order.
SelectionResult select_units(const std::vector<Unit>& units,
                             const std::vector<double>& scores,
                             double ratio);

}  // namespace summary
