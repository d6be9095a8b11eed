#include "summary/Selector.hpp"

#include <algorithm>
#include <cmath>

namespace summary {

size_t text_units_to_keep(size_t n_text, double ratio) {
    // 10 * 0.3 is 3.0000000000000004 in binary; round to 9 decimals before ceil
    const double product = std::round(static_cast<double>(n_text) * ratio * 1e9) / 1e9;
    const double want = std::ceil(product);
    size_t keep = want > 0.0 ? static_cast<size_t>(want) : 0;
    keep = std::max(keep, kMinTextUnits);
    return std::min(keep, n_text);
}

SelectionResult select_units(const std::vector<Unit>& units,
                             const std::vector<double>& scores,
                             double ratio) {
    SelectionResult res;
    res.decisions.resize(units.size());

    std::vector<size_t> text_idx;
    text_idx.reserve(units.size());

    for (size_t i = 0; i < units.size(); ++i) {
        res.decisions[i].index = i;
        if (units[i].is_code) {
            res.decisions[i].accepted = true;
            res.decisions[i].reason = "code";
        } else {
            text_idx.push_back(i);
        }
    }

    auto score_of = [&](size_t i) { return i < scores.size() ? scores[i] : 0.0; };

    // descending score, earlier unit first on ties
    std::stable_sort(text_idx.begin(), text_idx.end(),
                     [&](size_t a, size_t b) { return score_of(a) > score_of(b); });

    const size_t keep = text_units_to_keep(text_idx.size(), ratio);
    for (size_t r = 0; r < text_idx.size(); ++r) {
        SelectionDecision& d = res.decisions[text_idx[r]];
        d.accepted = r < keep;
        d.reason = d.accepted ? "top_ranked" : "below_cut";
    }

    for (size_t i = 0; i < units.size(); ++i) {
        if (res.decisions[i].accepted) res.selected.push_back(units[i]);
    }
    return res;
}

}  // namespace summary
