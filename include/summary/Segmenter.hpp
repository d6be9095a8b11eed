#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace summary {

// Fragments this short or shorter are dropped by the segmenter.
constexpr size_t kMinUnitLength = 10;

struct Unit {
    std::string text;
    bool is_code = false;   // whole fenced block, never split or dropped
    size_t index = 0;       // position in the segmented sequence
};

bool is_code_text(const std::string& text);

// Sentences and blank-line separated blocks; fenced code blocks stay whole.
std::vector<Unit> segment_text(const std::string& text);

}  // namespace summary
