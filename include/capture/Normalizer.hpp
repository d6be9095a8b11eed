#pragma once
#include <cstddef>
#include <string>

namespace capture {

struct NormalizerConfig {
    // Reject obvious control text (button labels, selection notices, very short
    // strings). Off by default: the screen capture already delivers role-tagged content.
    bool drop_ui_noise = false;
    size_t min_length = 10;          // only used when drop_ui_noise is set
};

// "A1", "BC12", "A1:C9"
bool is_cell_ref(const std::string& s);

// Removes a trailing "\n<CELL-REF> selected" notice and trims.
std::string clean_text(const std::string& raw);

// Known chat-pane labels, short strings, single bare words, selection notices.
bool is_ui_element(const std::string& text, const NormalizerConfig& cfg = {});

// Returns false when the fragment should be dropped. Never throws.
bool normalize_fragment(const std::string& raw, std::string& out, const NormalizerConfig& cfg = {});

}  // namespace capture
