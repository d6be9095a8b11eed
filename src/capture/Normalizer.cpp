#include "capture/Normalizer.hpp"
#include "text/TextUtil.hpp"

#include <cctype>
#include <unordered_set>
#include <utility>

namespace capture {

static const char* kSelectedSuffix = " selected";

static bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
static bool is_digit(char c) { return c >= '0' && c <= '9'; }

// letters+ digits+, starting at i; returns end position or npos
static size_t scan_cell(const std::string& s, size_t i) {
    size_t j = i;
    while (j < s.size() && is_upper(s[j])) ++j;
    if (j == i) return std::string::npos;

    size_t k = j;
    while (k < s.size() && is_digit(s[k])) ++k;
    if (k == j) return std::string::npos;

    return k;
}

bool is_cell_ref(const std::string& s) {
    size_t end = scan_cell(s, 0);
    if (end == std::string::npos) return false;
    if (end == s.size()) return true;

    if (s[end] != ':') return false;
    size_t end2 = scan_cell(s, end + 1);
    return end2 == s.size();
}

static bool is_selection_notice(const std::string& s) {
    const std::string suffix = kSelectedSuffix;
    if (s.size() <= suffix.size()) return false;
    if (s.compare(s.size() - suffix.size(), suffix.size(), suffix) != 0) return false;
    return is_cell_ref(s.substr(0, s.size() - suffix.size()));
}

std::string clean_text(const std::string& raw) {
    const std::string suffix = kSelectedSuffix;
    std::string s = raw;

    if (s.size() > suffix.size() &&
        s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0) {
        const size_t ref_end = s.size() - suffix.size();
        const size_t nl = s.rfind('\n', ref_end);

        if (nl != std::string::npos && nl < ref_end &&
            is_cell_ref(s.substr(nl + 1, ref_end - nl - 1))) {
            size_t cut = nl;
            while (cut > 0 && s[cut - 1] == '\n') --cut;
            s.erase(cut);
        }
    }

    return textutil::trim_copy(s);
}

bool is_ui_element(const std::string& text, const NormalizerConfig& cfg) {
    static const std::unordered_set<std::string> labels = {
        "BETA",
        "Untitled",
        "Build a new analysis",
        "Import data",
        "Check a different file",
        "Let me know what you'd like to accomplish!",
        "What can I do for you?",
        "Type a message",
        "Send",
        "Stop",
        "Copy",
        "Retry",
        "New chat",
        "Claude",
    };

    if (labels.count(text)) return true;
    if (text.size() < cfg.min_length) return true;

    // single bare word, likely a button
    if (!text.empty() && text.size() <= 15) {
        bool all_alpha = true;
        for (unsigned char c : text) {
            if (!std::isalpha(c)) { all_alpha = false; break; }
        }
        if (all_alpha) return true;
    }

    return is_selection_notice(textutil::trim_copy(text));
}

bool normalize_fragment(const std::string& raw, std::string& out, const NormalizerConfig& cfg) {
    std::string cleaned = clean_text(raw);
    if (cleaned.empty()) return false;
    if (cfg.drop_ui_noise && is_ui_element(cleaned, cfg)) return false;

    out = std::move(cleaned);
    return true;
}

}  // namespace capture
