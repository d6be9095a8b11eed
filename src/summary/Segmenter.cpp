#include "summary/Segmenter.hpp"
#include "text/TextUtil.hpp"

#include <cctype>
#include <utility>

namespace summary {

static const std::string kFence = "```";
static const std::string kPlaceholderHead = "__CODE_BLOCK_";
static const std::string kPlaceholderTail = "__";

static std::string placeholder(size_t i) {
    return kPlaceholderHead + std::to_string(i) + kPlaceholderTail;
}

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static bool is_terminal(char c) {
    return c == '.' || c == '!' || c == '?';
}

// Replaces every ```...``` block (shortest match) with a placeholder.
static std::string extract_code_blocks(const std::string& text, std::vector<std::string>& blocks) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        const size_t open = text.find(kFence, pos);
        if (open == std::string::npos) break;

        const size_t close = text.find(kFence, open + kFence.size());
        if (close == std::string::npos) break;   // unterminated fence stays as text

        const size_t end = close + kFence.size();
        out.append(text, pos, open - pos);
        out += placeholder(blocks.size());
        blocks.push_back(text.substr(open, end - open));
        pos = end;
    }

    out.append(text, pos, std::string::npos);
    return out;
}

// Split after [.!?] + whitespace, or on runs of two or more newlines.
static std::vector<std::string> split_sentences(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t i = 0;

    while (i < s.size()) {
        size_t run_end = i;

        if (i > 0 && is_space(s[i]) && is_terminal(s[i - 1])) {
            while (run_end < s.size() && is_space(s[run_end])) ++run_end;
        } else if (s[i] == '\n' && i + 1 < s.size() && s[i + 1] == '\n') {
            while (run_end < s.size() && s[run_end] == '\n') ++run_end;
        }

        if (run_end > i) {
            parts.push_back(s.substr(start, i - start));
            start = run_end;
            i = run_end;
        } else {
            ++i;
        }
    }

    parts.push_back(s.substr(start));
    return parts;
}

static void push_unit(std::vector<Unit>& units, std::string text, bool code) {
    Unit u;
    u.text = std::move(text);
    u.is_code = code;
    u.index = units.size();
    units.push_back(std::move(u));
}

bool is_code_text(const std::string& text) {
    return textutil::starts_with(text, kFence);
}

// an unterminated fence still marks the rest of its sentence as code
static void push_text(std::vector<Unit>& units, const std::string& raw) {
    std::string piece = textutil::trim_copy(raw);
    if (piece.size() <= kMinUnitLength) return;
    const bool code = is_code_text(piece);
    push_unit(units, std::move(piece), code);
}

// index of the placeholder starting at `at`, or npos when the marker is not one of ours
static size_t placeholder_index(const std::string& piece, size_t at, size_t block_count, size_t& end) {
    const size_t num_begin = at + kPlaceholderHead.size();
    size_t num_end = num_begin;
    while (num_end < piece.size() && std::isdigit(static_cast<unsigned char>(piece[num_end]))) ++num_end;

    if (num_end == num_begin || num_end - num_begin > 9) return std::string::npos;
    if (piece.compare(num_end, kPlaceholderTail.size(), kPlaceholderTail) != 0) return std::string::npos;

    const size_t b = static_cast<size_t>(std::stoul(piece.substr(num_begin, num_end - num_begin)));
    if (b >= block_count) return std::string::npos;

    end = num_end + kPlaceholderTail.size();
    return b;
}

// Emits the text around each placeholder and the code block itself as separate units.
static void push_with_code(std::vector<Unit>& units, const std::string& piece,
                           const std::vector<std::string>& blocks) {
    size_t seg_start = 0;
    size_t search = 0;

    while (true) {
        const size_t at = piece.find(kPlaceholderHead, search);
        if (at == std::string::npos) break;

        size_t end = 0;
        const size_t b = placeholder_index(piece, at, blocks.size(), end);
        if (b == std::string::npos) {
            search = at + kPlaceholderHead.size();
            continue;
        }

        push_text(units, piece.substr(seg_start, at - seg_start));
        push_unit(units, blocks[b], true);
        seg_start = end;
        search = end;
    }

    if (seg_start < piece.size()) push_text(units, piece.substr(seg_start));
}

std::vector<Unit> segment_text(const std::string& text) {
    std::vector<std::string> blocks;
    const std::string masked = extract_code_blocks(text, blocks);

    std::vector<Unit> units;
    for (const auto& raw : split_sentences(masked)) {
        std::string piece = textutil::trim_copy(raw);
        if (piece.find(kPlaceholderHead) == std::string::npos) {
            push_text(units, piece);
        } else {
            push_with_code(units, piece, blocks);
        }
    }

    return units;
}

}  // namespace summary
