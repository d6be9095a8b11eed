#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "capture/Models.hpp"
#include "summary/Ranker.hpp"

namespace llm { class LLMClient; }

namespace summary {

// At or below this many units a text is returned untouched.
constexpr size_t kNoOpUnitCount = 3;

struct SummaryConfig {
    double ratio = 0.3;          // share of text units kept, clamped to [0, 1]
    RankConfig rank;

    // Texts segmenting into more units than this are left as they are
    // (graph + walk are quadratic). 0 disables the cap.
    size_t max_units = 0;
};

struct CompressionStats {
    size_t original_chars = 0;
    size_t compressed_chars = 0;

    double kept() const {
        if (original_chars == 0) return 1.0;
        return static_cast<double>(compressed_chars) / static_cast<double>(original_chars);
    }
};

struct SummaryOutcome {
    std::vector<capture::Message> messages;
    std::string strategy;        // "llm" | "textrank"
};

// Extractive TextRank summary of a single text; code fences always survive.
std::string summarize_text(const std::string& text, const SummaryConfig& cfg = {});

// User messages untouched; each assistant message summarized on its own.
std::vector<capture::Message> compress_conversation(const std::vector<capture::Message>& messages,
                                                    const SummaryConfig& cfg = {});

// Tries the model first (when given) and falls back to compress_conversation.
SummaryOutcome summarize_with_fallback(llm::LLMClient* client,
                                       const std::string& conversation_id,
                                       const std::vector<capture::Message>& messages,
                                       const SummaryConfig& cfg = {});

CompressionStats compression_stats(const std::vector<capture::Message>& original,
                                   const std::vector<capture::Message>& compressed);

}  // namespace summary
