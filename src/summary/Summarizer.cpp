#include "summary/Summarizer.hpp"

#include "llm/LLMClient.hpp"
#include "summary/Segmenter.hpp"
#include "summary/Selector.hpp"
#include "summary/SimilarityGraph.hpp"

#include <utility>

namespace summary {

static double clamp_ratio(double r) {
    if (!(r > 0.0)) return 0.0;   // also catches NaN; kMinTextUnits still applies
    if (r > 1.0) return 1.0;
    return r;
}

static size_t total_chars(const std::vector<capture::Message>& messages) {
    size_t n = 0;
    for (const auto& m : messages) n += m.content.size();
    return n;
}

std::string summarize_text(const std::string& text, const SummaryConfig& cfg) {
    const std::vector<Unit> units = segment_text(text);

    if (units.size() <= kNoOpUnitCount) return text;
    if (cfg.max_units > 0 && units.size() > cfg.max_units) return text;

    std::vector<std::vector<std::string>> tokens;
    tokens.reserve(units.size());
    for (const auto& u : units) tokens.push_back(tokenize_unit(u));

    const Matrix sim = build_similarity_matrix(tokens);
    const std::vector<double> scores = rank_units(sim, cfg.rank);
    const SelectionResult sel = select_units(units, scores, clamp_ratio(cfg.ratio));

    std::string out;
    for (size_t i = 0; i < sel.selected.size(); ++i) {
        if (i > 0) out += "\n\n";
        out += sel.selected[i].text;
    }
    return out;
}

std::vector<capture::Message> compress_conversation(const std::vector<capture::Message>& messages,
                                                    const SummaryConfig& cfg) {
    std::vector<capture::Message> out;
    out.reserve(messages.size());

    for (const auto& m : messages) {
        if (m.role == capture::Role::User) {
            out.push_back(m);
            continue;
        }
        out.push_back(capture::Message{m.role, summarize_text(m.content, cfg)});
    }
    return out;
}

SummaryOutcome summarize_with_fallback(llm::LLMClient* client,
                                       const std::string& conversation_id,
                                       const std::vector<capture::Message>& messages,
                                       const SummaryConfig& cfg) {
    SummaryOutcome res;

    if (client) {
        std::vector<capture::Message> remote = client->summarize_conversation(conversation_id, messages);
        if (!remote.empty()) {
            res.messages = std::move(remote);
            res.strategy = "llm";
            return res;
        }
    }

    res.messages = compress_conversation(messages, cfg);
    res.strategy = "textrank";
    return res;
}

CompressionStats compression_stats(const std::vector<capture::Message>& original,
                                   const std::vector<capture::Message>& compressed) {
    CompressionStats s;
    s.original_chars = total_chars(original);
    s.compressed_chars = total_chars(compressed);
    return s;
}

}  // namespace summary
