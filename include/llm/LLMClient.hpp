#pragma once
#include <string>
#include <vector>

#include "capture/Models.hpp"

namespace llm {

class LLMClient {
public:
    virtual ~LLMClient() = default;

    // Whole-conversation summary produced by a model.
    // An empty result means "unavailable or unusable": callers fall back to TextRank.
    virtual std::vector<capture::Message> summarize_conversation(
        const std::string& conversation_id,
        const std::vector<capture::Message>& messages) = 0;
};

class NullLLMClient final : public LLMClient {
public:
    std::vector<capture::Message> summarize_conversation(
        const std::string&, const std::vector<capture::Message>&) override { return {}; }
};

// Parses a model reply holding a JSON array of {role, content}; all-or-nothing.
std::vector<capture::Message> parse_summary_reply(const std::string& reply);

} // namespace llm
