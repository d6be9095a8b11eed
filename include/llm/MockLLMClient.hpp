#pragma once

#include "llm/LLMClient.hpp"

#include <filesystem>
#include <string>

namespace llm {

// Serves canned replies from <root>/<conversation_id>.json.
class MockLLMClient final : public LLMClient {
    std::filesystem::path root_;

public:
    explicit MockLLMClient(const std::string& root_dir);

    std::vector<capture::Message> summarize_conversation(
        const std::string& conversation_id,
        const std::vector<capture::Message>& messages) override;
};

} // namespace llm
