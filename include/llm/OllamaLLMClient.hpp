#pragma once

#include "llm/LLMClient.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace llm {

// Summarizes through a local Ollama server (POST /api/generate via curl).
class OllamaLLMClient final : public LLMClient {
    std::string model_;
    std::filesystem::path cache_dir_;
    std::string endpoint_;

public:
    OllamaLLMClient(const std::string& model, const std::string& cache_dir,
                    const std::string& endpoint = "http://127.0.0.1:11434/api/generate");

    std::vector<capture::Message> summarize_conversation(
        const std::string& conversation_id,
        const std::vector<capture::Message>& messages) override;

    std::string prompt_summarizer(const std::vector<capture::Message>& messages) const;

private:
    std::string run_ollama(const std::string& prompt) const;

    std::string cache_key(const std::string& task, const std::string& input) const;
    bool load_cache(const std::string& key, std::string& out) const;
    void save_cache(const std::string& key, const std::string& content) const;
};

} // namespace llm
