#include "llm/OllamaLLMClient.hpp"
#include "llm/ProcUtil.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace llm {

static std::string read_all(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static bool ensure_dir(const fs::path& p) {
    std::error_code ec;
    fs::create_directories(p, ec);
    return !ec;
}

// very small FNV-1a hash for cache keys (deterministic, no deps)
static uint64_t fnv1a64(const std::string& s) {
    uint64_t h = 1469598103934665603ull;
    for (unsigned char c : s) {
        h ^= (uint64_t)c;
        h *= 1099511628211ull;
    }
    return h;
}

static std::string hex_u64(uint64_t x) {
    const char* hex = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[i] = hex[x & 0xF];
        x >>= 4;
    }
    return out;
}

static std::string upper_role(capture::Role r) {
    return r == capture::Role::User ? "USER" : "ASSISTANT";
}

OllamaLLMClient::OllamaLLMClient(const std::string& model, const std::string& cache_dir,
                                 const std::string& endpoint)
    : model_(model), cache_dir_(cache_dir), endpoint_(endpoint) {
    ensure_dir(cache_dir_);
}

std::string OllamaLLMClient::cache_key(const std::string& task, const std::string& input) const {
    std::string s = model_ + "\n" + task + "\n" + input;
    return task + "_v1-" + hex_u64(fnv1a64(s));
}

bool OllamaLLMClient::load_cache(const std::string& key, std::string& out) const {
    fs::path p = cache_dir_ / (key + ".json");
    std::ifstream f(p, std::ios::in);
    if (!f) return false;
    out = read_all(f);
    return true;
}

void OllamaLLMClient::save_cache(const std::string& key, const std::string& content) const {
    fs::path p = cache_dir_ / (key + ".json");
    std::ofstream f(p, std::ios::out | std::ios::trunc);
    if (!f) return;
    f << content;
}

std::string OllamaLLMClient::prompt_summarizer(const std::vector<capture::Message>& messages) const {
    std::ostringstream p;
    p <<
R"(You are summarizing a conversation between a user and a spreadsheet assistant.
Compress the conversation while preserving all important context, decisions,
data insights, and any code or formulas mentioned.

Rules:
1. Keep user messages short but preserve their intent.
2. For assistant responses: keep key findings, conclusions, numbers, and any code/formulas.
3. Remove verbose explanations and filler text.
4. Preserve the conversation structure (alternating user/assistant).
5. Return ONLY a JSON array of messages like [{"role": "user", "content": "..."}, {"role": "assistant", "content": "..."}].
6. Target ~30% of the original length while keeping all critical information.

Conversation to summarize:

)";

    for (size_t i = 0; i < messages.size(); ++i) {
        if (i > 0) p << "\n\n---\n\n";
        p << "[" << upper_role(messages[i].role) << "]: " << messages[i].content;
    }

    p << "\n\nReturn ONLY the JSON array, no other text:";
    return p.str();
}

std::string OllamaLLMClient::run_ollama(const std::string& prompt) const {
    if (!ensure_dir(cache_dir_)) return "";

    fs::path payload = cache_dir_ / "ollama_payload.tmp.json";
    fs::path resp    = cache_dir_ / "ollama_response.tmp.json";

    {
        std::ofstream f(payload, std::ios::out | std::ios::trunc);
        if (!f) return "";

        json body = {
            {"model", model_},
            {"prompt", prompt},
            {"stream", false},
            {"options", {{"temperature", 0}, {"num_predict", 4096}}}
        };
        f << body.dump();
    }

    // write response to file (avoid pipe / quoting issues)
    std::ostringstream cmd;
    cmd << "curl -s "
        << "-o " << procutil::shell_quote(resp.string()) << " "
        << procutil::shell_quote(endpoint_) << " "
        << "-H 'Content-Type: application/json' "
        << "--data-binary " << procutil::shell_quote("@" + payload.string())
        << " 2>/dev/null";

    int code = -1;
    procutil::run_capture_stdout(cmd.str(), &code);
    if (code != 0) {
        std::cerr << "warning: ollama request failed (curl exit " << code << ")\n";
        return "";
    }

    std::ifstream rf(resp, std::ios::in);
    if (!rf) return "";
    std::string out = read_all(rf);
    if (out.empty()) return "";

    json j = json::parse(out, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return "";
    if (j.contains("response") && j["response"].is_string()) {
        return j["response"].get<std::string>();
    }
    return "";
}

std::vector<capture::Message> OllamaLLMClient::summarize_conversation(
    const std::string& conversation_id,
    const std::vector<capture::Message>& messages) {
    if (messages.empty()) return {};

    const std::string prompt = prompt_summarizer(messages);
    const std::string key = cache_key("summarize", conversation_id + "\n" + prompt);

    std::string cached;
    if (load_cache(key, cached)) {
        auto parsed = parse_summary_reply(cached);
        if (!parsed.empty()) return parsed;
    }

    std::string out = run_ollama(prompt);
    if (out.empty()) return {};

    auto parsed = parse_summary_reply(out);
    if (!parsed.empty()) save_cache(key, out);
    return parsed;
}

} // namespace llm
