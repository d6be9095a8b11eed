#include "llm/MockLLMClient.hpp"

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace llm {

MockLLMClient::MockLLMClient(const std::string& root_dir) : root_(root_dir) {}

// ignores the messages, the conversation id selects the canned reply
std::vector<capture::Message> MockLLMClient::summarize_conversation(
    const std::string& conversation_id,
    const std::vector<capture::Message>&) {
    fs::path p = root_ / (conversation_id + ".json");
    std::ifstream f(p);
    if (!f) return {};

    std::ostringstream ss;
    ss << f.rdbuf();
    return parse_summary_reply(ss.str());
}

} // namespace llm
