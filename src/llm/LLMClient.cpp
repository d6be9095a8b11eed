#include "llm/LLMClient.hpp"
#include "io/JsonIO.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace llm {

std::vector<capture::Message> parse_summary_reply(const std::string& reply) {
    std::string arr_text;
    if (!jsonio::extract_json_array(reply, arr_text)) return {};

    json j = json::parse(arr_text, nullptr, false);
    if (j.is_discarded()) return {};

    try {
        return jsonio::parse_messages(j, "reply");
    } catch (const std::exception&) {
        return {};
    }
}

} // namespace llm
