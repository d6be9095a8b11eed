#include "io/JsonIO.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace jsonio {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static double optional_number(const json& j, const char* key, const std::string& where, double def) {
    if (!j.contains(key) || j.at(key).is_null()) return def;
    if (!j.at(key).is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return j.at(key).get<double>();
}

static capture::Role require_role(const json& j, const std::string& where) {
    const std::string s = require_string(j, "role", where);
    capture::Role r;
    if (!capture::parse_role(s, r)) {
        throw std::runtime_error(where + ".role must be \"user\" or \"assistant\", got \"" + s + "\"");
    }
    return r;
}

json message_to_json(const capture::Message& m) {
    return json{{"role", capture::role_str(m.role)}, {"content", m.content}};
}

json messages_to_json(const std::vector<capture::Message>& messages) {
    json arr = json::array();
    for (const auto& m : messages) arr.push_back(message_to_json(m));
    return arr;
}

std::vector<capture::Message> parse_messages(const json& arr, const std::string& where) {
    require_array(arr, where);

    std::vector<capture::Message> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream oss;
        oss << where << "[" << i << "]";
        const std::string at = oss.str();

        const json& item = arr.at(i);
        require_object(item, at);

        capture::Message m;
        m.role = require_role(item, at);
        m.content = require_string(item, "content", at);
        if (m.content.empty()) {
            throw std::runtime_error(at + ".content must not be empty");
        }
        out.push_back(std::move(m));
    }
    return out;
}

StoredTranscript stored_transcript_from_json(const json& j) {
    StoredTranscript st;
    try {
        require_object(j, "root");
        if (!j.contains("messages")) {
            throw std::runtime_error("root missing required field: messages");
        }
        st.messages = parse_messages(j.at("messages"), "root.messages");
        st.valid = true;
    } catch (const std::exception& e) {
        st.valid = false;
        st.messages.clear();
        st.error = e.what();
    }
    return st;
}

StoredTranscript parse_stored_transcript(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        StoredTranscript st;
        st.error = "failed to parse JSON";
        return st;
    }
    return stored_transcript_from_json(j);
}

static std::vector<capture::Fragment> parse_fragments(const json& arr, const std::string& where,
                                                      const char* text_key, const char* pos_key) {
    require_array(arr, where);

    std::vector<capture::Fragment> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream oss;
        oss << where << "[" << i << "]";
        const std::string at = oss.str();

        const json& item = arr.at(i);
        require_object(item, at);

        capture::Fragment f;
        f.role = require_role(item, at);
        f.text = require_string(item, text_key, at);
        // without a position, keep the order given
        f.position = optional_number(item, pos_key, at, static_cast<double>(i));
        out.push_back(std::move(f));
    }
    return out;
}

SnapshotFile parse_snapshot(const json& j) {
    require_object(j, "root");

    SnapshotFile snap;

    if (j.contains("fragments")) {
        if (j.contains("conversation")) snap.conversation = require_string(j, "conversation", "root");
        snap.fragments = parse_fragments(j.at("fragments"), "root.fragments", "text", "position");
        return snap;
    }

    // raw screen-capture output
    if (j.contains("found")) {
        if (!j.at("found").is_boolean()) throw std::runtime_error("root.found must be a boolean");
        snap.found = j.at("found").get<bool>();
    }
    if (j.contains("workbookName") && j.at("workbookName").is_string()) {
        snap.conversation = j.at("workbookName").get<std::string>();
    }
    if (j.contains("messages") && !j.at("messages").is_null()) {
        snap.fragments = parse_fragments(j.at("messages"), "root.messages", "content", "y");
    } else if (snap.found) {
        throw std::runtime_error("root missing required field: fragments");
    }
    return snap;
}

SnapshotFile load_snapshot_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open snapshot file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }

    return parse_snapshot(j);
}

bool extract_json_array(const std::string& text, std::string& out) {
    const auto a = text.find('[');
    const auto b = text.rfind(']');
    if (a == std::string::npos || b == std::string::npos || b <= a) return false;
    out = text.substr(a, b - a + 1);
    return true;
}

}  // namespace jsonio
