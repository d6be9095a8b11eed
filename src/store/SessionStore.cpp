#include "store/SessionStore.hpp"

#include "capture/Fingerprint.hpp"
#include "io/JsonIO.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace store {

static const size_t kPreviewChars = 200;

static std::string string_field(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string()) return "";
    return j.at(key).get<std::string>();
}

static std::string sanitize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        const bool keep =
            (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
            (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
        out.push_back(keep ? static_cast<char>(c) : '_');
    }
    if (out.size() > 64) out.resize(64);
    return out;
}

static SessionSummary summarize_record(const SessionRecord& r) {
    SessionSummary s;
    s.id = r.id;
    s.conversation = r.conversation;
    s.captured_at = r.captured_at;
    s.model = r.model;
    s.message_count = r.messages.size();
    s.user_prompt_preview = textutil::utf8_prefix(r.user_prompt, kPreviewChars);
    return s;
}

// Fields are taken as-is when present; the transcript itself is schema-checked.
static SessionRecord record_from_json(const json& j, std::string& history_error) {
    SessionRecord r;
    r.id = string_field(j, "id");
    r.conversation = string_field(j, "conversation");
    r.captured_at = string_field(j, "captured_at");
    r.model = string_field(j, "model");
    r.snapshot_digest = string_field(j, "snapshot_digest");
    r.user_prompt = string_field(j, "user_prompt");
    r.assistant_response = string_field(j, "assistant_response");

    jsonio::StoredTranscript st = jsonio::stored_transcript_from_json(j);
    if (st.valid) {
        r.messages = std::move(st.messages);
    } else {
        history_error = st.error;
    }
    return r;
}

std::string now_iso8601() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);

    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

void refresh_derived_fields(SessionRecord& rec) {
    rec.user_prompt.clear();
    rec.assistant_response.clear();

    for (const auto& m : rec.messages) {
        if (m.role == capture::Role::User) {
            if (rec.user_prompt.empty()) rec.user_prompt = m.content;
        } else {
            if (!rec.assistant_response.empty()) rec.assistant_response += "\n\n";
            rec.assistant_response += m.content;
        }
    }
}

json SessionRecord::to_json() const {
    json j;
    j["id"] = id;
    j["conversation"] = conversation;
    j["captured_at"] = captured_at;
    j["model"] = model;
    j["snapshot_digest"] = snapshot_digest;
    j["user_prompt"] = user_prompt;
    j["assistant_response"] = assistant_response;
    j["messages"] = jsonio::messages_to_json(messages);
    return j;
}

SessionStore::SessionStore(const std::string& root_dir) : root_(root_dir) {}

fs::path SessionStore::path_for(const std::string& conversation) const {
    // the hash keeps "a/b" and "a_b" apart after sanitizing
    return root_ / (sanitize(conversation) + "-" + capture::rolling_hash(conversation) + ".json");
}

bool SessionStore::load(const std::string& conversation, SessionRecord& out, std::string* load_error) const {
    const fs::path p = path_for(conversation);
    std::ifstream in(p);
    if (!in) return false;

    std::ostringstream ss;
    ss << in.rdbuf();

    std::string err;
    json j = json::parse(ss.str(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        out = SessionRecord{};
        out.conversation = conversation;
        err = "failed to parse JSON: " + p.string();
    } else {
        out = record_from_json(j, err);
        if (out.conversation.empty()) out.conversation = conversation;
    }

    if (load_error) *load_error = err;
    return true;
}

void SessionStore::save(SessionRecord& rec) const {
    if (rec.conversation.empty()) {
        throw std::runtime_error("session record has no conversation identity");
    }

    fs::create_directories(root_);

    if (rec.id.empty()) {
        const auto ticks = std::chrono::system_clock::now().time_since_epoch().count();
        rec.id = capture::rolling_hash(rec.conversation) + "-" + std::to_string(ticks);
    }
    if (rec.captured_at.empty()) rec.captured_at = now_iso8601();
    refresh_derived_fields(rec);

    const fs::path p = path_for(rec.conversation);
    const fs::path tmp = p.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to open output file: " + tmp.string());
        out << rec.to_json().dump(2) << "\n";
        if (!out) throw std::runtime_error("Failed to write output file: " + tmp.string());
    }
    fs::rename(tmp, p);
}

bool SessionStore::remove(const std::string& conversation) const {
    std::error_code ec;
    return fs::remove(path_for(conversation), ec);
}

size_t SessionStore::clear() const {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return 0;

    std::vector<fs::path> doomed;
    for (const auto& entry : fs::directory_iterator(root_)) {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension() != ".json") continue;
        doomed.push_back(entry.path());
    }

    size_t removed = 0;
    for (const auto& p : doomed) {
        if (fs::remove(p, ec)) ++removed;
        else if (ec) std::cerr << "warning: could not remove " << p.string() << ": " << ec.message() << "\n";
    }
    return removed;
}

bool SessionStore::find_by_id(const std::string& id, SessionRecord& out) const {
    if (id.empty()) return false;
    for (auto& r : load_all()) {
        if (r.id == id) {
            out = std::move(r);
            return true;
        }
    }
    return false;
}

std::vector<SessionRecord> SessionStore::load_all() const {
    std::vector<SessionRecord> out;

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return out;

    for (const auto& entry : fs::directory_iterator(root_)) {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension() != ".json") continue;

        std::ifstream in(entry.path());
        if (!in) continue;
        std::ostringstream ss;
        ss << in.rdbuf();

        json j = json::parse(ss.str(), nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            std::cerr << "warning: skipping unreadable record " << entry.path().string() << "\n";
            continue;
        }

        std::string err;
        out.push_back(record_from_json(j, err));
    }

    std::sort(out.begin(), out.end(), [](const SessionRecord& a, const SessionRecord& b) {
        if (a.captured_at != b.captured_at) return a.captured_at > b.captured_at;
        return a.conversation < b.conversation;
    });
    return out;
}

std::vector<SessionSummary> SessionStore::list() const {
    std::vector<SessionSummary> out;
    for (const auto& r : load_all()) out.push_back(summarize_record(r));
    return out;
}

std::vector<SessionSummary> SessionStore::search(const std::string& query) const {
    const std::string q = textutil::to_lower_copy(query);

    std::vector<SessionSummary> out;
    for (const auto& r : load_all()) {
        const bool hit =
            textutil::to_lower_copy(r.user_prompt).find(q) != std::string::npos ||
            textutil::to_lower_copy(r.assistant_response).find(q) != std::string::npos;
        if (hit) out.push_back(summarize_record(r));
    }
    return out;
}

size_t SessionStore::count() const {
    return load_all().size();
}

}  // namespace store
