#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "capture/Models.hpp"

namespace store {

struct SessionRecord {
    std::string id;
    std::string conversation;            // identity, e.g. the workbook name
    std::string captured_at;             // ISO-8601 UTC of the last accepted snapshot
    std::string model = "claude-for-excel";
    std::string snapshot_digest;         // last accepted snapshot digest
    std::vector<capture::Message> messages;

    // derived on save
    std::string user_prompt;             // first user message
    std::string assistant_response;      // assistant messages joined by a blank line

    nlohmann::json to_json() const;
};

struct SessionSummary {
    std::string id;
    std::string conversation;
    std::string captured_at;
    std::string model;
    size_t message_count = 0;
    std::string user_prompt_preview;     // first 200 characters
};

std::string now_iso8601();

// Fills user_prompt / assistant_response from messages.
void refresh_derived_fields(SessionRecord& rec);

// File-backed stand-in for the record store: one JSON file per conversation.
class SessionStore {
public:
    explicit SessionStore(const std::string& root_dir);

    std::filesystem::path path_for(const std::string& conversation) const;

    // false when there is no record. A record whose history does not validate
    // loads with an empty transcript and load_error set.
    bool load(const std::string& conversation, SessionRecord& out, std::string* load_error = nullptr) const;

    // Creates the directory as needed, assigns an id to new records. Throws on I/O failure.
    void save(SessionRecord& rec) const;

    bool remove(const std::string& conversation) const;

    // Deletes every record file; returns how many were removed.
    size_t clear() const;

    // Lookup by record id instead of conversation identity.
    bool find_by_id(const std::string& id, SessionRecord& out) const;

    // most recent first
    std::vector<SessionSummary> list() const;

    // case-insensitive substring match on user_prompt / assistant_response
    std::vector<SessionSummary> search(const std::string& query) const;

    size_t count() const;

private:
    std::filesystem::path root_;

    std::vector<SessionRecord> load_all() const;
};

}  // namespace store
