#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "capture/Models.hpp"

namespace jsonio {

nlohmann::json message_to_json(const capture::Message& m);
nlohmann::json messages_to_json(const std::vector<capture::Message>& messages);

// Strict: every item must be {"role": "user"|"assistant", "content": non-empty string}.
// Throws std::runtime_error naming the offending path (where[3].role ...).
std::vector<capture::Message> parse_messages(const nlohmann::json& arr, const std::string& where);

// Persisted history. Never throws: anything off-schema yields valid=false and no messages.
struct StoredTranscript {
    bool valid = false;
    std::vector<capture::Message> messages;
    std::string error;
};

StoredTranscript stored_transcript_from_json(const nlohmann::json& j);
StoredTranscript parse_stored_transcript(const std::string& body);

// Output of the screen capture.
struct SnapshotFile {
    std::string conversation;
    bool found = true;
    std::vector<capture::Fragment> fragments;
};

// Accepts {"conversation", "fragments":[{role,text,position}]} and the screen capture's
// raw {"found", "workbookName", "messages":[{role,content,y}]}. Throws on bad input.
SnapshotFile parse_snapshot(const nlohmann::json& j);
SnapshotFile load_snapshot_file(const std::string& path);

// Outermost [ ... ] span of a model reply; false when there is none.
bool extract_json_array(const std::string& text, std::string& out);

}  // namespace jsonio
