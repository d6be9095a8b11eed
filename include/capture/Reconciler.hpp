#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "capture/Models.hpp"
#include "capture/Normalizer.hpp"

namespace capture {

struct ReconcileConfig {
    NormalizerConfig normalizer;
    size_t min_fragments = 2;        // a single fragment is never a conversation
};

enum class ReconcileStatus {
    Created,            // first accepted snapshot, becomes the canonical transcript
    Merged,             // merged into an existing transcript
    CaptureDisabled,
    TooFewFragments,
    MissingRolePair,    // no user or no assistant message after normalization
    Unchanged           // digest equals the last accepted one
};

const char* status_str(ReconcileStatus s);

struct ReconcileResult {
    bool updated = false;
    ReconcileStatus status = ReconcileStatus::Unchanged;
    std::vector<Message> messages;   // new transcript, or the existing one when not updated
    std::string digest;              // digest of the examined snapshot (empty if never computed)
    size_t incoming_count = 0;       // messages left after normalization
};

// Per-conversation capture state owned by the caller (poller, command).
class ReconcileContext {
public:
    ReconcileContext() = default;
    explicit ReconcileContext(const std::string& last_digest) : last_digest_(last_digest) {}

    void reset() {
        last_digest_.clear();
        enabled_ = true;
    }

    void reset_last_digest() { last_digest_.clear(); }

    void enable() { enabled_ = true; }
    void disable() { enabled_ = false; }

    bool enabled() const { return enabled_; }
    const std::string& last_digest() const { return last_digest_; }

    void accept(const std::string& digest) { last_digest_ = digest; }

private:
    std::string last_digest_;
    bool enabled_ = true;
};

// Orders fragments by screen position, normalizes them and computes the digest.
ConversationSnapshot build_snapshot(const std::vector<Fragment>& fragments,
                                    const NormalizerConfig& cfg = {});

bool has_role_pair(const std::vector<Message>& messages);

// Longer-wins merge keyed by fingerprint. Existing entries keep their position;
// unknown messages are appended in admission order. Without a fingerprint match,
// a same-role message that is a prefix of the last canonical entry is dropped,
// and one that extends the last canonical entry replaces it in place.
std::vector<Message> merge_messages(const std::vector<Message>& canonical,
                                    const std::vector<Message>& incoming);

// Gatekeeping + merge. Never throws; refusals are reported through status.
ReconcileResult reconcile(ReconcileContext& ctx,
                          const std::vector<Message>& existing,
                          const std::vector<Fragment>& fragments,
                          const ReconcileConfig& cfg = {});

}  // namespace capture
