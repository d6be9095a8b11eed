#include "capture/Reconciler.hpp"
#include "capture/Fingerprint.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>

namespace capture {

const char* status_str(ReconcileStatus s) {
    switch (s) {
        case ReconcileStatus::Created: return "created";
        case ReconcileStatus::Merged: return "merged";
        case ReconcileStatus::CaptureDisabled: return "capture_disabled";
        case ReconcileStatus::TooFewFragments: return "too_few_fragments";
        case ReconcileStatus::MissingRolePair: return "missing_role_pair";
        case ReconcileStatus::Unchanged: return "unchanged";
        default: return "unknown";
    }
}

ConversationSnapshot build_snapshot(const std::vector<Fragment>& fragments,
                                    const NormalizerConfig& cfg) {
    std::vector<Fragment> ordered = fragments;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const Fragment& a, const Fragment& b) { return a.position < b.position; });

    ConversationSnapshot snap;
    snap.digest = snapshot_digest(ordered);
    snap.messages.reserve(ordered.size());

    for (const auto& f : ordered) {
        std::string content;
        if (!normalize_fragment(f.text, content, cfg)) continue;
        snap.messages.push_back(Message{f.role, std::move(content)});
    }

    return snap;
}

bool has_role_pair(const std::vector<Message>& messages) {
    bool user = false;
    bool assistant = false;
    for (const auto& m : messages) {
        if (m.role == Role::User) user = true;
        else if (m.role == Role::Assistant) assistant = true;
    }
    return user && assistant;
}

// lower-cased, trimmed form used for identity comparisons
static std::string identity_form(const std::string& content) {
    return textutil::trim_copy(textutil::to_lower_copy(content));
}

static bool is_prefix(const std::string& head, const std::string& whole) {
    return head.size() <= whole.size() && whole.compare(0, head.size(), head) == 0;
}

std::vector<Message> merge_messages(const std::vector<Message>& canonical,
                                    const std::vector<Message>& incoming) {
    if (canonical.empty()) return incoming;

    std::vector<Message> result = canonical;
    const size_t known = canonical.size();

    // fingerprint -> position of the longest entry (earliest on ties)
    std::unordered_map<std::string, size_t> index;
    index.reserve(result.size() * 2 + 8);
    for (size_t i = 0; i < known; ++i) {
        const std::string fp = fingerprint(result[i].content);
        auto it = index.find(fp);
        if (it == index.end()) {
            index.emplace(fp, i);
        } else if (result[i].content.size() > result[it->second].content.size()) {
            it->second = i;
        }
    }

    for (const auto& m : incoming) {
        const std::string fp = fingerprint(m.content);
        auto it = index.find(fp);
        if (it != index.end()) {
            Message& entry = result[it->second];
            if (entry.content.size() < m.content.size()) entry = m;
            continue;
        }

        // Below the fingerprint prefix length a reply that is still streaming
        // changes fingerprint as it grows. Only the canonical tail can be such
        // a reply; anything else is a new message.
        const Message& tail = result[known - 1];
        if (tail.role == m.role) {
            const std::string form = identity_form(m.content);
            const std::string tail_form = identity_form(tail.content);

            if (is_prefix(form, tail_form)) continue;   // stale partial capture

            if (is_prefix(tail_form, form)) {
                result[known - 1] = m;
                index[fp] = known - 1;
                continue;
            }
        }

        result.push_back(m);
    }

    return result;
}

ReconcileResult reconcile(ReconcileContext& ctx,
                          const std::vector<Message>& existing,
                          const std::vector<Fragment>& fragments,
                          const ReconcileConfig& cfg) {
    ReconcileResult res;
    res.messages = existing;

    if (!ctx.enabled()) {
        res.status = ReconcileStatus::CaptureDisabled;
        return res;
    }

    if (fragments.size() < cfg.min_fragments) {
        res.status = ReconcileStatus::TooFewFragments;
        return res;
    }

    ConversationSnapshot snap = build_snapshot(fragments, cfg.normalizer);
    res.digest = snap.digest;
    res.incoming_count = snap.messages.size();

    if (!has_role_pair(snap.messages)) {
        res.status = ReconcileStatus::MissingRolePair;
        return res;
    }

    if (snap.digest == ctx.last_digest()) {
        res.status = ReconcileStatus::Unchanged;
        return res;
    }

    ctx.accept(snap.digest);

    if (existing.empty()) {
        res.status = ReconcileStatus::Created;
        res.messages = std::move(snap.messages);
    } else {
        res.status = ReconcileStatus::Merged;
        res.messages = merge_messages(existing, snap.messages);
    }
    res.updated = true;
    return res;
}

}  // namespace capture
