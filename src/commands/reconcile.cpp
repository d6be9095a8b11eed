#include "commands/reconcile.hpp"

#include "commands/ArgUtil.hpp"
#include "capture/Reconciler.hpp"
#include "io/JsonIO.hpp"
#include "store/SessionStore.hpp"

#include <iostream>
#include <string>
#include <utility>

static int reconcile_usage() {
    std::cerr
        << "usage:\n"
        << "  transcript-keeper reconcile --snapshot <file> [--store <dir>] [--conversation <name>] [--drop_ui_noise]\n";
    return 1;
}

int cmd_reconcile(int argc, char** argv) {
    using argutil::get_arg;

    if (argutil::has_flag(argc, argv, "--help")) return reconcile_usage();

    const std::string snapshot_path = get_arg(argc, argv, "--snapshot", "");
    const std::string store_dir     = get_arg(argc, argv, "--store", "data/sessions");
    std::string conversation        = get_arg(argc, argv, "--conversation", "");

    if (snapshot_path.empty()) {
        std::cerr << "error: missing --snapshot\n";
        return reconcile_usage();
    }

    jsonio::SnapshotFile snap;
    try {
        snap = jsonio::load_snapshot_file(snapshot_path);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 3;
    }

    if (!snap.found) {
        std::cout << "[capture] no conversation pane in snapshot, nothing to do\n";
        return 0;
    }

    if (conversation.empty()) conversation = snap.conversation;
    if (conversation.empty()) conversation = "Unknown";

    capture::ReconcileConfig cfg;
    cfg.normalizer.drop_ui_noise = argutil::has_flag(argc, argv, "--drop_ui_noise");

    store::SessionStore sessions(store_dir);
    store::SessionRecord rec;
    std::string load_error;
    const bool existed = sessions.load(conversation, rec, &load_error);
    if (!load_error.empty()) {
        std::cerr << "warning: stored history for '" << conversation
                  << "' is unusable, starting empty (" << load_error << ")\n";
    }
    rec.conversation = conversation;

    capture::ReconcileContext ctx(rec.snapshot_digest);
    const size_t existing_count = rec.messages.size();
    capture::ReconcileResult res = capture::reconcile(ctx, rec.messages, snap.fragments, cfg);

    if (!res.updated) {
        std::cout << "[capture] no update for " << conversation
                  << " (" << capture::status_str(res.status) << ")\n";
        return 0;
    }

    rec.messages = std::move(res.messages);
    rec.snapshot_digest = ctx.last_digest();
    rec.captured_at = store::now_iso8601();

    try {
        sessions.save(rec);
    } catch (const std::exception& e) {
        std::cerr << "error: failed to save session: " << e.what() << "\n";
        return 3;
    }

    if (res.status == capture::ReconcileStatus::Merged) {
        std::cout << "[capture] merging messages for: " << conversation << "\n"
                  << "[capture] existing: " << existing_count
                  << " + new: " << res.incoming_count
                  << " = final: " << rec.messages.size() << "\n";
    } else {
        std::cout << "[capture] new thread for: " << conversation << "\n"
                  << "[capture] messages: " << rec.messages.size() << "\n";
    }
    std::cout << "[capture] " << (existed ? "thread updated: " : "new thread created: ") << rec.id << "\n"
              << "[capture] wrote " << sessions.path_for(conversation).string() << "\n";
    return 0;
}
