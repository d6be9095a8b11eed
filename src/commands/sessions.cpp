#include "commands/sessions.hpp"

#include "commands/ArgUtil.hpp"
#include "io/JsonIO.hpp"
#include "store/SessionStore.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <vector>

static int sessions_usage() {
    std::cerr
        << "usage:\n"
        << "  transcript-keeper list   [--store <dir>]\n"
        << "  transcript-keeper search --query <str> [--store <dir>]\n"
        << "  transcript-keeper show   (--conversation <name> | --id <id>) [--store <dir>]\n"
        << "  transcript-keeper delete --conversation <name> [--store <dir>]\n"
        << "  transcript-keeper clear  --yes [--store <dir>]\n";
    return 1;
}

static std::string store_dir(int argc, char** argv) {
    return argutil::get_arg(argc, argv, "--store", "data/sessions");
}

static void print_summaries(const std::vector<store::SessionSummary>& rows) {
    for (const auto& r : rows) {
        std::string preview = r.user_prompt_preview;
        for (char& c : preview) {
            if (c == '\n' || c == '\r') c = ' ';
        }
        std::cout << r.captured_at << "  " << r.conversation
                  << "  (" << r.message_count << " messages)  " << preview << "\n";
    }
    std::cout << rows.size() << " session(s)\n";
}

int cmd_list(int argc, char** argv) {
    if (argutil::has_flag(argc, argv, "--help")) return sessions_usage();

    try {
        store::SessionStore sessions(store_dir(argc, argv));
        print_summaries(sessions.list());
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 3;
    }
    return 0;
}

int cmd_search(int argc, char** argv) {
    if (argutil::has_flag(argc, argv, "--help")) return sessions_usage();

    const std::string query = argutil::get_arg(argc, argv, "--query", "");
    if (query.empty()) {
        std::cerr << "error: missing --query\n";
        return sessions_usage();
    }

    try {
        store::SessionStore sessions(store_dir(argc, argv));
        print_summaries(sessions.search(query));
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 3;
    }
    return 0;
}

int cmd_show(int argc, char** argv) {
    if (argutil::has_flag(argc, argv, "--help")) return sessions_usage();

    const std::string conversation = argutil::get_arg(argc, argv, "--conversation", "");
    const std::string id = argutil::get_arg(argc, argv, "--id", "");
    if (conversation.empty() && id.empty()) {
        std::cerr << "error: missing --conversation or --id\n";
        return sessions_usage();
    }

    store::SessionStore sessions(store_dir(argc, argv));
    store::SessionRecord rec;
    std::string load_error;
    if (!id.empty()) {
        if (!sessions.find_by_id(id, rec)) {
            std::cerr << "error: no session with id '" << id << "'\n";
            return 3;
        }
    } else if (!sessions.load(conversation, rec, &load_error)) {
        std::cerr << "error: no session for '" << conversation << "'\n";
        return 3;
    }
    if (!load_error.empty()) {
        std::cerr << "warning: stored history is unusable (" << load_error << ")\n";
    }

    std::cout << rec.to_json().dump(2) << "\n";
    return 0;
}

int cmd_delete(int argc, char** argv) {
    if (argutil::has_flag(argc, argv, "--help")) return sessions_usage();

    const std::string conversation = argutil::get_arg(argc, argv, "--conversation", "");
    if (conversation.empty()) {
        std::cerr << "error: missing --conversation\n";
        return sessions_usage();
    }

    store::SessionStore sessions(store_dir(argc, argv));
    if (!sessions.remove(conversation)) {
        std::cerr << "error: no session for '" << conversation << "'\n";
        return 3;
    }
    std::cout << "deleted " << conversation << "\n";
    return 0;
}

int cmd_clear(int argc, char** argv) {
    if (argutil::has_flag(argc, argv, "--help")) return sessions_usage();

    if (!argutil::has_flag(argc, argv, "--yes")) {
        std::cerr << "error: clear deletes every stored session, pass --yes to confirm\n";
        return 2;
    }

    try {
        store::SessionStore sessions(store_dir(argc, argv));
        const size_t removed = sessions.clear();
        std::cout << "deleted " << removed << " session(s)\n";
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 3;
    }
    return 0;
}
