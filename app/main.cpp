#include "commands/reconcile.hpp"
#include "commands/sessions.hpp"
#include "commands/summarize.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  transcript-keeper reconcile --snapshot <file> [args]\n"
        << "  transcript-keeper summarize --conversation <name> [args]\n"
        << "  transcript-keeper list [--store <dir>]\n"
        << "  transcript-keeper search --query <str> [--store <dir>]\n"
        << "  transcript-keeper show (--conversation <name> | --id <id>) [--store <dir>]\n"
        << "  transcript-keeper delete --conversation <name> [--store <dir>]\n"
        << "  transcript-keeper clear --yes [--store <dir>]\n"
        << "  transcript-keeper help\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        return print_usage();
    }

    if (cmd == "reconcile") return cmd_reconcile(argc - 1, argv + 1);
    if (cmd == "summarize") return cmd_summarize(argc - 1, argv + 1);
    if (cmd == "list")      return cmd_list(argc - 1, argv + 1);
    if (cmd == "search")    return cmd_search(argc - 1, argv + 1);
    if (cmd == "show")      return cmd_show(argc - 1, argv + 1);
    if (cmd == "delete")    return cmd_delete(argc - 1, argv + 1);
    if (cmd == "clear")     return cmd_clear(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
