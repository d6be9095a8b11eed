#include "commands/summarize.hpp"

#include "commands/ArgUtil.hpp"
#include "io/JsonIO.hpp"
#include "llm/MockLLMClient.hpp"
#include "llm/OllamaLLMClient.hpp"
#include "store/SessionStore.hpp"
#include "summary/Summarizer.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static int summarize_usage() {
    std::cerr
        << "usage:\n"
        << "  transcript-keeper summarize --conversation <name> [options]\n"
        << "\n"
        << "options:\n"
        << "  --store <dir>                default: data/sessions\n"
        << "  --ratio <f>                  default: 0.3\n"
        << "  --iterations <n>             default: 50\n"
        << "  --damping <f>                default: 0.85\n"
        << "  --max_units <n>              default: 400 (0 = no cap)\n"
        << "  --out <path>                 optional: write JSON here instead of stdout\n"
        << "\n"
        << "llm (tried first, TextRank on failure):\n"
        << "  --llm_mock <dir>             canned replies from <dir>/<conversation>.json\n"
        << "  --llm_model <str>            use a local ollama model\n"
        << "  --llm_cache <dir>            default: data/llm_cache\n";
    return 1;
}

static void write_json(const fs::path& path, const nlohmann::json& j) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());
    out << j.dump(2) << "\n";
}

int cmd_summarize(int argc, char** argv) {
    using argutil::get_arg;

    if (argutil::has_flag(argc, argv, "--help")) return summarize_usage();

    const std::string conversation = get_arg(argc, argv, "--conversation", "");
    const std::string store_dir    = get_arg(argc, argv, "--store", "data/sessions");
    const std::string out_path     = get_arg(argc, argv, "--out", "");
    const std::string llm_mock     = get_arg(argc, argv, "--llm_mock", "");
    const std::string llm_model    = get_arg(argc, argv, "--llm_model", "");
    const std::string llm_cache    = get_arg(argc, argv, "--llm_cache", "data/llm_cache");

    if (conversation.empty()) {
        std::cerr << "error: missing --conversation\n";
        return summarize_usage();
    }

    summary::SummaryConfig cfg;
    cfg.ratio           = argutil::get_arg_double(argc, argv, "--ratio", cfg.ratio);
    cfg.rank.iterations = argutil::get_arg_int(argc, argv, "--iterations", cfg.rank.iterations);
    cfg.rank.damping    = argutil::get_arg_double(argc, argv, "--damping", cfg.rank.damping);

    const int max_units = argutil::get_arg_int(argc, argv, "--max_units", 400);
    cfg.max_units = max_units > 0 ? static_cast<size_t>(max_units) : 0;

    if (cfg.rank.iterations < 0) {
        std::cerr << "error: --iterations must not be negative\n";
        return 2;
    }
    if (cfg.rank.damping < 0.0 || cfg.rank.damping > 1.0) {
        std::cerr << "error: --damping must be within [0, 1]\n";
        return 2;
    }

    store::SessionStore sessions(store_dir);
    store::SessionRecord rec;
    std::string load_error;
    if (!sessions.load(conversation, rec, &load_error)) {
        std::cerr << "error: no session for '" << conversation << "' in " << store_dir << "\n";
        return 3;
    }
    if (!load_error.empty()) {
        std::cerr << "warning: stored history is unusable (" << load_error << ")\n";
    }

    std::unique_ptr<llm::LLMClient> client;
    if (!llm_mock.empty()) {
        client = std::make_unique<llm::MockLLMClient>(llm_mock);
    } else if (!llm_model.empty()) {
        client = std::make_unique<llm::OllamaLLMClient>(llm_model, llm_cache);
    }

    const summary::SummaryOutcome outcome =
        summary::summarize_with_fallback(client.get(), conversation, rec.messages, cfg);
    const summary::CompressionStats stats = summary::compression_stats(rec.messages, outcome.messages);

    if (client && outcome.strategy != "llm") {
        std::cerr << "warning: model summary unavailable, fell back to textrank\n";
    }

    nlohmann::json j;
    j["conversation"] = conversation;
    j["strategy"] = outcome.strategy;
    j["ratio"] = cfg.ratio;
    j["original_chars"] = stats.original_chars;
    j["compressed_chars"] = stats.compressed_chars;
    j["messages"] = jsonio::messages_to_json(outcome.messages);

    if (out_path.empty()) {
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    try {
        write_json(out_path, j);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 3;
    }

    std::cout << "[summary] " << conversation << ": " << stats.original_chars << " -> "
              << stats.compressed_chars << " chars (" << outcome.strategy << ")\n"
              << "[summary] wrote " << out_path << "\n";
    return 0;
}
