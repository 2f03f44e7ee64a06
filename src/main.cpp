#include "config.hpp"
#include "consolidation.hpp"
#include "embedder.hpp"
#include "http.hpp"
#include "sanitizer.hpp"
#include "util.hpp"
#include "vault.hpp"
#include "memory/record_json.hpp"
#include "memory/vector_store.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <ctime>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: memvault <command> [args] [options]\n"
              << "\n"
              << "Commands:\n"
              << "  save TEXT            Save a memory (--category C, --importance X)\n"
              << "  list                 List active memories (--category C, --limit N)\n"
              << "  search QUERY         Search memories (--limit N)\n"
              << "  stats                Show memory counts\n"
              << "  consolidate          Merge aged near-duplicate memories now\n"
              << "  export               Print all memories as JSON\n"
              << "  import FILE          Import memories from a JSON file\n"
              << "  forget ID            Delete a memory by id\n"
              << "  forget-query QUERY   Delete the memory closest to QUERY\n"
              << "  context PROMPT       Print the recall block for PROMPT\n"
              << "  capture FILE         Auto-capture from a JSON array of {role, content}\n"
              << "  serve                Run scheduled consolidation until interrupted\n"
              << "\n"
              << "Options:\n"
              << "  --db PATH            Database path (default from config)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENAI_API_KEY              API key for embeddings\n"
              << "  MEMVAULT_DB_PATH            Database path\n"
              << "  MEMVAULT_EMBEDDING_BASE_URL Embedding API base URL\n"
              << "  MEMVAULT_EMBEDDING_MODEL    Embedding model\n";
}

struct CliArgs {
    std::string command;
    std::vector<std::string> positional;
    std::optional<memvault::MemoryCategory> category;
    std::optional<double> importance;
    std::optional<uint32_t> limit;
    std::string db_path;
};

static std::string format_date(uint64_t epoch_ms) {
    std::time_t t = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

static std::string short_id(const std::string& id) {
    return id.substr(0, 8);
}

static int run_command(const CliArgs& args, const memvault::Config& config,
                       memvault::SqliteVectorStore& store, memvault::Embedder* embedder) {
    memvault::PatternSanitizer sanitizer;
    memvault::VaultOptions opts;
    opts.capture_max_chars = config.capture_max_chars;
    opts.recall_limit = config.recall_limit;
    memvault::Vault vault(store, embedder, sanitizer, opts);

    const std::string& cmd = args.command;
    auto need_arg = [&args](const char* what) -> const std::string& {
        if (args.positional.empty()) {
            throw std::invalid_argument(std::string("missing ") + what);
        }
        return args.positional.front();
    };

    if (cmd == "save") {
        memvault::SaveOptions save_opts;
        save_opts.category = args.category;
        save_opts.importance = args.importance;
        auto result = vault.save(need_arg("TEXT"), save_opts);
        switch (result.status) {
            case memvault::SaveStatus::Saved:
                std::cout << "Saved to memory [" << memvault::category_to_string(result.record->category)
                          << "] " << result.record->id << ": "
                          << memvault::preview(result.record->text, 120) << "\n";
                return 0;
            case memvault::SaveStatus::Duplicate:
                std::cout << "Memory already exists ("
                          << static_cast<int>(result.duplicate_of->similarity * 100 + 0.5)
                          << "% match): " << memvault::preview(result.duplicate_of->record.text, 100)
                          << "\n";
                return 0;
            case memvault::SaveStatus::Flagged:
                std::cout << "Memory rejected: content flagged by safety filter.\n";
                return 1;
            case memvault::SaveStatus::Invalid:
                std::cout << "Memory rejected: text too short, too long, or mostly code.\n";
                return 1;
        }
        return 1;
    }

    if (cmd == "list") {
        auto rows = vault.list(args.limit.value_or(20), args.category);
        if (rows.empty()) {
            std::cout << "No memories found.\n";
            return 0;
        }
        for (const auto& r : rows) {
            std::cout << "[" << short_id(r.id) << "] [" << memvault::category_to_string(r.category)
                      << "] " << memvault::preview(r.text, 80) << " (" << format_date(r.created_at)
                      << ")\n";
        }
        return 0;
    }

    if (cmd == "search") {
        memvault::RecallFilter filter;
        filter.category = args.category;
        auto results = vault.recall(need_arg("QUERY"), args.limit.value_or(config.recall_limit),
                                    filter);
        if (results.empty()) {
            std::cout << "No matches.\n";
            return 0;
        }
        for (const auto& r : results) {
            std::cout << "[" << short_id(r.record.id) << "] ["
                      << memvault::category_to_string(r.record.category) << "] "
                      << static_cast<int>(r.score * 100 + 0.5) << "% - "
                      << memvault::preview(r.record.text, 80) << "\n";
        }
        return 0;
    }

    if (cmd == "stats") {
        auto s = vault.stats();
        std::cout << "Total: " << s.total << "  Active: " << s.active
                  << "  Consolidated: " << s.consolidated << "\n";
        for (const auto& [cat, count] : s.categories) {
            std::cout << "  " << cat << ": " << count << "\n";
        }
        if (store.dimension() > 0) {
            std::cout << "Dimensions: " << store.dimension() << "\n";
        }
        return 0;
    }

    if (cmd == "consolidate") {
        if (!embedder) throw memvault::EmbedderNotConfiguredError();
        std::cout << "Running consolidation...\n";
        uint32_t merged = memvault::run_consolidation(store, *embedder);
        std::cout << "Done. Merged " << merged << " cluster(s).\n";
        return 0;
    }

    if (cmd == "export") {
        std::cout << vault.export_json().dump(2) << "\n";
        return 0;
    }

    if (cmd == "import") {
        auto data = nlohmann::json::parse(memvault::read_file(need_arg("FILE")));
        uint32_t count = vault.import_json(data);
        std::cout << "Imported " << count << " memories.\n";
        return 0;
    }

    if (cmd == "forget") {
        bool deleted = vault.forget(need_arg("ID"));
        std::cout << (deleted ? "Deleted.\n" : "Not found.\n");
        return deleted ? 0 : 1;
    }

    if (cmd == "forget-query") {
        auto match = vault.forget_by_query(need_arg("QUERY"));
        if (!match) {
            std::cout << "No matching memory found.\n";
            return 1;
        }
        std::cout << "Deleted memory " << match->id << ": " << memvault::preview(match->text, 100)
                  << "\n";
        return 0;
    }

    if (cmd == "context") {
        if (!config.auto_recall) return 0;
        std::string block = vault.recall_context(need_arg("PROMPT"));
        if (!block.empty()) std::cout << block << "\n";
        return 0;
    }

    if (cmd == "capture") {
        if (!config.auto_capture) {
            std::cout << "Auto-capture is disabled.\n";
            return 0;
        }
        auto data = nlohmann::json::parse(memvault::read_file(need_arg("FILE")));
        std::vector<memvault::ChatMessage> messages;
        for (const auto& m : data) {
            if (!m.is_object()) continue;
            messages.push_back({memvault::json_string_or(m, "role", ""),
                                memvault::json_string_or(m, "content", "")});
        }
        std::cout << "Captured " << vault.auto_capture(messages) << " memories.\n";
        return 0;
    }

    if (cmd == "serve") {
        if (!embedder) throw memvault::EmbedderNotConfiguredError();
        if (!config.consolidation.enabled) {
            std::cerr << "Consolidation is disabled in config.\n";
            return 1;
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        memvault::http_set_abort_flag(&g_shutdown);

        memvault::ConsolidationScheduler scheduler(
            [&store, embedder]() { return memvault::run_consolidation(store, *embedder); },
            std::chrono::minutes(config.consolidation.interval_minutes));
        scheduler.start();
        std::cerr << "[consolidation] Scheduled every "
                  << config.consolidation.interval_minutes << "m\n";

        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        scheduler.stop();
        std::cerr << "[consolidation] Stopped after " << scheduler.completed_runs()
                  << " run(s)\n";
        return 0;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    print_usage();
    return 1;
}

int main(int argc, char* argv[]) try {
    CliArgs args;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--category") == 0 && i + 1 < argc) {
            std::string cat = argv[++i];
            if (!memvault::is_known_category(cat)) {
                std::cerr << "Unknown category: " << cat << "\n";
                return 1;
            }
            args.category = memvault::category_from_string(cat);
        } else if (std::strcmp(argv[i], "--importance") == 0 && i + 1 < argc) {
            args.importance = std::stod(argv[++i]);
        } else if (std::strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
            args.limit = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (std::strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            args.db_path = argv[++i];
        } else if (argv[i][0] == '-' && argv[i][1] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else if (args.command.empty()) {
            args.command = argv[i];
        } else {
            args.positional.push_back(argv[i]);
        }
    }

    if (args.command.empty()) {
        print_usage();
        return 1;
    }

    // Initialize
    memvault::http_init();
    auto config = memvault::Config::load();
    if (!args.db_path.empty()) {
        config.db_path = memvault::expand_home(args.db_path);
    }

    memvault::CurlHttpClient http_client;
    auto embedder = memvault::create_embedder(config, http_client);

    int rc = 1;
    try {
        memvault::SqliteVectorStore store(config.db_path);
        rc = run_command(args, config, store, embedder.get());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        rc = 1;
    }

    memvault::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
