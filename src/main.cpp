#include "config.hpp"
#include "exploration.hpp"
#include "memory_manager.hpp"
#include "shared_state.hpp"
#include "tool.hpp"
#include "util.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <cstring>
#include <vector>

static void print_usage() {
    std::cout << "Usage: engram <command> [args]\n"
              << "\n"
              << "Memory commands:\n"
              << "  stats                     Show tier counts\n"
              << "  reflect                   Reflect on stored memories\n"
              << "  consolidate               Consolidate episodes into long-term memory\n"
              << "  recall QUERY [-n N]       Search episodic, semantic and long-term memory\n"
              << "  remember TEXT [--tier T] [--importance X]\n"
              << "                            Store a memory (tier: episodic, semantic, longterm)\n"
              << "  purge DAYS                Delete faded memories older than DAYS days\n"
              << "  export                    Print a JSON snapshot of every tier\n"
              << "  tool NAME [JSON]          Run a memory tool with JSON arguments\n"
              << "\n"
              << "Exploration commands:\n"
              << "  threads [STATUS]          List threads (active, dormant, concluded)\n"
              << "  thread ID_OR_NAME         Show a thread and its path of inquiry\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help                Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  ENGRAM_MEMORY_BACKEND     Similarity backend (sqlite, json)\n"
              << "  ENGRAM_MEMORY_PATH        Memory database path\n"
              << "  ENGRAM_EXPLORATION_PATH   Exploration database path\n";
}

static std::unique_ptr<engram::MemoryManager> open_manager(const engram::Config& config) {
    auto shared = std::make_unique<engram::JsonFileSharedState>(config.shared_state_path());
    return std::make_unique<engram::MemoryManager>(config, std::move(shared));
}

static int cmd_recall(engram::MemoryManager& manager, const std::vector<std::string>& args) {
    std::string query;
    uint32_t n = 5;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "-n" && i + 1 < args.size()) {
            n = static_cast<uint32_t>(std::stoul(args[++i]));
        } else {
            if (!query.empty()) query += ' ';
            query += args[i];
        }
    }
    if (query.empty()) {
        std::cerr << "recall: missing QUERY\n";
        return 1;
    }

    auto entries = manager.recall(query, n, {}, false);
    if (entries.empty()) {
        std::cout << "No memories found for '" << query << "'\n";
        return 0;
    }
    for (const auto& e : entries) {
        std::cout << "[" << engram::tier_to_string(e.tier) << "] " << e.content
                  << "  (" << e.id << ", importance " << e.effective_importance() << ")\n";
    }
    return 0;
}

static int cmd_remember(engram::MemoryManager& manager, const std::vector<std::string>& args) {
    engram::MemoryInput input;
    input.source = "cli";
    engram::Tier tier = engram::Tier::Semantic;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--tier" && i + 1 < args.size()) {
            tier = engram::tier_from_string(args[++i]);
        } else if (args[i] == "--importance" && i + 1 < args.size()) {
            input.importance = std::stod(args[++i]);
        } else {
            if (!input.content.empty()) input.content += ' ';
            input.content += args[i];
        }
    }
    if (input.content.empty()) {
        std::cerr << "remember: missing TEXT\n";
        return 1;
    }

    auto entry = manager.remember(input, tier);
    std::cout << "Stored " << engram::tier_to_string(entry.tier) << " memory " << entry.id << "\n";
    return 0;
}

static int cmd_tool(engram::MemoryManager& manager, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "tool: missing NAME\n";
        return 1;
    }
    std::string args_json = args.size() > 1 ? args[1] : "{}";

    auto tools = engram::create_memory_tools(&manager);
    for (auto& tool : tools) {
        if (tool->tool_name() != args[0]) continue;
        auto result = tool->execute(args_json);
        (result.success ? std::cout : std::cerr) << result.output << "\n";
        return result.success ? 0 : 1;
    }

    std::cerr << "Unknown tool: " << args[0] << "\nAvailable:";
    for (const auto& tool : tools) std::cerr << " " << tool->tool_name();
    std::cerr << "\n";
    return 1;
}

static int cmd_threads(const engram::Config& config, const std::vector<std::string>& args) {
    engram::ExplorationTracker tracker(config.exploration_path(), nullptr,
        engram::lookup_policy_from_string(config.exploration.lookup_policy));

    std::optional<engram::ThreadStatus> status;
    if (!args.empty()) status = engram::thread_status_from_string(args[0]);

    auto threads = tracker.list_threads(status, 20);
    if (threads.empty()) {
        std::cout << "No threads.\n";
        return 0;
    }
    for (const auto& t : threads) {
        std::cout << t.name << "  [" << engram::thread_status_to_string(t.status)
                  << ", depth " << t.depth << "]  " << t.question << "\n";
    }

    auto stats = tracker.get_stats();
    std::cout << "\n" << stats.total_threads << " threads, " << stats.total_links
              << " links, average depth " << stats.average_depth << "\n";
    return 0;
}

static int cmd_thread(const engram::Config& config, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "thread: missing ID_OR_NAME\n";
        return 1;
    }
    engram::ExplorationTracker tracker(config.exploration_path());
    auto ctx = tracker.get_thread_context(args[0], false);
    std::cout << ctx.narrative << "\n";
    return 0;
}

int main(int argc, char* argv[]) try {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        print_usage();
        return 0;
    }
    std::vector<std::string> args(argv + 2, argv + argc);

    auto config = engram::Config::load();

    if (command == "threads") return cmd_threads(config, args);
    if (command == "thread") return cmd_thread(config, args);

    if (command != "stats" && command != "reflect" && command != "consolidate" &&
        command != "recall" && command != "remember" && command != "purge" &&
        command != "export" && command != "tool") {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
        return 1;
    }

    auto manager = open_manager(config);

    if (command == "stats") {
        std::cout << manager->get_stats().to_json().dump(2) << "\n";
    } else if (command == "reflect") {
        auto r = manager->reflect();
        std::cout << r.summary << "\n";
    } else if (command == "consolidate") {
        auto report = manager->consolidate_memories();
        std::cout << report.to_json().dump(2) << "\n";
    } else if (command == "recall") {
        return cmd_recall(*manager, args);
    } else if (command == "remember") {
        return cmd_remember(*manager, args);
    } else if (command == "purge") {
        if (args.empty()) {
            std::cerr << "purge: missing DAYS\n";
            return 1;
        }
        uint64_t days = std::stoull(args[0]);
        uint32_t removed = manager->purge(engram::days_to_seconds(days));
        std::cout << "Purged " << removed << " memories\n";
    } else if (command == "export") {
        std::cout << manager->export_snapshot().dump(2) << "\n";
    } else if (command == "tool") {
        return cmd_tool(*manager, args);
    }
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
}
