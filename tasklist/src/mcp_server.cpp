// Tasklist MCP Server
// Model Context Protocol server exposing a todo list as tools
//
// Speaks newline-delimited JSON-RPC 2.0 on stdin/stdout. All diagnostics
// go to stderr. Tasks live in memory and are gone when the process exits.
//
// Usage:
//   tasklist_mcp [options]
//
// Options:
//   --workers N   Concurrent request workers (default: 4)
//   --verbose     Debug logging
//   --quiet       Errors only
//   --version     Print version and exit
//
// Environment:
//   TASKLIST_LOG      error|warn|info|debug (default: info)
//   TASKLIST_WORKERS  Same as --workers; the flag wins

#include <tasklist/mcp.hpp>
#include <tasklist/version.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <unistd.h>

void signal_handler(int sig) {
    (void)sig;
    // Nothing to save: state is memory-only by contract
    static const char msg[] = "[tasklist] Signal received, exiting\n";
    ssize_t n = write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)n;
    std::_Exit(0);
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --workers N   Concurrent request workers (default: 4)\n"
              << "  --verbose     Debug logging\n"
              << "  --quiet       Errors only\n"
              << "  --version     Print version and exit\n"
              << "  --help        Show this help message\n"
              << "\n"
              << "Environment:\n"
              << "  TASKLIST_LOG      error|warn|info|debug (default: info)\n"
              << "  TASKLIST_WORKERS  Worker count; --workers overrides it\n";
}

// Positive integer or 0 on anything else
size_t parse_worker_count(const char* s) {
    if (s == nullptr || *s == '\0') return 0;
    char* end = nullptr;
    long value = std::strtol(s, &end, 10);
    if (*end != '\0' || value <= 0 || value > 1024) return 0;
    return static_cast<size_t>(value);
}

int main(int argc, char* argv[]) {
    tasklist::ServerOptions options;

    // Environment first, flags override
    if (const char* env_level = std::getenv("TASKLIST_LOG")) {
        tasklist::LogLevel level = tasklist::LogLevel::Info;
        if (tasklist::parse_log_level(env_level, level)) {
            tasklist::set_log_level(level);
        } else {
            std::cerr << "[tasklist] Ignoring unknown TASKLIST_LOG value: " << env_level << "\n";
        }
    }
    if (const char* env_workers = std::getenv("TASKLIST_WORKERS")) {
        size_t n = parse_worker_count(env_workers);
        if (n > 0) {
            options.workers = n;
        } else {
            std::cerr << "[tasklist] Ignoring invalid TASKLIST_WORKERS value: " << env_workers << "\n";
        }
    }

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            size_t n = parse_worker_count(argv[++i]);
            if (n == 0) {
                std::cerr << "Invalid worker count: " << argv[i] << "\n";
                return 1;
            }
            options.workers = n;
        } else if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
            tasklist::set_log_level(tasklist::LogLevel::Debug);
        } else if (std::strcmp(argv[i], "--quiet") == 0 || std::strcmp(argv[i], "-q") == 0) {
            tasklist::set_log_level(tasklist::LogLevel::Error);
        } else if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << TASKLIST_SERVER_NAME << " " << TASKLIST_VERSION << "\n";
            return 0;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);

    tasklist::log_info("main", "Starting MCP Todo Server...");

    auto store = std::make_shared<tasklist::TaskStore>();
    tasklist::MCPServer server(store, options);

    tasklist::log_info("main", "Service started, waiting for requests...");
    server.run();

    tasklist::log_info("main", "Service stopped (%zu requests, %zu todos)",
                       server.requests_handled(), store->size());
    return 0;
}
