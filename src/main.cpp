#include "config.hpp"
#include "logger.hpp"
#include "http_server.hpp"

#include <spdlog/spdlog.h>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <filesystem>
#include <iostream>

// ─── Global shutdown flag ─────────────────────────────────────────────────────
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static void print_banner(const qh::AppConfig& cfg) {
    spdlog::info("quiche-httpd v{}", APP_VERSION);
    spdlog::info("Configuration:");
    spdlog::info("  Bind address    : {}", cfg.server.bind_address);
    spdlog::info("  Port            : {}", cfg.server.port);
    spdlog::info("  Document root   : {}", cfg.server.doc_root);
    spdlog::info("  Default file    : {}", cfg.server.default_file);
    spdlog::info("  Connections     : {}",
                 cfg.server.thread_per_connection ? "thread per connection" : "sequential");
    spdlog::info("  Log level       : {}", cfg.logging.level);
}

int main(int argc, char* argv[]) {
    // ─── Parse arguments ──────────────────────────────────────────────────────
    std::string config_path = "config.yaml";
    bool config_given = false;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
            config_given = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: quiche-httpd [options]\n"
                      << "Options:\n"
                      << "  -c, --config <path>    Config file (default: config.yaml)\n"
                      << "  -h, --help             Show this help\n"
                      << "\nEnvironment variables:\n"
                      << "  HTTP_PORT              Listening port\n"
                      << "  DOC_ROOT               Directory files are served from\n"
                      << "  LOG_LEVEL              Log level (trace/debug/info/warn/error)\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << " (try --help)" << std::endl;
            return 1;
        }
    }

    // ─── Load configuration ───────────────────────────────────────────────────
    qh::AppConfig config;
    try {
        if (config_given || std::filesystem::exists(config_path)) {
            config = qh::load_config(config_path);
        } else {
            config = qh::default_config();
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // ─── Initialize logger ────────────────────────────────────────────────────
    try {
        qh::init_logger(config.logging);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "ERROR: Failed to open log file: " << e.what() << std::endl;
        return 1;
    }
    print_banner(config);

    // ─── Signal handling ──────────────────────────────────────────────────────
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    qh::HttpServer http_server(config.server);
    if (!http_server.start()) {
        spdlog::critical("Failed to start HTTP server on port {}", config.server.port);
        return 1;
    }

    while (!g_shutdown.load() && http_server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    int exit_code = 0;
    if (!g_shutdown.load()) {
        spdlog::critical("HTTP server stopped accepting connections");
        exit_code = 1;
    }

    // ─── Graceful shutdown ────────────────────────────────────────────────────
    spdlog::info("Shutting down...");
    http_server.stop();
    spdlog::info("Shutdown complete.");

    return exit_code;
}
