#pragma once

#include <string>
#include <cstdint>

namespace qh {

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 7777;           // 0 = pick an ephemeral port
    std::string doc_root = ".";
    std::string default_file = "/xd.html";  // served for "/"
    int backlog = 16;
    bool thread_per_connection = false;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    std::string access_file;        // one line per request; empty = console only
    int max_file_size_mb = 10;
    int max_files = 3;
};

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
};

// Load configuration from YAML file, with environment variable overrides
AppConfig load_config(const std::string& path);

// Built-in defaults, with environment variable overrides
AppConfig default_config();

} // namespace qh
