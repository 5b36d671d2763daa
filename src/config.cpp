#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <stdexcept>

namespace qh {

static std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

static uint16_t env_port_or(const char* name, uint16_t fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;

    std::string text(val);
    size_t used = 0;
    long port = -1;
    try {
        port = std::stol(text, &used);
    } catch (const std::logic_error&) {
        throw std::runtime_error(std::string(name) + " is not a number: '" + text + "'");
    }
    if (used != text.size()) {
        throw std::runtime_error(std::string(name) + " is not a number: '" + text + "'");
    }
    if (port < 0 || port > 65535) {
        throw std::runtime_error(std::string(name) + " out of range: " + text);
    }
    return static_cast<uint16_t>(port);
}

static void apply_env_overrides(AppConfig& cfg) {
    cfg.server.port = env_port_or("HTTP_PORT", cfg.server.port);
    cfg.server.doc_root = env_or("DOC_ROOT", cfg.server.doc_root);
    cfg.logging.level = env_or("LOG_LEVEL", cfg.logging.level);
}

AppConfig load_config(const std::string& path) {
    AppConfig cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config: " + std::string(e.what()));
    }

    try {
        // Server
        if (auto s = root["server"]) {
            cfg.server.bind_address = s["bind_address"].as<std::string>(cfg.server.bind_address);
            cfg.server.port = s["port"].as<uint16_t>(cfg.server.port);
            cfg.server.doc_root = s["doc_root"].as<std::string>(cfg.server.doc_root);
            cfg.server.default_file = s["default_file"].as<std::string>(cfg.server.default_file);
            cfg.server.backlog = s["backlog"].as<int>(cfg.server.backlog);
            cfg.server.thread_per_connection =
                s["thread_per_connection"].as<bool>(cfg.server.thread_per_connection);
        }

        // Logging
        if (auto l = root["logging"]) {
            cfg.logging.level = l["level"].as<std::string>(cfg.logging.level);
            cfg.logging.file = l["file"].as<std::string>("");
            cfg.logging.access_file = l["access_file"].as<std::string>("");
            cfg.logging.max_file_size_mb = l["max_file_size_mb"].as<int>(cfg.logging.max_file_size_mb);
            cfg.logging.max_files = l["max_files"].as<int>(cfg.logging.max_files);
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config value in " + path + ": " + std::string(e.what()));
    }

    if (cfg.server.default_file.empty() || cfg.server.default_file[0] != '/') {
        throw std::runtime_error("server.default_file must start with '/'");
    }

    // Environment variable overrides (Docker / systemd)
    apply_env_overrides(cfg);

    return cfg;
}

AppConfig default_config() {
    AppConfig cfg;
    apply_env_overrides(cfg);
    return cfg;
}

} // namespace qh
