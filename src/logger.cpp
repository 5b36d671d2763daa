#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace qh {

namespace {

constexpr const char* kAccessLoggerName = "access";

spdlog::sink_ptr make_rotating_sink(const std::string& path, const LoggingConfig& cfg,
                                    const std::string& pattern) {
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        path,
        static_cast<size_t>(cfg.max_file_size_mb) * 1024 * 1024,
        static_cast<size_t>(cfg.max_files)
    );
    sink->set_pattern(pattern);
    return sink;
}

} // namespace

spdlog::level::level_enum parse_log_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    return spdlog::level::info;
}

void init_logger(const LoggingConfig& cfg) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    if (!cfg.file.empty()) {
        sinks.push_back(make_rotating_sink(cfg.file, cfg, "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v"));
    }

    auto logger = std::make_shared<spdlog::logger>("quiche-httpd", sinks.begin(), sinks.end());
    logger->set_level(parse_log_level(cfg.level));
    logger->flush_on(spdlog::level::warn);
    if (parse_log_level(cfg.level) == spdlog::level::info && cfg.level != "info") {
        logger->warn("Unknown log level '{}', using info", cfg.level);
    }

    // Access lines go to the console, and to their own file when configured
    std::vector<spdlog::sink_ptr> access_sinks{console_sink};
    if (!cfg.access_file.empty()) {
        access_sinks.push_back(make_rotating_sink(cfg.access_file, cfg, "[%Y-%m-%d %H:%M:%S.%e] %v"));
    }
    auto access = std::make_shared<spdlog::logger>(kAccessLoggerName,
                                                   access_sinks.begin(), access_sinks.end());
    access->set_level(logger->level());
    access->flush_on(spdlog::level::info);

    spdlog::drop(kAccessLoggerName);
    spdlog::register_logger(access);
    spdlog::set_default_logger(logger);
}

std::shared_ptr<spdlog::logger> access_log() {
    auto access = spdlog::get(kAccessLoggerName);
    return access ? access : spdlog::default_logger();
}

} // namespace qh
