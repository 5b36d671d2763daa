#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include "config.hpp"

namespace qh {

// Unknown names fall back to info.
spdlog::level::level_enum parse_log_level(const std::string& level);

// Installs the default "quiche-httpd" logger (console, optional rotating
// file) and the "access" logger that records one line per answered request.
void init_logger(const LoggingConfig& cfg);

// The access logger, or the default logger before init_logger ran.
std::shared_ptr<spdlog::logger> access_log();

} // namespace qh
