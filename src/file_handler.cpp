#include "file_handler.hpp"
#include "http_error.hpp"
#include "http_request.hpp"
#include "http_response.hpp"
#include "logger.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace qh {

namespace {

std::string_view or_dash(std::string_view s) {
    return s.empty() ? std::string_view("-") : s;
}

} // namespace

FileHandler::FileHandler(const ServerConfig& config)
    : doc_root_(config.doc_root)
    , default_file_(config.default_file)
{
}

std::string FileHandler::respond(std::string_view raw_request) const {
    AccessRecord record;
    std::string response;

    try {
        response = serve(raw_request, record);
    } catch (const HttpError& e) {
        spdlog::warn("HTTP: Rejected request ({}): {}", e.http_status(), e.what());
        record.status = e.http_status();
        response = build_error_response(record.status);
    } catch (const std::system_error& e) {
        spdlog::error("HTTP: Cannot read file: {}", e.what());
        record.status = 500;
        response = build_error_response(record.status);
    }

    access_log()->info("{} \"{}\" host={} ua=\"{}\" bytes={}", record.status,
                       or_dash(record.headers.request_line), or_dash(record.headers.host),
                       or_dash(record.headers.user_agent), response.size());
    return response;
}

std::string FileHandler::serve(std::string_view raw_request, AccessRecord& record) const {
    record.headers = parse_headers(header_block(raw_request));
    std::string_view path = parse_path(record.headers.request_line, default_file_);

    auto content = load_local_file(doc_root_, path);
    if (!content) {
        spdlog::debug("HTTP: Not found: {}", path);
        record.status = 404;
        return not_found_response();
    }

    record.status = 200;
    return build_ok_response(get_mime_type(path), *content);
}

} // namespace qh
