#include "http_response.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace qh {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 5> kMimeTypes = {{
    {".html", "text/html"},
    {".css",  "text/css"},
    {".png",  "image/png"},
    {".jpg",  "image/jpeg"},
    {".gif",  "image/gif"},
}};

constexpr std::string_view kDefaultMime = "application/octet-stream";

constexpr std::string_view kNotFoundBody = "<h1>YOU ARE A QUICHE EATER</h1>\r\n";

std::string_view reason_phrase(int status) {
    switch (status) {
        case 400: return "BAD REQUEST";
        case 405: return "METHOD NOT ALLOWED";
        case 431: return "REQUEST HEADER FIELDS TOO LARGE";
        case 505: return "HTTP VERSION NOT SUPPORTED";
        default:  return "INTERNAL SERVER ERROR";
    }
}

// Status lines carry a space before CRLF on the wire.
std::string build_html_response(int status, std::string_view reason,
                                std::string_view extra_headers, std::string_view body) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << reason << " \r\n"
        << "Connection: close\r\n"
        << extra_headers
        << "Content-Type: text/html; charset=utf8\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "\r\n"
        << body;
    return oss.str();
}

bool inside_root(const fs::path& canonical, const fs::path& root_canonical) {
    fs::path rel = canonical.lexically_relative(root_canonical);
    return !rel.empty() && *rel.begin() != "..";
}

} // namespace

std::string_view get_mime_type(std::string_view path) {
    // Extension of the last path segment only: "/a.b/file" has none.
    auto slash = path.rfind('/');
    std::string_view name = slash == std::string_view::npos ? path : path.substr(slash + 1);

    auto dot = name.rfind('.');
    if (dot == std::string_view::npos) return kDefaultMime;
    std::string_view ext = name.substr(dot);

    for (const auto& [key, mime] : kMimeTypes) {
        if (ext == key) return mime;
    }
    return kDefaultMime;
}

std::optional<std::string> load_local_file(const std::string& doc_root, std::string_view path) {
    if (!path.empty() && path.front() == '/') path.remove_prefix(1);
    fs::path full = fs::path(doc_root) / fs::path(path);

    std::error_code ec;
    fs::file_status st = fs::status(full, ec);
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
        throw std::system_error(ec, "stat " + full.string());
    }
    if (!fs::exists(st)) return std::nullopt;

    // Security: canonicalize and check it's inside doc_root
    fs::path canonical = fs::canonical(full);
    fs::path root_canonical = fs::canonical(doc_root);
    if (!inside_root(canonical, root_canonical)) {
        spdlog::warn("HTTP: Path traversal attempt: /{}", path);
        return std::nullopt;
    }

    if (fs::is_directory(st)) {
        throw std::system_error(std::make_error_code(std::errc::is_a_directory),
                                "open " + canonical.string());
    }

    errno = 0;
    std::ifstream file(canonical, std::ios::binary);
    if (!file.is_open()) {
        int err = errno != 0 ? errno : EIO;
        throw std::system_error(err, std::generic_category(), "open " + canonical.string());
    }

    std::string body((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::system_error(EIO, std::generic_category(), "read " + canonical.string());
    }
    return body;
}

std::string build_ok_response(std::string_view mime, std::string_view body) {
    std::ostringstream oss;
    oss << "HTTP/1.1 200 OK \r\n"
        << "Connection: close\r\n"
        << "Content-Type: " << mime << "\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "\r\n"
        << body;
    return oss.str();
}

const std::string& not_found_response() {
    static const std::string response = build_html_response(404, "NOT FOUND", "", kNotFoundBody);
    return response;
}

std::string build_error_response(int status) {
    if (status != 400 && status != 405 && status != 431 && status != 505) {
        status = 500;
    }
    std::string_view reason = reason_phrase(status);

    std::ostringstream body;
    body << "<h1>" << status << " " << reason << "</h1>\r\n";

    std::string_view extra = status == 405 ? "Allow: GET\r\n" : "";
    return build_html_response(status, reason, extra, body.str());
}

} // namespace qh
