#pragma once

#include "http_error.hpp"
#include <array>
#include <cstddef>
#include <string_view>

namespace qh {

constexpr size_t kMaxRequestBytes = 4096;

// Per-connection header buffer. Never reused across connections.
struct RequestBuffer {
    std::array<char, kMaxRequestBytes> data;
    size_t size = 0;

    std::string_view view() const { return std::string_view(data.data(), size); }
    bool full() const { return size == data.size(); }
};

// Slices over a RequestBuffer; valid only while the buffer lives.
struct HttpHeaders {
    std::string_view request_line;
    std::string_view host;
    std::string_view user_agent;
};

// True iff "\r\n\r\n" occurs anywhere in bytes.
bool end_of_headers_reached(std::string_view bytes);

// Reads from fd into buf until the header terminator shows up, the peer
// closes, or the buffer fills. Returns everything read so far; an empty
// view means the peer sent nothing.
// Throws std::system_error on read failure and HttpError(RequestTooLarge)
// when the buffer fills without a terminator.
std::string_view read_request(int fd, RequestBuffer& buf);

// Cuts bytes after the first "\r\n\r\n", if there is one.
std::string_view header_block(std::string_view raw);

HttpHeaders parse_headers(std::string_view raw);

// Validates "GET <path> HTTP/1.1" and returns the path, with "/" replaced
// by default_path.
std::string_view parse_path(std::string_view request_line, std::string_view default_path);

} // namespace qh
