#include "http_request.hpp"
#include <cerrno>
#include <string>
#include <system_error>
#include <unistd.h>

namespace qh {

namespace {

constexpr std::string_view kHeaderTerminator = "\r\n\r\n";
constexpr std::string_view kLineDelimiter = "\r\n";

// Splits on a delimiter sequence, skipping empty fields.
class Tokenizer {
public:
    Tokenizer(std::string_view input, std::string_view delimiter)
        : rest_(input)
        , delimiter_(delimiter)
    {
    }

    bool next(std::string_view& token) {
        while (rest_.substr(0, delimiter_.size()) == delimiter_) {
            rest_.remove_prefix(delimiter_.size());
        }
        if (rest_.empty()) return false;

        auto end = rest_.find(delimiter_);
        if (end == std::string_view::npos) end = rest_.size();
        token = rest_.substr(0, end);
        rest_.remove_prefix(end);
        return true;
    }

private:
    std::string_view rest_;
    std::string_view delimiter_;
};

} // namespace

bool end_of_headers_reached(std::string_view bytes) {
    return bytes.find(kHeaderTerminator) != std::string_view::npos;
}

std::string_view read_request(int fd, RequestBuffer& buf) {
    while (!buf.full()) {
        ssize_t n = ::read(fd, buf.data.data() + buf.size, buf.data.size() - buf.size);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "read request");
        }
        if (n == 0) break;  // peer closed

        buf.size += static_cast<size_t>(n);
        if (end_of_headers_reached(buf.view())) return buf.view();
    }

    if (buf.full() && !end_of_headers_reached(buf.view())) {
        throw HttpError(HttpErrorKind::RequestTooLarge,
                        "header block exceeds " + std::to_string(kMaxRequestBytes) + " bytes");
    }
    return buf.view();
}

std::string_view header_block(std::string_view raw) {
    auto end = raw.find(kHeaderTerminator);
    if (end == std::string_view::npos) return raw;
    return raw.substr(0, end + kHeaderTerminator.size());
}

HttpHeaders parse_headers(std::string_view raw) {
    HttpHeaders hs;
    Tokenizer lines(raw, kLineDelimiter);

    if (!lines.next(hs.request_line)) {
        throw HttpError(HttpErrorKind::HeaderMalformed, "missing request line");
    }

    std::string_view line;
    while (lines.next(line)) {
        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            throw HttpError(HttpErrorKind::HeaderMalformed,
                            "header line without ':': " + std::string(line));
        }

        std::string_view name = line.substr(0, colon);
        std::string_view value = line.substr(colon + 1);
        auto first = value.find_first_not_of(' ');
        value.remove_prefix(first == std::string_view::npos ? value.size() : first);

        if (name == "Host") {
            hs.host = value;
        } else if (name == "User-Agent") {
            hs.user_agent = value;
        }
    }

    return hs;
}

std::string_view parse_path(std::string_view request_line, std::string_view default_path) {
    Tokenizer fields(request_line, " ");
    std::string_view method, path, proto;

    if (!fields.next(method)) {
        throw HttpError(HttpErrorKind::RequestLineMalformed, "empty request line");
    }
    if (method != "GET") {
        throw HttpError(HttpErrorKind::MethodNotSupported,
                        "method not supported: " + std::string(method));
    }

    if (!fields.next(path)) {
        throw HttpError(HttpErrorKind::NoPath,
                        "request line has no path: " + std::string(request_line));
    }

    if (!fields.next(proto)) {
        throw HttpError(HttpErrorKind::RequestLineMalformed,
                        "request line has no protocol: " + std::string(request_line));
    }
    if (proto != "HTTP/1.1") {
        throw HttpError(HttpErrorKind::ProtoNotSupported,
                        "protocol not supported: " + std::string(proto));
    }

    if (path == "/") return default_path;
    return path;
}

} // namespace qh
