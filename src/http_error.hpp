#pragma once

#include <stdexcept>
#include <string>

namespace qh {

enum class HttpErrorKind {
    HeaderMalformed,
    RequestLineMalformed,
    NoPath,
    MethodNotSupported,
    ProtoNotSupported,
    RequestTooLarge,
};

// Request-level failure. Caught at the connection boundary and answered
// with the matching error response; never fatal for the server.
class HttpError : public std::runtime_error {
public:
    HttpError(HttpErrorKind kind, const std::string& what)
        : std::runtime_error(what)
        , kind_(kind)
    {
    }

    HttpErrorKind kind() const { return kind_; }

    int http_status() const {
        switch (kind_) {
            case HttpErrorKind::MethodNotSupported: return 405;
            case HttpErrorKind::ProtoNotSupported:  return 505;
            case HttpErrorKind::RequestTooLarge:    return 431;
            case HttpErrorKind::HeaderMalformed:
            case HttpErrorKind::RequestLineMalformed:
            case HttpErrorKind::NoPath:
                break;
        }
        return 400;
    }

private:
    HttpErrorKind kind_;
};

} // namespace qh
