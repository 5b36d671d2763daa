#pragma once

#include "config.hpp"
#include "http_request.hpp"
#include <string>
#include <string_view>

namespace qh {

// Turns one raw header block into the bytes to send back.
class FileHandler {
public:
    explicit FileHandler(const ServerConfig& config);

    // Never throws for request-level problems: malformed or unsupported
    // requests get a 4xx, filesystem failures a 500.
    std::string respond(std::string_view raw_request) const;

private:
    // What the access log reports for one request
    struct AccessRecord {
        int status = 0;
        HttpHeaders headers;
    };

    std::string serve(std::string_view raw_request, AccessRecord& record) const;

    std::string doc_root_;
    std::string default_file_;
};

} // namespace qh
