#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace qh {

// Looks the extension of path up in the fixed MIME table.
// Unknown or missing extensions give "application/octet-stream".
std::string_view get_mime_type(std::string_view path);

// Reads the whole file that path (leading '/' stripped) names under doc_root.
// Returns std::nullopt when the file does not exist or resolves outside
// doc_root. Throws std::system_error for any other filesystem failure.
std::optional<std::string> load_local_file(const std::string& doc_root, std::string_view path);

std::string build_ok_response(std::string_view mime, std::string_view body);

// Identical bytes for every missing path.
const std::string& not_found_response();

// 400, 405, 431, 500 or 505; anything else is answered as 500.
std::string build_error_response(int status);

} // namespace qh
