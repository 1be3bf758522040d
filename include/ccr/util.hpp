#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace ccr {
namespace util {

std::string base64_encode(std::string_view in);
std::string json_escape(std::string_view s);

// value of a top-level string member of a flat JSON object
std::optional<std::string> json_string_field(std::string_view json,
                                             std::string_view key);

std::string to_lower(std::string s);
std::string trim(std::string s);

} // namespace util
} // namespace ccr
