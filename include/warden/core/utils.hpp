#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace warden::utils {

auto generate_uuid() -> std::string;
auto timestamp_ms() -> int64_t;
auto timestamp_iso() -> std::string;
/// Same instant as timestamp_iso() but with ':' and '.' replaced by '-',
/// suitable for file names.
auto timestamp_file_safe() -> std::string;
auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string;
auto to_lower(std::string_view s) -> std::string;
auto to_upper(std::string_view s) -> std::string;

/// Replace control characters (0x00-0x1f, 0x7f) with '?' and cut the result
/// to at most max_len bytes. Used before user input reaches logs.
auto sanitize_for_log(std::string_view s, std::size_t max_len = 200) -> std::string;

} // namespace warden::utils
