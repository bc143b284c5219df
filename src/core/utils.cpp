#include "warden/core/utils.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

#include <uuid.h>

namespace warden::utils {

auto generate_uuid() -> std::string {
    static thread_local std::mt19937 rng(std::random_device{}());
    auto gen = uuids::uuid_random_generator(rng);
    return uuids::to_string(gen());
}

auto timestamp_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

auto timestamp_iso() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    ::gmtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%FT%T") << '.'
        << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

auto timestamp_file_safe() -> std::string {
    auto ts = timestamp_iso();
    std::ranges::replace(ts, ':', '-');
    std::ranges::replace(ts, '.', '-');
    return ts;
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r\f\v");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto to_upper(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

auto sanitize_for_log(std::string_view s, std::size_t max_len) -> std::string {
    std::string out;
    out.reserve(std::min(s.size(), max_len));
    for (char c : s) {
        if (out.size() >= max_len) break;
        auto uc = static_cast<unsigned char>(c);
        out += (uc < 0x20 || uc == 0x7f) ? '?' : c;
    }
    return out;
}

} // namespace warden::utils
