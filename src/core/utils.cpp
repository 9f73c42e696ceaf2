#include "daicgate/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace daicgate::utils {

auto timestamp_iso() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_val{};
    gmtime_r(&time, &tm_val);
    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%FT%TZ");
    return oss.str();
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += sep;
        result += parts[i];
    }
    return result;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto contains_icase(std::string_view haystack, std::string_view needle) -> bool {
    if (needle.empty()) return false;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

} // namespace daicgate::utils
