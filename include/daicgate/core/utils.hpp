#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace daicgate::utils {

/// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
auto timestamp_iso() -> std::string;

auto trim(std::string_view s) -> std::string;
auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string;
auto to_lower(std::string_view s) -> std::string;

/// Case-insensitive substring search (ASCII folding). An empty needle never matches.
auto contains_icase(std::string_view haystack, std::string_view needle) -> bool;

} // namespace daicgate::utils
