#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path);
std::filesystem::path utf8_to_path(const std::string& value);

// UTC, second resolution, e.g. 2026-10-17T08:15:02Z
std::string current_timestamp_iso();
std::string format_timestamp_iso(std::time_t value);
std::int64_t unix_now();

std::string format_bytes(std::uint64_t bytes);

// Random token used to tag an execution run
std::string make_run_token();

std::string to_lower_copy(const std::string& value);
bool equals_ignore_case(const std::string& lhs, const std::string& rhs);

std::optional<std::int64_t> parse_int64(const std::string& value);
std::vector<std::int64_t> parse_id_list(const std::string& value);

} // namespace Utils

#endif
