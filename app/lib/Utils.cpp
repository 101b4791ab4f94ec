#include "Utils.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <random>
#include <sstream>
#include <stdexcept>

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path)
{
#if defined(__cpp_lib_char8_t)
    const auto u8 = path.u8string();
    return std::string(u8.begin(), u8.end());
#else
    return path.u8string();
#endif
}


std::filesystem::path utf8_to_path(const std::string& value)
{
#if defined(__cpp_lib_char8_t)
    return std::filesystem::path(std::u8string(value.begin(), value.end()));
#else
    return std::filesystem::u8path(value);
#endif
}


std::string format_timestamp_iso(std::time_t value)
{
    std::tm utc{};
    gmtime_r(&value, &utc);
    std::array<char, 32> buffer{};
    const auto written = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer.data(), written);
}


std::string current_timestamp_iso()
{
    return format_timestamp_iso(std::time(nullptr));
}


std::int64_t unix_now()
{
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}


std::string format_bytes(std::uint64_t bytes)
{
    static const char* const units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) {
        return fmt::format("{} {}", bytes, units[unit]);
    }
    return fmt::format("{:.2f} {}", value, units[unit]);
}


std::string make_run_token()
{
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return fmt::format("run-{:x}-{:016x}", static_cast<std::uint64_t>(now), rng());
}


std::string to_lower_copy(const std::string& value)
{
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return lowered;
}


bool equals_ignore_case(const std::string& lhs, const std::string& rhs)
{
    return lhs.size() == rhs.size() && to_lower_copy(lhs) == to_lower_copy(rhs);
}


std::optional<std::int64_t> parse_int64(const std::string& value)
{
    try {
        std::size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(parsed);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}


std::vector<std::int64_t> parse_id_list(const std::string& value)
{
    std::vector<std::int64_t> ids;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(std::remove_if(item.begin(), item.end(),
                                  [](unsigned char ch) { return std::isspace(ch); }),
                   item.end());
        if (item.empty()) {
            continue;
        }
        if (auto id = parse_int64(item)) {
            ids.push_back(*id);
        } else {
            throw std::invalid_argument("Invalid id in list: " + item);
        }
    }
    return ids;
}

} // namespace Utils
