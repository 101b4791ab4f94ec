#include "IniConfig.hpp"
#include "Logger.hpp"
#include <cstdio>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace {
template <typename... Args>
void ini_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

std::string trim_copy(const std::string& input)
{
    const auto begin = input.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r");
    return input.substr(begin, end - begin + 1);
}

bool is_comment_or_blank(const std::string& line)
{
    return line.empty() || line.front() == ';' || line.front() == '#';
}

// Strips " ; comment" / " # comment" tails outside quotes and unwraps "quoted" values.
std::string clean_value(const std::string& raw)
{
    std::string value = trim_copy(raw);
    if (value.size() >= 2 && value.front() == '"') {
        const auto closing = value.find('"', 1);
        if (closing != std::string::npos) {
            return value.substr(1, closing - 1);
        }
    }
    for (std::size_t i = 1; i < value.size(); ++i) {
        if ((value[i] == ';' || value[i] == '#') && (value[i - 1] == ' ' || value[i - 1] == '\t')) {
            return trim_copy(value.substr(0, i));
        }
    }
    return value;
}

bool needs_quotes(const std::string& value)
{
    if (value.empty()) {
        return false;
    }
    return value.front() == ' ' || value.back() == ' ' ||
           value.find_first_of(";#") != std::string::npos;
}
}


bool IniConfig::load(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        ini_log(spdlog::level::warn, "Config file not readable: {}", filename);
        return false;
    }

    std::string raw_line;
    std::string section;
    std::size_t line_number = 0;
    while (std::getline(file, raw_line)) {
        ++line_number;
        const std::string line = trim_copy(raw_line);
        if (is_comment_or_blank(line)) {
            continue;
        }
        if (line.front() == '[') {
            if (line.back() != ']' || line.size() < 3) {
                ini_log(spdlog::level::warn, "{}:{}: malformed section header ignored",
                        filename, line_number);
                continue;
            }
            section = trim_copy(line.substr(1, line.size() - 2));
            continue;
        }
        const auto delimiter = line.find('=');
        if (delimiter == std::string::npos) {
            ini_log(spdlog::level::warn, "{}:{}: line without '=' ignored", filename, line_number);
            continue;
        }
        std::string key = trim_copy(line.substr(0, delimiter));
        if (key.empty()) {
            continue;
        }
        data[section][std::move(key)] = clean_value(line.substr(delimiter + 1));
    }
    return true;
}


std::string IniConfig::getValue(const std::string& section,
                                const std::string& key,
                                const std::string& default_value) const
{
    if (auto value = findValue(section, key)) {
        return *value;
    }
    return default_value;
}


std::optional<std::string> IniConfig::findValue(const std::string& section,
                                                const std::string& key) const
{
    const auto sec_it = data.find(section);
    if (sec_it == data.end()) {
        return std::nullopt;
    }
    const auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) {
        return std::nullopt;
    }
    return key_it->second;
}


void IniConfig::setValue(const std::string& section, const std::string& key, const std::string& value)
{
    data[section][key] = value;
}


bool IniConfig::save(const std::string& filename) const
{
    std::ofstream file(filename, std::ios::trunc);
    if (!file.is_open()) {
        ini_log(spdlog::level::err, "Failed to open config file for writing: {}", filename);
        return false;
    }

    for (const auto& [section, entries] : data) {
        file << "[" << section << "]\n";
        for (const auto& [key, value] : entries) {
            if (needs_quotes(value)) {
                file << key << " = \"" << value << "\"\n";
            } else {
                file << key << " = " << value << "\n";
            }
        }
        file << "\n";
    }

    file.flush();
    return static_cast<bool>(file);
}


bool IniConfig::hasValue(const std::string& section, const std::string& key) const
{
    return findValue(section, key).has_value();
}
