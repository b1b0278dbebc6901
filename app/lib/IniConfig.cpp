#include "IniConfig.hpp"
#include "Logger.hpp"
#include <cstdio>
#include <filesystem>
#include <system_error>
#include <optional>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

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

std::optional<std::string> parse_section_header(const std::string& line)
{
    if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
        return trim_copy(line.substr(1, line.size() - 2));
    }
    return std::nullopt;
}

std::optional<std::pair<std::string, std::string>> parse_key_value(const std::string& line)
{
    const auto delimiter = line.find('=');
    if (delimiter == std::string::npos) {
        return std::nullopt;
    }
    std::string key = trim_copy(line.substr(0, delimiter));
    std::string value = trim_copy(line.substr(delimiter + 1));
    if (key.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::move(key), std::move(value));
}
}


bool IniConfig::load(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        ini_log(spdlog::level::debug, "Config file not found: {}", filename);
        return false;
    }

    data.clear();
    std::string raw_line;
    std::string section;
    std::size_t line_number = 0;
    while (std::getline(file, raw_line)) {
        ++line_number;
        const std::string line = trim_copy(raw_line);
        if (is_comment_or_blank(line)) {
            continue;
        }
        if (auto header = parse_section_header(line)) {
            section = *header;
            continue;
        }
        if (auto key_value = parse_key_value(line)) {
            data[section][key_value->first] = key_value->second;
        } else {
            ini_log(spdlog::level::warn, "Ignoring malformed line {} in {}", line_number, filename);
        }
    }
    return true;
}


const std::string* IniConfig::find(const std::string& section, const std::string& key) const
{
    const auto sec_it = data.find(section);
    if (sec_it == data.end()) {
        return nullptr;
    }
    const auto key_it = sec_it->second.find(key);
    return key_it == sec_it->second.end() ? nullptr : &key_it->second;
}


std::string IniConfig::getValue(const std::string& section,
                                const std::string& key,
                                const std::string& default_value) const
{
    const std::string* value = find(section, key);
    return value ? *value : default_value;
}


void IniConfig::setValue(const std::string& section, const std::string& key, const std::string& value)
{
    data[section][key] = value;
}


void IniConfig::removeValue(const std::string& section, const std::string& key)
{
    auto sec_it = data.find(section);
    if (sec_it == data.end()) {
        return;
    }
    sec_it->second.erase(key);
    if (sec_it->second.empty()) {
        data.erase(sec_it);
    }
}


// Writes next to the target and renames over it, so a crash never leaves a truncated file.
namespace {
// Creates an empty file that only the owner can read or write.
bool create_owner_only(const std::filesystem::path& path)
{
#ifndef _WIN32
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        ini_log(spdlog::level::err, "Failed to create {}", path.string());
        return false;
    }
    ::close(fd);
#else
    std::ofstream(path, std::ios::trunc).close();
#endif
    std::error_code ec;
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        ini_log(spdlog::level::err, "Failed to restrict permissions on {}: {}", path.string(), ec.message());
        std::filesystem::remove(path, ec);
        return false;
    }
    return true;
}
}

bool IniConfig::save(const std::string& filename, bool owner_only) const
{
    const std::filesystem::path target(filename);
    std::filesystem::path staging = target;
    staging += ".tmp";

    std::error_code ec;
    std::filesystem::remove(staging, ec);
    if (owner_only && !create_owner_only(staging)) {
        return false;
    }

    {
        std::ofstream file(staging, std::ios::trunc);
        if (!file.is_open()) {
            ini_log(spdlog::level::err, "Failed to open config file for writing: {}", staging.string());
            return false;
        }
        for (const auto& [section, values] : data) {
            file << "[" << section << "]\n";
            for (const auto& [key, value] : values) {
                file << key << " = " << value << "\n";
            }
            file << "\n";
        }
        file.flush();
        if (!file.good()) {
            ini_log(spdlog::level::err, "Failed to write config file: {}", staging.string());
            file.close();
            std::filesystem::remove(staging, ec);
            return false;
        }
    }

    std::filesystem::rename(staging, target, ec);
    if (ec) {
        ini_log(spdlog::level::err, "Failed to replace {}: {}", filename, ec.message());
        std::filesystem::remove(staging, ec);
        return false;
    }
    return true;
}


bool IniConfig::hasValue(const std::string& section, const std::string& key) const
{
    return find(section, key) != nullptr;
}


std::map<std::string, std::string> IniConfig::sectionValues(const std::string& section) const
{
    if (auto it = data.find(section); it != data.end()) {
        return it->second;
    }
    return {};
}


std::vector<std::string> IniConfig::sections() const
{
    std::vector<std::string> names;
    names.reserve(data.size());
    for (const auto& entry : data) {
        names.push_back(entry.first);
    }
    return names;
}
