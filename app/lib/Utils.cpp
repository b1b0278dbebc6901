#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace Utils {

std::string to_lower_copy(std::string_view value)
{
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return result;
}

std::string to_upper_copy(std::string_view value)
{
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return result;
}

std::string trim_copy(std::string_view value)
{
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(begin, end - begin + 1));
}

std::string redact_url(const std::string& url)
{
    const auto query = url.find('?');
    if (query == std::string::npos) {
        return url;
    }
    return url.substr(0, query) + "?<redacted>";
}

std::optional<int> parse_int(const std::string& value)
{
    const std::string trimmed = trim_copy(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    char* end_ptr = nullptr;
    errno = 0;
    const long parsed = std::strtol(trimmed.c_str(), &end_ptr, 10);
    if (*end_ptr != '\0' || errno == ERANGE || parsed > INT_MAX || parsed < INT_MIN) {
        return std::nullopt;
    }
    return static_cast<int>(parsed);
}

std::optional<double> parse_double(const std::string& value)
{
    const std::string trimmed = trim_copy(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    char* end_ptr = nullptr;
    errno = 0;
    const double parsed = std::strtod(trimmed.c_str(), &end_ptr);
    if (*end_ptr != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return parsed;
}

}
