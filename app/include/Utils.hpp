#ifndef UTILS_HPP
#define UTILS_HPP

#include <optional>
#include <string>
#include <string_view>

namespace Utils {

std::string to_lower_copy(std::string_view value);
std::string to_upper_copy(std::string_view value);
std::string trim_copy(std::string_view value);

// Drops the query string so credentials carried as URL parameters never reach a log.
std::string redact_url(const std::string& url);

std::optional<int> parse_int(const std::string& value);
std::optional<double> parse_double(const std::string& value);

}

#endif
