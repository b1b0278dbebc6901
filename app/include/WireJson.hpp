#ifndef WIREJSON_HPP
#define WIREJSON_HPP

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

#include <optional>
#include <string>
#include <string_view>

namespace WireJson {

/**
 * @brief Compact, deterministic serialization used for every request body:
 * no whitespace, keys in byte order, UTF-8 emitted verbatim, 15 significant digits.
 */
std::string to_wire_string(const Json::Value& value);

/**
 * @brief Parses a JSON document.
 * @throws ParseError when the text is not valid JSON.
 */
Json::Value parse(std::string_view text);

/**
 * @brief Parses a JSON document.
 * @return Parsed value, or std::nullopt when the text is not valid JSON.
 */
std::optional<Json::Value> try_parse(std::string_view text);

// Path helpers that never throw on a missing or mistyped node; they yield a null value instead.
const Json::Value& member(const Json::Value& value, const char* key);
const Json::Value& element(const Json::Value& value, Json::ArrayIndex index);

std::optional<std::string> optional_string(const Json::Value& value);
std::optional<int> optional_int(const Json::Value& value);

}

#endif // WIREJSON_HPP
