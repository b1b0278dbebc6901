#include "WireJson.hpp"
#include "LLMErrors.hpp"

#include <limits>
#include <memory>

namespace WireJson {

namespace {
const Json::Value& null_value()
{
    static const Json::Value null_node;
    return null_node;
}

bool parse_into(std::string_view text, Json::Value& root, std::string& errors)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    return reader->parse(text.data(), text.data() + text.size(), &root, &errors);
}
}

std::string to_wire_string(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["commentStyle"] = "None";
    builder["emitUTF8"] = true;
    builder["precision"] = 15;
    builder["precisionType"] = "significant";
    return Json::writeString(builder, value);
}

Json::Value parse(std::string_view text)
{
    Json::Value root;
    std::string errors;
    if (!parse_into(text, root, errors)) {
        throw ParseError("Malformed JSON: " + errors);
    }
    return root;
}

std::optional<Json::Value> try_parse(std::string_view text)
{
    Json::Value root;
    std::string errors;
    if (!parse_into(text, root, errors)) {
        return std::nullopt;
    }
    return root;
}

const Json::Value& member(const Json::Value& value, const char* key)
{
    if (!value.isObject()) {
        return null_value();
    }
    const Json::Value* found = value.find(key, key + std::char_traits<char>::length(key));
    return found ? *found : null_value();
}

const Json::Value& element(const Json::Value& value, Json::ArrayIndex index)
{
    if (!value.isArray() || index >= value.size()) {
        return null_value();
    }
    return value[index];
}

std::optional<std::string> optional_string(const Json::Value& value)
{
    if (!value.isString()) {
        return std::nullopt;
    }
    return value.asString();
}

std::optional<int> optional_int(const Json::Value& value)
{
    if (value.isInt()) {
        return value.asInt();
    }
    if (value.isDouble()) {
        const double number = value.asDouble();
        if (number >= std::numeric_limits<int>::min() && number <= std::numeric_limits<int>::max()) {
            return static_cast<int>(number);
        }
    }
    return std::nullopt;
}

}
