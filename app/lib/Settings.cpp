#include "Settings.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <locale>
#include <sstream>
#ifdef _WIN32
    #include <shlobj.h>
    #include <windows.h>
#endif


namespace {
constexpr const char* kAppName = "LlmGateway";
constexpr const char* kSection = "Gateway";

template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

std::string format_double(double value) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(15) << value;
    return oss.str();
}

std::optional<std::string> optional_value(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::chrono::milliseconds> timeout_from_env() {
    const char* raw = std::getenv("LLM_GATEWAY_TIMEOUT_MS");
    if (!raw || raw[0] == '\0') {
        return std::nullopt;
    }
    const auto parsed = Utils::parse_int(raw);
    if (!parsed || *parsed <= 0) {
        settings_log(spdlog::level::warn, "Ignoring invalid LLM_GATEWAY_TIMEOUT_MS value '{}'", raw);
        return std::nullopt;
    }
    return std::chrono::milliseconds(*parsed);
}
}


Settings::Settings()
{
    config_path = define_config_path();
    config_dir = std::filesystem::path(config_path).parent_path();

    try {
        if (!std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }
    } catch (const std::filesystem::filesystem_error &e) {
        settings_log(spdlog::level::err, "Error creating configuration directory: {}", e.what());
    }
}


std::string Settings::define_config_dir()
{
    if (const char* override_root = std::getenv("LLM_GATEWAY_CONFIG_DIR")) {
        if (override_root[0] != '\0') {
            return (std::filesystem::path(override_root) / kAppName).string();
        }
    }
#ifdef _WIN32
    char appDataPath[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(NULL, CSIDL_APPDATA, NULL, 0, appDataPath))) {
        return (std::filesystem::path(appDataPath) / kAppName).string();
    }
#elif defined(__APPLE__)
    if (const char* home = std::getenv("HOME")) {
        return (std::filesystem::path(home) / "Library/Application Support" / kAppName).string();
    }
#else
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (xdg[0] != '\0') {
            return (std::filesystem::path(xdg) / kAppName).string();
        }
    }
    if (const char* home = std::getenv("HOME")) {
        return (std::filesystem::path(home) / ".config" / kAppName).string();
    }
#endif
    return kAppName;
}


std::string Settings::define_config_path()
{
    return (std::filesystem::path(define_config_dir()) / "config.ini").string();
}


std::string Settings::get_config_dir()
{
    return config_dir.string();
}


bool Settings::load()
{
    const ClientConfig fallback;
    if (!config.load(config_path)) {
        defaults = fallback;
        development_logging = false;
        return false;
    }

    defaults.provider_id = config.getValue(kSection, "Provider", fallback.provider_id);
    defaults.model_id = config.getValue(kSection, "Model", fallback.model_id);
    defaults.temperature = Utils::parse_double(config.getValue(kSection, "Temperature"))
                               .value_or(fallback.temperature);
    defaults.max_tokens = Utils::parse_int(config.getValue(kSection, "MaxTokens"))
                              .value_or(fallback.max_tokens);
    defaults.top_p = Utils::parse_double(config.getValue(kSection, "TopP"));
    defaults.thinking_level = config.hasValue(kSection, "ThinkingLevel")
                                  ? optional_value(config.getValue(kSection, "ThinkingLevel"))
                                  : fallback.thinking_level;
    defaults.reasoning_effort = optional_value(config.getValue(kSection, "ReasoningEffort"));

    const auto timeout_ms = Utils::parse_int(config.getValue(kSection, "TimeoutMs"));
    defaults.timeout = (timeout_ms && *timeout_ms > 0) ? std::chrono::milliseconds(*timeout_ms)
                                                       : fallback.timeout;
    if (defaults.max_tokens <= 0) {
        settings_log(spdlog::level::warn, "Ignoring non-positive MaxTokens in {}", config_path);
        defaults.max_tokens = fallback.max_tokens;
    }

    development_logging = config.getValue(kSection, "DevelopmentLogging", "false") == "true";
    return true;
}


bool Settings::save()
{
    config.setValue(kSection, "Provider", defaults.provider_id);
    config.setValue(kSection, "Model", defaults.model_id);
    config.setValue(kSection, "Temperature", format_double(defaults.temperature));
    config.setValue(kSection, "MaxTokens", std::to_string(defaults.max_tokens));
    if (defaults.top_p) {
        config.setValue(kSection, "TopP", format_double(*defaults.top_p));
    } else {
        config.removeValue(kSection, "TopP");
    }
    config.setValue(kSection, "ThinkingLevel", defaults.thinking_level.value_or(""));
    config.setValue(kSection, "ReasoningEffort", defaults.reasoning_effort.value_or(""));
    config.setValue(kSection, "TimeoutMs", std::to_string(defaults.timeout.count()));
    config.setValue(kSection, "DevelopmentLogging", development_logging ? "true" : "false");

    if (!config.save(config_path)) {
        settings_log(spdlog::level::err, "Failed to save settings to {}", config_path);
        return false;
    }
    return true;
}


ClientConfig Settings::get_client_config() const
{
    ClientConfig result = defaults;
    result.timeout = get_timeout();
    return result;
}


void Settings::set_client_config(const ClientConfig& value)
{
    defaults = value;
}


std::string Settings::get_provider() const
{
    return defaults.provider_id;
}


void Settings::set_provider(const std::string& provider_id)
{
    defaults.provider_id = provider_id;
}


std::string Settings::get_model() const
{
    return defaults.model_id;
}


void Settings::set_model(const std::string& model_id)
{
    defaults.model_id = model_id;
}


double Settings::get_temperature() const
{
    return defaults.temperature;
}


void Settings::set_temperature(double value)
{
    defaults.temperature = value;
}


int Settings::get_max_tokens() const
{
    return defaults.max_tokens;
}


void Settings::set_max_tokens(int value)
{
    defaults.max_tokens = value;
}


std::optional<std::string> Settings::get_thinking_level() const
{
    return defaults.thinking_level;
}


void Settings::set_thinking_level(const std::optional<std::string>& value)
{
    defaults.thinking_level = value;
}


std::optional<std::string> Settings::get_reasoning_effort() const
{
    return defaults.reasoning_effort;
}


void Settings::set_reasoning_effort(const std::optional<std::string>& value)
{
    defaults.reasoning_effort = value;
}


std::chrono::milliseconds Settings::get_timeout() const
{
    return timeout_from_env().value_or(defaults.timeout);
}


void Settings::set_timeout(std::chrono::milliseconds value)
{
    defaults.timeout = value;
}


bool Settings::get_development_logging() const
{
    return development_logging;
}


void Settings::set_development_logging(bool value)
{
    development_logging = value;
}
