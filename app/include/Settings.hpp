#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <ClientConfig.hpp>
#include <IniConfig.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>


/**
 * @brief Persisted gateway defaults stored in <config root>/LlmGateway/config.ini.
 *
 * The config root is $LLM_GATEWAY_CONFIG_DIR when set, otherwise the platform's
 * per-user configuration directory.
 */
class Settings
{
public:
    Settings();

    bool load();
    bool save();

    /**
     * @brief Returns the directory holding config.ini, credentials.ini and logs/.
     */
    static std::string define_config_dir();
    std::string define_config_path();
    std::string get_config_dir();

    /**
     * @brief Snapshot of the stored defaults. Provider and model are returned as
     * stored; resolve_client_config() validates them against the catalog.
     */
    ClientConfig get_client_config() const;
    void set_client_config(const ClientConfig& config);

    std::string get_provider() const;
    void set_provider(const std::string& provider_id);

    std::string get_model() const;
    void set_model(const std::string& model_id);

    double get_temperature() const;
    void set_temperature(double value);

    int get_max_tokens() const;
    void set_max_tokens(int value);

    std::optional<std::string> get_thinking_level() const;
    void set_thinking_level(const std::optional<std::string>& value);

    std::optional<std::string> get_reasoning_effort() const;
    void set_reasoning_effort(const std::optional<std::string>& value);

    // LLM_GATEWAY_TIMEOUT_MS takes precedence over the stored value.
    std::chrono::milliseconds get_timeout() const;
    void set_timeout(std::chrono::milliseconds value);

    bool get_development_logging() const;
    void set_development_logging(bool value);

private:
    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    ClientConfig defaults;
    bool development_logging{false};
};

#endif
