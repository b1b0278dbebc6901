#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>

namespace spdlog { class logger; }

/**
 * @brief Creates and hands out the named spdlog loggers used across the gateway.
 *
 * Two loggers exist: "core_logger" for configuration, catalog and gateway
 * events, and "net_logger" for transport and dispatch events.
 */
class Logger {
public:
    /**
     * @brief Registers the console and rotating-file sinks for all loggers.
     * @throws spdlog::spdlog_ex when the log directory cannot be opened.
     */
    static void setup_loggers();

    /**
     * @brief Returns a registered logger.
     * @param name Logger name.
     * @return Logger, or nullptr when setup_loggers() has not run.
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    /**
     * @brief Applies a level ("trace", "debug", "info", ...) to every registered logger.
     */
    static void set_level(const std::string& level_name);

    static std::string get_log_directory();

private:
    static std::string get_log_file_path(const std::string& name);
};

#endif // LOGGER_HPP
