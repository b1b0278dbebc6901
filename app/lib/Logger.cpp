#include "Logger.hpp"
#include "Settings.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {
constexpr const char* kLogLevelEnv = "LLM_GATEWAY_LOG_LEVEL";
constexpr std::size_t kMaxLogFileBytes = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

const std::vector<std::string>& logger_names()
{
    static const std::vector<std::string> names = {"core_logger", "net_logger"};
    return names;
}
}


std::string Logger::get_log_directory()
{
    std::filesystem::path dir = std::filesystem::path(Settings::define_config_dir()) / "logs";
    return dir.string();
}


std::string Logger::get_log_file_path(const std::string& name)
{
    return (std::filesystem::path(get_log_directory()) / (name + ".log")).string();
}


void Logger::setup_loggers()
{
    std::filesystem::create_directories(get_log_directory());

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);

    for (const auto& name : logger_names()) {
        if (spdlog::get(name)) {
            continue;
        }
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            get_log_file_path(name), kMaxLogFileBytes, kMaxLogFiles);
        file_sink->set_level(spdlog::level::trace);

        auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink, file_sink});
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }

    if (const char* level = std::getenv(kLogLevelEnv); level && *level) {
        set_level(level);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


void Logger::set_level(const std::string& level_name)
{
    const auto level = spdlog::level::from_str(level_name);
    for (const auto& name : logger_names()) {
        if (auto logger = spdlog::get(name)) {
            logger->set_level(level);
        }
    }
}
