#include "ChatGateway.hpp"
#include "CredentialStore.hpp"
#include "CurlTransport.hpp"
#include "LLMErrors.hpp"
#include "LlmCatalog.hpp"
#include "Logger.hpp"
#include "Settings.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <curl/curl.h>


bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception &e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Failed to initialize loggers: {}", e.what());
        } else {
            std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        }
        return false;
    }
}

namespace {

struct ParsedArguments {
    std::optional<std::string> provider;
    std::optional<std::string> model;
    std::optional<std::string> api_key;
    std::optional<std::string> system_prompt;
    bool stream{false};
    bool list{false};
    bool development_mode{false};
    bool help{false};
    std::string prompt;
};

void print_usage(std::FILE* out)
{
    std::fprintf(out,
                 "Usage: llm-gateway [--provider ID] [--model KEY] [--api-key KEY]\n"
                 "                   [--system TEXT] [--stream] [--list] [--development] PROMPT...\n");
}

std::optional<ParsedArguments> parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;
    const auto take_value = [&](int& i, std::optional<std::string>& target) {
        if (i + 1 >= argc) {
            std::fprintf(stderr, "Missing value for %s\n", argv[i]);
            return false;
        }
        target = argv[++i];
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--provider") == 0) {
            if (!take_value(i, parsed.provider)) return std::nullopt;
        } else if (std::strcmp(argv[i], "--model") == 0) {
            if (!take_value(i, parsed.model)) return std::nullopt;
        } else if (std::strcmp(argv[i], "--api-key") == 0) {
            if (!take_value(i, parsed.api_key)) return std::nullopt;
        } else if (std::strcmp(argv[i], "--system") == 0) {
            if (!take_value(i, parsed.system_prompt)) return std::nullopt;
        } else if (std::strcmp(argv[i], "--stream") == 0) {
            parsed.stream = true;
        } else if (std::strcmp(argv[i], "--list") == 0) {
            parsed.list = true;
        } else if (std::strcmp(argv[i], "--development") == 0) {
            parsed.development_mode = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            parsed.help = true;
        } else {
            if (!parsed.prompt.empty()) {
                parsed.prompt += ' ';
            }
            parsed.prompt += argv[i];
        }
    }
    return parsed;
}

void print_providers()
{
    for (const auto& provider : list_providers()) {
        std::cout << provider.id << " (" << provider.name << ")\n";
        for (const auto& model : provider.models) {
            std::cout << "  " << model.id << (model.is_default ? " [default]" : "")
                      << "  " << model.name << ", " << model.context_window << " tokens\n";
        }
    }
}

std::unique_ptr<ChatGateway> make_gateway(Settings& settings,
                                          std::shared_ptr<CredentialStore> credentials)
{
    auto transport = std::make_shared<CurlTransport>();
    try {
        return std::make_unique<ChatGateway>(transport, credentials, settings.get_client_config());
    } catch (const ConfigurationError& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("{} ({}); falling back to built-in defaults",
                         ErrorCodes::ErrorCatalog::get_error_info(ErrorCodes::Code::CONFIG_INVALID).message,
                         ex.what());
        }
        ClientConfig fallback;
        fallback.timeout = settings.get_timeout();
        return std::make_unique<ChatGateway>(transport, credentials, fallback);
    }
}

void report_usage(const TokenUsage& usage)
{
    if (!usage.input_tokens && !usage.output_tokens) {
        return;
    }
    const auto show = [](const std::optional<int>& value) {
        return value ? std::to_string(*value) : std::string("n/a");
    };
    std::fprintf(stderr, "[tokens] in: %s, out: %s", show(usage.input_tokens).c_str(),
                 show(usage.output_tokens).c_str());
    if (usage.reasoning_tokens) {
        std::fprintf(stderr, ", reasoning: %d", *usage.reasoning_tokens);
    }
    std::fprintf(stderr, "\n");
}

int run_prompt(ChatGateway& gateway, const ParsedArguments& args)
{
    std::vector<ChatMessage> messages;
    if (args.system_prompt) {
        messages.push_back({MessageRole::System, *args.system_prompt});
    }
    messages.push_back({MessageRole::User, args.prompt});

    if (args.stream) {
        ChunkStream stream = gateway.complete_streaming(messages);
        std::optional<std::string> finish_reason;
        while (auto chunk = stream.next()) {
            std::cout << chunk->content << std::flush;
            if (chunk->finish_reason) {
                finish_reason = chunk->finish_reason;
            }
        }
        std::cout << std::endl;
        if (finish_reason) {
            std::fprintf(stderr, "[finish] %s\n", finish_reason->c_str());
        }
        if (stream.dropped_frames() > 0) {
            std::fprintf(stderr, "[warning] %zu malformed stream frames skipped\n", stream.dropped_frames());
        }
        return EXIT_SUCCESS;
    }

    const CompletionResult result = gateway.complete(messages);
    if (result.reasoning && args.development_mode) {
        std::fprintf(stderr, "[reasoning]\n%s\n", result.reasoning->c_str());
    }
    std::cout << result.content << std::endl;
    if (result.finish_reason) {
        std::fprintf(stderr, "[finish] %s\n", result.finish_reason->c_str());
    }
    report_usage(result.usage);
    return EXIT_SUCCESS;
}

int run_application(const ParsedArguments& args)
{
    if (args.list) {
        print_providers();
        return EXIT_SUCCESS;
    }
    if (args.prompt.empty()) {
        print_usage(stderr);
        return EXIT_FAILURE;
    }

    Settings settings;
    settings.load();
    if (args.development_mode) {
        settings.set_development_logging(true);
    }
    if (settings.get_development_logging()) {
        Logger::set_level("debug");
    }

    auto credentials = std::make_shared<CredentialStore>(
        std::make_shared<IniCredentialFile>(IniCredentialFile::default_path()));
    auto gateway = make_gateway(settings, credentials);

    if (args.provider || args.model) {
        const std::string provider_id = args.provider.value_or(gateway->config().provider_id);
        const ProviderInfo info = gateway->configure(provider_id, args.model, args.api_key);
        settings.set_client_config(gateway->config());
        if (!settings.save()) {
            std::fprintf(stderr, "%s\n",
                         ErrorCodes::ErrorCatalog::get_error_info(ErrorCodes::Code::CONFIG_SAVE_FAILED)
                             .get_user_message().c_str());
        }
        std::fprintf(stderr, "[model] %s / %s\n", info.provider_name.c_str(), info.model_name.c_str());
    } else if (args.api_key) {
        if (!gateway->set_api_key(gateway->config().provider_id, *args.api_key)) {
            std::fprintf(stderr, "%s\n",
                         ErrorCodes::ErrorCatalog::get_error_info(ErrorCodes::Code::CONFIG_SAVE_FAILED)
                             .get_user_message().c_str());
        }
    }

    const std::string& active_provider = gateway->config().provider_id;
    if (!credentials->has(active_provider)) {
        const auto info = ErrorCodes::ErrorCatalog::get_error_info(
            ErrorCodes::Code::API_KEY_MISSING,
            "set " + CredentialStore::env_var_for(active_provider));
        std::fprintf(stderr, "[warning] %s\n", info.get_user_message().c_str());
    }

    return run_prompt(*gateway, args);
}

int report_error(const ErrorCodes::AppException& ex, const char* label)
{
    std::fprintf(stderr, "%s: %s\n", label, ex.get_user_message().c_str());
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->error("{}", ex.get_full_details());
    }
    return EXIT_FAILURE;
}

} // namespace


int main(int argc, char **argv) {
    const auto parsed_args = parse_command_line(argc, argv);
    if (!parsed_args) {
        print_usage(stderr);
        return EXIT_FAILURE;
    }
    if (parsed_args->help) {
        print_usage(stdout);
        return EXIT_SUCCESS;
    }

    if (!initialize_loggers()) {
        return EXIT_FAILURE;
    }
    curl_global_init(CURL_GLOBAL_DEFAULT);
    struct CurlCleanup {
        ~CurlCleanup() { curl_global_cleanup(); }
    } curl_cleanup;

    try {
        return run_application(*parsed_args);
    } catch (const AuthError& ex) {
        return report_error(ex, ("Authentication failed for " + ex.provider_id()).c_str());
    } catch (const TimeoutError& ex) {
        return report_error(ex, "Timed out");
    } catch (const HttpError& ex) {
        return report_error(ex, ("HTTP " + std::to_string(ex.status_code())).c_str());
    } catch (const NetworkError& ex) {
        return report_error(ex, "Network error");
    } catch (const ConfigurationError& ex) {
        return report_error(ex, "Configuration error");
    } catch (const ErrorCodes::AppException& ex) {
        return report_error(ex, "Error");
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return EXIT_FAILURE;
    }
}
