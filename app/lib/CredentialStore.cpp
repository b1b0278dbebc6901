#include "CredentialStore.hpp"
#include "IniConfig.hpp"
#include "Logger.hpp"
#include "Settings.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>

namespace {
constexpr const char* kCredentialsSection = "Credentials";
}

IniCredentialFile::IniCredentialFile(std::string path)
    : path_(std::move(path))
{
}

std::string IniCredentialFile::default_path()
{
    return (std::filesystem::path(Settings::define_config_dir()) / "credentials.ini").string();
}

std::map<std::string, std::string> IniCredentialFile::load()
{
    IniConfig ini;
    if (!ini.load(path_)) {
        return {};
    }
    return ini.sectionValues(kCredentialsSection);
}

bool IniCredentialFile::save(const std::map<std::string, std::string>& secrets)
{
    std::error_code ec;
    const auto dir = std::filesystem::path(path_).parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
    }

    IniConfig ini;
    for (const auto& [provider, secret] : secrets) {
        ini.setValue(kCredentialsSection, provider, secret);
    }
    return ini.save(path_, true);
}

CredentialStore::CredentialStore(std::shared_ptr<CredentialPersistence> persistence,
                                 bool use_environment)
    : persistence_(std::move(persistence)),
      use_environment_(use_environment)
{
    if (persistence_) {
        secrets_ = persistence_->load();
    }
}

std::optional<std::string> CredentialStore::get(const std::string& provider_id) const
{
    const auto it = secrets_.find(provider_id);
    if (it != secrets_.end() && !it->second.empty()) {
        return it->second;
    }
    if (use_environment_) {
        return get_api_key_from_env(provider_id);
    }
    return std::nullopt;
}

bool CredentialStore::set(const std::string& provider_id, const std::string& secret)
{
    if (secret.empty()) {
        secrets_.erase(provider_id);
    } else {
        secrets_[provider_id] = secret;
    }

    if (!persistence_) {
        return true;
    }
    if (!persistence_->save(secrets_)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Failed to persist credential for provider: {}", provider_id);
        }
        return false;
    }
    return true;
}

bool CredentialStore::has(const std::string& provider_id) const
{
    return get(provider_id).has_value();
}

std::vector<std::string> CredentialStore::providers() const
{
    std::vector<std::string> result;
    result.reserve(secrets_.size());
    for (const auto& [provider, secret] : secrets_) {
        if (!secret.empty()) {
            result.push_back(provider);
        }
    }
    return result;
}

std::string CredentialStore::env_var_for(const std::string& provider_id)
{
    return Utils::to_upper_copy(provider_id) + "_API_KEY";
}

std::optional<std::string> CredentialStore::get_api_key_from_env(const std::string& provider_id)
{
    const std::string name = env_var_for(provider_id);
    const char* key = std::getenv(name.c_str());
    if (key && key[0] != '\0') {
        return std::string(key);
    }
    return std::nullopt;
}
