#ifndef CREDENTIALSTORE_HPP
#define CREDENTIALSTORE_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Load/save collaborator for the provider -> secret map.
 */
class CredentialPersistence {
public:
    virtual ~CredentialPersistence() = default;
    virtual std::map<std::string, std::string> load() = 0;
    virtual bool save(const std::map<std::string, std::string>& secrets) = 0;
};

/**
 * @brief Stores secrets as "[Credentials] <provider> = <secret>" in an INI file.
 */
class IniCredentialFile : public CredentialPersistence {
public:
    explicit IniCredentialFile(std::string path);

    // Default location: <config dir>/credentials.ini
    static std::string default_path();

    std::map<std::string, std::string> load() override;
    bool save(const std::map<std::string, std::string>& secrets) override;

private:
    std::string path_;
};

/**
 * @brief Provider -> secret mapping. Stored secrets win over the environment;
 * without either, get() returns std::nullopt and the request is sent unauthenticated.
 */
class CredentialStore {
public:
    explicit CredentialStore(std::shared_ptr<CredentialPersistence> persistence = nullptr,
                             bool use_environment = true);

    std::optional<std::string> get(const std::string& provider_id) const;

    /**
     * @brief Stores and persists a secret; an empty secret removes the entry.
     * @return False when persisting failed; the in-memory value is kept either way.
     */
    bool set(const std::string& provider_id, const std::string& secret);

    bool has(const std::string& provider_id) const;
    std::vector<std::string> providers() const;

    /**
     * @brief Reads <PROVIDER>_API_KEY (GOOGLE_API_KEY, OPENAI_API_KEY, ...).
     */
    static std::optional<std::string> get_api_key_from_env(const std::string& provider_id);
    static std::string env_var_for(const std::string& provider_id);

private:
    std::shared_ptr<CredentialPersistence> persistence_;
    bool use_environment_;
    std::map<std::string, std::string> secrets_;
};

#endif // CREDENTIALSTORE_HPP
