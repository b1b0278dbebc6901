#include <catch2/catch_test_macros.hpp>

#include "CredentialStore.hpp"
#include "IniConfig.hpp"
#include "TestHelpers.hpp"

#include <filesystem>
#include <fstream>
#include <memory>

TEST_CASE("CredentialStore loads persisted secrets on construction") {
    ProviderKeyEnvGuard env_guard;
    auto persistence = std::make_shared<MemoryCredentialPersistence>(
        std::map<std::string, std::string>{{"openai", "sk-1"}, {"xai", "xk-2"}});
    CredentialStore store(persistence);

    REQUIRE(store.get("openai") == std::optional<std::string>("sk-1"));
    REQUIRE(store.has("xai"));
    REQUIRE_FALSE(store.has("anthropic"));
    REQUIRE(store.providers() == std::vector<std::string>{"openai", "xai"});
}

TEST_CASE("CredentialStore persists every change") {
    ProviderKeyEnvGuard env_guard;
    auto persistence = std::make_shared<MemoryCredentialPersistence>();
    CredentialStore store(persistence);

    REQUIRE(store.set("anthropic", "ak-1"));
    REQUIRE(persistence->stored == std::map<std::string, std::string>{{"anthropic", "ak-1"}});

    REQUIRE(store.set("anthropic", ""));
    REQUIRE(persistence->stored.empty());
    REQUIRE_FALSE(store.has("anthropic"));
    REQUIRE(persistence->save_count == 2);
}

TEST_CASE("CredentialStore keeps the secret in memory when saving fails") {
    ProviderKeyEnvGuard env_guard;
    auto persistence = std::make_shared<MemoryCredentialPersistence>();
    persistence->fail_saves = true;
    CredentialStore store(persistence);

    REQUIRE_FALSE(store.set("google", "g-1"));
    REQUIRE(store.get("google") == std::optional<std::string>("g-1"));
}

TEST_CASE("CredentialStore falls back to provider environment variables") {
    ProviderKeyEnvGuard env_guard;
    EnvVarGuard key_guard("OPENROUTER_API_KEY", std::string("or-env"));

    CredentialStore with_env(std::make_shared<MemoryCredentialPersistence>());
    REQUIRE(CredentialStore::env_var_for("openrouter") == "OPENROUTER_API_KEY");
    REQUIRE(with_env.get("openrouter") == std::optional<std::string>("or-env"));
    REQUIRE(with_env.providers().empty());

    with_env.set("openrouter", "or-stored");
    REQUIRE(with_env.get("openrouter") == std::optional<std::string>("or-stored"));

    CredentialStore without_env(std::make_shared<MemoryCredentialPersistence>(), false);
    REQUIRE_FALSE(without_env.get("openrouter").has_value());
}

TEST_CASE("IniCredentialFile round-trips secrets through credentials.ini") {
    TempDir temp;
    const auto path = (temp.path() / "nested" / "credentials.ini").string();

    IniCredentialFile file(path);
    REQUIRE(file.load().empty());
    REQUIRE(file.save({{"google", "g-1"}, {"mistral", "m-2"}}));
    REQUIRE(std::filesystem::exists(path));

    IniConfig ini;
    REQUIRE(ini.load(path));
    REQUIRE(ini.getValue("Credentials", "mistral") == "m-2");

    IniCredentialFile reloaded(path);
    REQUIRE(reloaded.load() == std::map<std::string, std::string>{{"google", "g-1"}, {"mistral", "m-2"}});
}

TEST_CASE("IniCredentialFile defaults to the configuration directory") {
    TempDir temp;
    EnvVarGuard config_guard("LLM_GATEWAY_CONFIG_DIR", temp.path().string());
    REQUIRE(IniCredentialFile::default_path() ==
            (temp.path() / "LlmGateway" / "credentials.ini").string());
}

#ifndef _WIN32
TEST_CASE("IniCredentialFile leaves credentials.ini readable by the owner only") {
    using std::filesystem::perms;
    TempDir temp;
    const auto path = temp.path() / "credentials.ini";
    {
        std::ofstream existing(path);
        existing << "[Credentials]\nopenai = old\n";
    }
    std::filesystem::permissions(path, perms::owner_read | perms::owner_write | perms::group_read |
                                       perms::others_read);

    IniCredentialFile file(path.string());
    REQUIRE(file.save({{"openai", "sk-new"}}));

    const auto mode = std::filesystem::status(path).permissions();
    CHECK((mode & perms::owner_read) != perms::none);
    CHECK((mode & perms::owner_write) != perms::none);
    CHECK((mode & (perms::group_all | perms::others_all)) == perms::none);
    CHECK_FALSE(std::filesystem::exists(path.string() + ".tmp"));
    CHECK(file.load() == std::map<std::string, std::string>{{"openai", "sk-new"}});
}

TEST_CASE("IniConfig owner-only save replaces a stale staging file") {
    using std::filesystem::perms;
    TempDir temp;
    const auto path = temp.path() / "credentials.ini";
    {
        std::ofstream stale(path.string() + ".tmp");
        stale << "leftover";
    }
    std::filesystem::permissions(path.string() + ".tmp", perms::owner_read | perms::owner_write |
                                                         perms::group_read | perms::others_read);

    IniConfig ini;
    ini.setValue("Credentials", "xai", "xk-1");
    REQUIRE(ini.save(path.string(), true));

    const auto mode = std::filesystem::status(path).permissions();
    CHECK((mode & (perms::group_all | perms::others_all)) == perms::none);
    IniConfig reloaded;
    REQUIRE(reloaded.load(path.string()));
    CHECK(reloaded.getValue("Credentials", "xai") == "xk-1");
}
#endif
