#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "helpers/tmp_dir.hpp"

#include <cstdlib>

using namespace vaultstream;
using namespace std::chrono_literals;
using vaultstream::test::TmpDir;

// ============================================================================
// Defaults and extraction
// ============================================================================

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.encryption.key_file == "config/encryption_keys/current_keys.json");
    CHECK_FALSE(cfg.encryption.password.has_value());
    CHECK(cfg.encryption.rotation_days == 90);
    CHECK(cfg.encryption.max_keys == 5);
    CHECK(cfg.encryption.reencrypt_dirs.empty());
    CHECK(cfg.encryption.reencrypt_pattern == "*.enc");
    CHECK(cfg.stream.max_tokens == 20);
    CHECK(cfg.stream.max_bytes == 2048);
    CHECK(cfg.stream.max_delay_ms == 40);
}

TEST_CASE("ConfigLoader: all sections are read", "[config]") {
    const std::string toml = R"(
[logging]
level = "debug"

[encryption]
key_file = "/var/lib/vault/keys.json"
password = "hunter2"
rotation_days = 30
max_keys = 3
reencrypt_dirs = ["/data/a", "/data/b"]
reencrypt_pattern = "*.sealed"

[stream]
max_tokens = 10
max_bytes = 512
max_delay_ms = 25
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.encryption.key_file == "/var/lib/vault/keys.json");
    CHECK(cfg.encryption.password == "hunter2");
    CHECK(cfg.encryption.rotation_days == 30);
    CHECK(cfg.encryption.max_keys == 3);
    CHECK(cfg.encryption.reencrypt_dirs == std::vector<std::string>{"/data/a", "/data/b"});
    CHECK(cfg.encryption.reencrypt_pattern == "*.sealed");
    CHECK(cfg.stream.max_tokens == 10);
    CHECK(cfg.stream.max_bytes == 512);
    CHECK(cfg.stream.max_delay_ms == 25);

    const auto manager_cfg = to_manager_config(cfg.encryption);
    CHECK(manager_cfg.key_file.string() == "/var/lib/vault/keys.json");
    CHECK(manager_cfg.rotation_interval == std::chrono::hours(24 * 30));
    CHECK(manager_cfg.max_keys == 3);
    CHECK(manager_cfg.reencrypt_dirs.size() == 2);

    const auto batching = to_batching_config(cfg.stream);
    CHECK(batching.max_tokens == 10);
    CHECK(batching.max_bytes == 512);
    CHECK(batching.max_delay == 25ms);
}

TEST_CASE("ConfigLoader: env vars expand and empty password means none", "[config][env]") {
    ::setenv("VAULTSTREAM_TEST_PW", "from-env", 1);
    ::unsetenv("VAULTSTREAM_TEST_UNSET");

    auto set = ConfigLoader::load_from_string(R"(
[encryption]
password = "${VAULTSTREAM_TEST_PW}"
key_file = "${VAULTSTREAM_TEST_UNSET}/keys.json"
)");
    REQUIRE(set.success);
    CHECK(set.config.encryption.password == "from-env");
    CHECK(set.config.encryption.key_file == "/keys.json");

    auto unset = ConfigLoader::load_from_string(R"(
[encryption]
password = "${VAULTSTREAM_TEST_UNSET}"
)");
    REQUIRE(unset.success);
    CHECK_FALSE(unset.config.encryption.password.has_value());
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("ConfigValidation: bad values are all reported", "[config][validation]") {
    const std::string toml = R"(
[logging]
level = "loud"

[encryption]
rotation_days = 0
max_keys = 0

[stream]
max_tokens = 0
max_bytes = -1
max_delay_ms = -5
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    for (const char* field : {"logging.level", "rotation_days", "max_keys",
                              "max_tokens", "max_bytes", "max_delay_ms"}) {
        CHECK(result.error_message.find(field) != std::string::npos);
    }
}

TEST_CASE("ConfigValidation: zero delay is allowed", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[stream]\nmax_delay_ms = 0\n");
    CHECK(result.success);
}

TEST_CASE("ConfigLoader: syntax errors are reported", "[config]") {
    auto result = ConfigLoader::load_from_string("[encryption\nmax_keys = 3");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

// ============================================================================
// Files and includes
// ============================================================================

TEST_CASE("ConfigLoader: include merges with the including file winning", "[config][include]") {
    TmpDir tmp;
    tmp.file("base.toml", R"(
[encryption]
max_keys = 7
rotation_days = 14

[stream]
max_tokens = 4
)");
    const auto main_path = tmp.file("main.toml", R"(
include = "base.toml"

[encryption]
max_keys = 2
)");

    auto result = ConfigLoader::load_from_file(main_path.string());
    REQUIRE(result.success);
    CHECK(result.config.encryption.max_keys == 2);
    CHECK(result.config.encryption.rotation_days == 14);
    CHECK(result.config.stream.max_tokens == 4);
}

TEST_CASE("ConfigLoader: circular include is an error", "[config][include]") {
    TmpDir tmp;
    tmp.file("a.toml", "include = \"b.toml\"\n");
    tmp.file("b.toml", "include = \"a.toml\"\n");

    auto result = ConfigLoader::load_from_file((tmp.path / "a.toml").string());
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Circular") != std::string::npos);
}

TEST_CASE("ConfigLoader: missing file is an error", "[config]") {
    TmpDir tmp;
    auto result = ConfigLoader::load_from_file((tmp.path / "nope.toml").string());
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") != std::string::npos);
}
