#include <catch2/catch_test_macros.hpp>
#include "core/base64.hpp"
#include "core/utils.hpp"
#include "helpers/tmp_dir.hpp"
#include "security/key_ring.hpp"
#include "security/key_store.hpp"
#include "security/password_kdf.hpp"

#include <nlohmann/json.hpp>

#include <iterator>

using namespace vaultstream;
using vaultstream::test::TmpDir;

// ============================================================================
// KeyRing
// ============================================================================

TEST_CASE("KeyRing generate prepends a new primary", "[keyring]") {
    KeyRing ring;
    CHECK(ring.empty());
    CHECK(ring.primary() == nullptr);

    REQUIRE(ring.generate().is_ok());
    const auto first = ring.primary()->secret;
    REQUIRE(ring.generate().is_ok());

    CHECK(ring.size() == 2);
    CHECK(ring.primary()->secret != first);
    CHECK(ring.keys()[1].secret == first);
    CHECK(ring.primary()->secret.size() == 32);
}

TEST_CASE("KeyRing truncate evicts the oldest and keeps the primary", "[keyring]") {
    KeyRing ring;
    for (int i = 0; i < 4; ++i) REQUIRE(ring.generate().is_ok());
    const auto newest = ring.primary()->secret;
    const auto second = ring.keys()[1].secret;

    ring.truncate(2);
    CHECK(ring.size() == 2);
    CHECK(ring.keys()[0].secret == newest);
    CHECK(ring.keys()[1].secret == second);

    ring.truncate(0);
    CHECK(ring.size() == 1);
    CHECK(ring.primary()->secret == newest);
}

TEST_CASE("KeyRing password derivation matches PBKDF2", "[keyring]") {
    const std::vector<uint8_t> salt(PasswordKdf::kSaltLen, 0x11);
    KeyRing ring;
    REQUIRE(ring.derive_from_password("pw", salt).is_ok());

    auto expected = PasswordKdf::derive("pw", salt);
    REQUIRE(expected.is_ok());
    CHECK(ring.primary()->secret == expected.value());
}

// ============================================================================
// KeyStore format
// ============================================================================

TEST_CASE("KeyStore serializes newest first with base64 keys and ISO timestamps", "[keystore]") {
    KeyRing ring;
    REQUIRE(ring.generate().is_ok());
    REQUIRE(ring.generate().is_ok());

    const auto doc = nlohmann::json::parse(KeyStore::serialize(ring));
    REQUIRE(doc.is_array());
    REQUIRE(doc.size() == 2);
    for (size_t i = 0; i < doc.size(); ++i) {
        const auto key = base64::decode(doc[i]["key"].get<std::string>());
        REQUIRE(key.has_value());
        CHECK(*key == ring.keys()[i].secret);
        CHECK(utils::parse_timestamp(doc[i]["timestamp"].get<std::string>()).has_value());
    }
}

TEST_CASE("KeyStore parse accepts naive timestamps", "[keystore]") {
    const std::string key = base64::encode(std::vector<uint8_t>(32, 0x42));
    const std::string content =
        R"([{"key": ")" + key + R"(", "timestamp": "2024-05-01T10:20:30.123456"}])";

    auto ring = KeyStore::parse(content);
    REQUIRE(ring.is_ok());
    REQUIRE(ring.value().size() == 1);
    CHECK(ring.value().primary()->secret == std::vector<uint8_t>(32, 0x42));
}

TEST_CASE("KeyStore parse rejects malformed stores", "[keystore]") {
    const std::string good_key = base64::encode(std::vector<uint8_t>(32, 1));

    CHECK(KeyStore::parse("not json").is_error());
    CHECK(KeyStore::parse(R"({"key": "x"})").is_error());
    CHECK(KeyStore::parse(R"([{"key": ")" + good_key + R"("}])").is_error());
    CHECK(KeyStore::parse(R"([{"key": "c2hvcnQ=", "timestamp": "2024-01-01T00:00:00"}])").is_error());
    CHECK(KeyStore::parse(R"([{"key": ")" + good_key + R"(", "timestamp": "yesterday"}])").is_error());

    auto err = KeyStore::parse("[1]");
    REQUIRE(err.is_error());
    CHECK(err.error_category() == ErrorCategory::KEY_INITIALIZATION_ERROR);
}

// ============================================================================
// KeyStore files
// ============================================================================

TEST_CASE("KeyStore save then load round-trips the ring", "[keystore]") {
    TmpDir tmp;
    KeyStore store(tmp.path / "keys" / "current_keys.json");
    CHECK_FALSE(store.exists());

    KeyRing ring;
    REQUIRE(ring.generate().is_ok());
    REQUIRE(ring.generate().is_ok());
    auto saved = store.save(ring);
    REQUIRE(saved.is_ok());
    CHECK(saved.value() == 2);
    CHECK(store.exists());

    auto loaded = store.load();
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().size() == 2);
    CHECK(loaded.value().keys()[0].secret == ring.keys()[0].secret);
    CHECK(loaded.value().keys()[1].secret == ring.keys()[1].secret);

    // No temp file left behind
    const auto entries = std::distance(std::filesystem::directory_iterator(tmp.path / "keys"),
                                       std::filesystem::directory_iterator());
    CHECK(entries == 1);
}

TEST_CASE("KeyStore files are owner-only", "[keystore]") {
    TmpDir tmp;
    KeyStore store(tmp.path / "current_keys.json");

    KeyRing ring;
    REQUIRE(ring.generate().is_ok());
    REQUIRE(store.save(ring).is_ok());
    REQUIRE(store.load_or_create_salt().is_ok());

    constexpr auto kOwnerOnly = std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;
    CHECK(std::filesystem::status(store.path()).permissions() == kOwnerOnly);
    CHECK(std::filesystem::status(store.salt_path()).permissions() == kOwnerOnly);

    // A second save replaces the file without widening it
    REQUIRE(ring.generate().is_ok());
    REQUIRE(store.save(ring).is_ok());
    CHECK(std::filesystem::status(store.path()).permissions() == kOwnerOnly);
}

TEST_CASE("KeyStore load of a missing file is a file access error", "[keystore]") {
    TmpDir tmp;
    KeyStore store(tmp.path / "absent.json");
    auto loaded = store.load();
    REQUIRE(loaded.is_error());
    CHECK(loaded.error_category() == ErrorCategory::FILE_ACCESS_ERROR);
}

TEST_CASE("Installation salt is created once and reused", "[keystore][salt]") {
    TmpDir tmp;
    KeyStore store(tmp.path / "current_keys.json");

    auto first = store.load_or_create_salt();
    REQUIRE(first.is_ok());
    CHECK(first.value().size() == PasswordKdf::kSaltLen);
    CHECK(std::filesystem::exists(store.salt_path()));

    auto second = store.load_or_create_salt();
    REQUIRE(second.is_ok());
    CHECK(second.value() == first.value());
}

TEST_CASE("Corrupt salt file is reported", "[keystore][salt]") {
    TmpDir tmp;
    KeyStore store(tmp.path / "current_keys.json");
    tmp.file("current_keys.json.salt", "not-base64!\n");

    auto salt = store.load_or_create_salt();
    REQUIRE(salt.is_error());
    CHECK(salt.error_category() == ErrorCategory::KEY_INITIALIZATION_ERROR);
}
