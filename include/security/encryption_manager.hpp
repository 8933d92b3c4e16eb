#pragma once

#include "core/error.hpp"
#include "security/aead_cipher.hpp"
#include "security/key_ring.hpp"
#include "security/key_store.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace vaultstream {

/// Opaque encrypted value: iv || ciphertext || tag under one ring key
using Token = std::vector<uint8_t>;

/**
 * @brief Result of decrypt(): a JSON record when the plaintext parses as a
 * JSON object or array, the plaintext text otherwise.
 *
 * The split is a guess made from the bytes alone. Text that happens to be a
 * JSON object comes back as a record.
 */
using DecryptedValue = std::variant<std::string, nlohmann::json>;

/**
 * @brief At-rest encryption under a rotating key ring.
 *
 * New data is sealed with the primary key; decryption tries every ring key,
 * newest first. Not safe for concurrent rotation from several threads or
 * processes sharing one key file.
 */
class EncryptionManager {
public:
    struct Config {
        std::filesystem::path key_file = "config/encryption_keys/current_keys.json";
        std::optional<std::string> password;
        std::chrono::hours rotation_interval{24 * 90};
        size_t max_keys = 5;
        std::vector<std::filesystem::path> reencrypt_dirs;
        std::string reencrypt_pattern = "*.enc";
    };

    static constexpr std::string_view kEncryptedSuffix = ".enc";
    static constexpr std::string_view kDecryptedSuffix = ".dec";

    /**
     * @brief Load or create the key ring, then rotate if the primary expired.
     * @throws KeyInitializationError when no usable key could be produced
     */
    explicit EncryptionManager(Config config);

    // ---- Values -----------------------------------------------------------

    [[nodiscard]] Result<Token> encrypt(std::string_view text) const;
    [[nodiscard]] Result<Token> encrypt(const std::string& text) const {
        return encrypt(std::string_view(text));
    }
    [[nodiscard]] Result<Token> encrypt(const char* text) const {
        return encrypt(std::string_view(text));
    }
    [[nodiscard]] Result<Token> encrypt(const std::vector<uint8_t>& bytes) const;
    [[nodiscard]] Result<Token> encrypt(const nlohmann::json& record) const;

    [[nodiscard]] Result<DecryptedValue> decrypt(const Token& token) const;

    /// Raw plaintext bytes, no JSON detection
    [[nodiscard]] Result<std::vector<uint8_t>> decrypt_bytes(const Token& token) const;

    // ---- Files ------------------------------------------------------------

    /// Writes <path>.enc; the original is left in place
    [[nodiscard]] Result<std::filesystem::path> encrypt_file(const std::filesystem::path& path) const;

    /// Strips .enc when present, otherwise appends .dec
    [[nodiscard]] Result<std::filesystem::path> decrypt_file(const std::filesystem::path& path) const;

    /// Re-seal one file under the primary key in place. Never throws.
    bool reencrypt_file(const std::filesystem::path& path) const;

    /// (successfully re-encrypted, matched) for files directly inside dir
    std::pair<size_t, size_t> reencrypt_directory(const std::filesystem::path& dir,
                                                  const std::string& pattern = "*.enc") const;

    // ---- Rotation ---------------------------------------------------------

    /**
     * @brief Prepend a fresh primary, keep max_keys, persist.
     *
     * The in-memory ring changes only after the store was written. When
     * directories are given they are re-encrypted under the new primary
     * before the oldest keys are evicted.
     * @return ring size after rotation
     */
    Result<size_t> rotate_keys(size_t max_keys);
    Result<size_t> rotate_keys(size_t max_keys,
                               const std::vector<std::filesystem::path>& reencrypt_dirs);

    [[nodiscard]] bool rotation_due() const;

    // ---- Introspection ----------------------------------------------------

    [[nodiscard]] size_t key_count() const { return ring_.size(); }
    [[nodiscard]] const KeyRing& ring() const { return ring_; }
    [[nodiscard]] std::chrono::system_clock::time_point primary_created_at() const;
    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
    KeyStore store_;
    KeyRing ring_;

    void initialize_ring();
    void check_rotation();
    [[nodiscard]] Result<Token> encrypt_raw(const uint8_t* data, size_t len) const;
};

} // namespace vaultstream
