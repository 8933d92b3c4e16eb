#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace vaultstream {

/**
 * @brief AES-256-GCM with a 96-bit IV and a 128-bit tag.
 *
 * Sealed output is ciphertext || tag. Tokens produced by seal_token() are
 * iv || ciphertext || tag and carry no key identifier; callers holding
 * several keys find the right one by trial.
 */
class AeadCipher {
public:
    static constexpr size_t kKeyLen = 32;
    static constexpr size_t kIvLen = 12;
    static constexpr size_t kTagLen = 16;

    /// @throws std::invalid_argument if key is not 32 bytes
    explicit AeadCipher(std::vector<uint8_t> key);

    [[nodiscard]] Result<std::vector<uint8_t>> seal(
        const std::vector<uint8_t>& iv,
        const uint8_t* plaintext, size_t plaintext_len,
        std::string_view aad = {}) const;

    /// nullopt when the tag does not verify or the input is malformed
    [[nodiscard]] std::optional<std::vector<uint8_t>> open(
        const std::vector<uint8_t>& iv,
        const std::vector<uint8_t>& ciphertext_and_tag,
        std::string_view aad = {}) const;

    /// Seal under a fresh random IV and pack iv || ciphertext || tag
    [[nodiscard]] Result<std::vector<uint8_t>> seal_token(
        const uint8_t* plaintext, size_t plaintext_len) const;

    [[nodiscard]] std::optional<std::vector<uint8_t>> open_token(
        const std::vector<uint8_t>& token) const;

    [[nodiscard]] const std::vector<uint8_t>& key() const { return key_; }

    /// Bytes from the OpenSSL CSPRNG; nullopt if RAND_bytes fails
    [[nodiscard]] static std::optional<std::vector<uint8_t>> random_bytes(size_t count);

private:
    std::vector<uint8_t> key_;
};

} // namespace vaultstream
