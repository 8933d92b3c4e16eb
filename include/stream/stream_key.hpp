#pragma once

#include "core/error.hpp"
#include "security/aead_cipher.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace vaultstream::stream {

inline constexpr std::string_view kSaltPrefix = "chat-stream-v1:";
inline constexpr std::string_view kHkdfInfo = "e2ee-stream/aes-gcm";

/// SHA-256("chat-stream-v1:" + conversation_id), 32 bytes
[[nodiscard]] std::vector<uint8_t> conversation_salt(std::string_view conversation_id);

/**
 * @brief HKDF-SHA256(secret, conversation_salt(cid), kHkdfInfo) -> 32 bytes.
 *
 * Deterministic: both ends holding the same secret and conversation id
 * derive the same key. Different conversations never share a key.
 */
[[nodiscard]] Result<std::vector<uint8_t>> derive_stream_key_bytes(
    const std::vector<uint8_t>& shared_secret, std::string_view conversation_id);

/// @throws EncryptionError if HKDF fails
[[nodiscard]] AeadCipher derive_stream_key(const std::vector<uint8_t>& shared_secret,
                                           std::string_view conversation_id);

} // namespace vaultstream::stream
