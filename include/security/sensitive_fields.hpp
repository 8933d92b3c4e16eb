#pragma once

#include "core/error.hpp"
#include "security/encryption_manager.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace vaultstream {

/// Suffix of the boolean flag marking an encrypted field
inline constexpr std::string_view kEncryptedFlagSuffix = "_encrypted";

/**
 * @brief Encrypt selected top-level fields of a JSON object.
 *
 * Works on a copy. Each named field that is present and not null is
 * replaced by base64(token) and "<field>_encrypted": true is added.
 * String values are sealed as their text, anything else as its compact
 * JSON dump.
 */
[[nodiscard]] Result<nlohmann::json> encrypt_sensitive_fields(
    const EncryptionManager& manager,
    const nlohmann::json& record,
    const std::vector<std::string>& fields);

/**
 * @brief Reverse of encrypt_sensitive_fields().
 *
 * Every "<field>_encrypted": true flag whose field is present is decrypted
 * and the flag removed. Objects and arrays come back structured, other
 * values as strings, so {"pin": 1234} round-trips to {"pin": "1234"}.
 */
[[nodiscard]] Result<nlohmann::json> decrypt_sensitive_fields(
    const EncryptionManager& manager,
    const nlohmann::json& record);

} // namespace vaultstream
