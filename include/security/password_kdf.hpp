#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace vaultstream {

/// PBKDF2-HMAC-SHA256 key derivation for password-backed key rings
struct PasswordKdf {
    static constexpr int kIterations = 100000;
    static constexpr size_t kKeyLen = 32;
    static constexpr size_t kSaltLen = 16;

    [[nodiscard]] static Result<std::vector<uint8_t>> derive(
        std::string_view password,
        const std::vector<uint8_t>& salt,
        int iterations = kIterations);
};

} // namespace vaultstream
