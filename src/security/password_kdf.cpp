#include "security/password_kdf.hpp"

#include <openssl/evp.h>

namespace vaultstream {

Result<std::vector<uint8_t>> PasswordKdf::derive(
    std::string_view password,
    const std::vector<uint8_t>& salt,
    int iterations) {
    using R = Result<std::vector<uint8_t>>;
    if (salt.empty()) {
        return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR, "PBKDF2 salt must not be empty");
    }
    if (iterations < kIterations) {
        return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR,
                        "PBKDF2 iteration count below 100000");
    }

    std::vector<uint8_t> key(kKeyLen);
    if (PKCS5_PBKDF2_HMAC(
            password.data(), static_cast<int>(password.size()),
            salt.data(), static_cast<int>(salt.size()),
            iterations,
            EVP_sha256(),
            static_cast<int>(key.size()), key.data()) != 1) {
        return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR, "PKCS5_PBKDF2_HMAC failed");
    }
    return R::ok(std::move(key));
}

} // namespace vaultstream
