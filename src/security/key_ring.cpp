#include "security/key_ring.hpp"
#include "security/aead_cipher.hpp"
#include "security/password_kdf.hpp"

#include <algorithm>

namespace vaultstream {

Result<size_t> KeyRing::generate() {
    auto secret = AeadCipher::random_bytes(AeadCipher::kKeyLen);
    if (!secret) {
        return Result<size_t>::error(ErrorCategory::KEY_INITIALIZATION_ERROR,
                                     "RAND_bytes failed generating key");
    }
    prepend(KeyRecord(std::move(*secret), std::chrono::system_clock::now()));
    return Result<size_t>::ok(keys_.size());
}

Result<size_t> KeyRing::derive_from_password(std::string_view password,
                                             const std::vector<uint8_t>& salt) {
    auto derived = PasswordKdf::derive(password, salt);
    if (derived.is_error()) {
        return Result<size_t>::error_from(derived);
    }
    prepend(KeyRecord(std::move(derived.value()), std::chrono::system_clock::now()));
    return Result<size_t>::ok(keys_.size());
}

void KeyRing::prepend(KeyRecord record) {
    keys_.insert(keys_.begin(), std::move(record));
}

void KeyRing::truncate(size_t max_keys) {
    const size_t keep = std::max<size_t>(max_keys, 1);
    if (keys_.size() > keep) {
        keys_.erase(keys_.begin() + static_cast<std::ptrdiff_t>(keep), keys_.end());
    }
}

bool KeyRing::contains(const std::vector<uint8_t>& secret) const {
    return std::any_of(keys_.begin(), keys_.end(),
                       [&secret](const KeyRecord& key) { return key.secret == secret; });
}

} // namespace vaultstream
