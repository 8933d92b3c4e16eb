#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string_view>
#include <vector>

namespace vaultstream {

struct KeyRecord {
    std::vector<uint8_t> secret;     // 256-bit symmetric key
    std::chrono::system_clock::time_point created_at;

    KeyRecord(std::vector<uint8_t> s, std::chrono::system_clock::time_point t)
        : secret(std::move(s)), created_at(t) {}
};

/**
 * @brief Ordered key history, newest first.
 *
 * keys()[0] is the primary key used for every new encryption. All keys
 * stay valid for decryption until truncate() evicts them from the tail.
 */
class KeyRing {
public:
    KeyRing() = default;
    explicit KeyRing(std::vector<KeyRecord> keys) : keys_(std::move(keys)) {}

    /// Fresh random key, stamped now, prepended as primary
    [[nodiscard]] Result<size_t> generate();

    /// PBKDF2 key from password and salt, stamped now, prepended as primary
    [[nodiscard]] Result<size_t> derive_from_password(std::string_view password,
                                                      const std::vector<uint8_t>& salt);

    void prepend(KeyRecord record);

    /// Keep at most max_keys entries (never drops the primary)
    void truncate(size_t max_keys);

    [[nodiscard]] bool contains(const std::vector<uint8_t>& secret) const;

    [[nodiscard]] const KeyRecord* primary() const {
        return keys_.empty() ? nullptr : &keys_.front();
    }

    [[nodiscard]] const std::vector<KeyRecord>& keys() const { return keys_; }
    [[nodiscard]] size_t size() const { return keys_.size(); }
    [[nodiscard]] bool empty() const { return keys_.empty(); }

private:
    std::vector<KeyRecord> keys_;
};

} // namespace vaultstream
