#pragma once

#include "core/error.hpp"
#include "security/key_ring.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace vaultstream {

/**
 * @brief JSON key-store file.
 *
 * Format: [{"key": "<base64>", "timestamp": "<ISO-8601>"}, ...], newest
 * first. Every save rewrites the whole file through a temp file and a
 * rename. The password salt lives beside it in <key_file>.salt.
 */
class KeyStore {
public:
    explicit KeyStore(std::filesystem::path key_file);

    [[nodiscard]] bool exists() const;

    /// Errors on missing, unreadable or malformed stores
    [[nodiscard]] Result<KeyRing> load() const;

    [[nodiscard]] Result<size_t> save(const KeyRing& ring) const;

    /// Read the installation salt, creating and persisting it on first use
    [[nodiscard]] Result<std::vector<uint8_t>> load_or_create_salt() const;

    [[nodiscard]] const std::filesystem::path& path() const { return key_file_; }
    [[nodiscard]] std::filesystem::path salt_path() const;

    /// Serialize / parse the store body (exposed for tests)
    [[nodiscard]] static std::string serialize(const KeyRing& ring);
    [[nodiscard]] static Result<KeyRing> parse(const std::string& content);

private:
    std::filesystem::path key_file_;
};

} // namespace vaultstream
