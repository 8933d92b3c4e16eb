#include "security/encryption_manager.hpp"
#include "core/file_io.hpp"
#include "core/utils.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <format>
#include <system_error>

namespace vaultstream {

using json = nlohmann::json;

EncryptionManager::EncryptionManager(Config config)
    : config_(std::move(config)), store_(config_.key_file) {
    initialize_ring();
    check_rotation();
    if (ring_.empty()) {
        throw KeyInitializationError("No usable encryption key after initialization");
    }
}

// ============================================================================
// Key lifecycle
// ============================================================================

void EncryptionManager::initialize_ring() {
    bool dirty = false;

    if (store_.exists()) {
        auto loaded = store_.load();
        if (loaded.is_ok() && !loaded.value().empty()) {
            ring_ = std::move(loaded.value());
            utils::log::info(std::format("Loaded {} encryption keys from {}",
                                         ring_.size(), store_.path().string()));
        } else if (loaded.is_error()) {
            utils::log::warn(std::format("Error loading encryption keys: {}; generating a new key",
                                         loaded.error_message()));
        }
    }

    if (config_.password) {
        auto salt = store_.load_or_create_salt();
        if (salt.is_error()) {
            throw KeyInitializationError(salt.error_message());
        }
        KeyRing derived_ring;
        auto derived = derived_ring.derive_from_password(*config_.password, salt.value());
        if (derived.is_error()) {
            throw KeyInitializationError(derived.error_message());
        }
        const KeyRecord& derived_key = *derived_ring.primary();
        // Already in the ring means a later rotation superseded it; keep that order
        if (!ring_.contains(derived_key.secret)) {
            ring_.prepend(derived_key);
            ring_.truncate(config_.max_keys);
            dirty = true;
            utils::log::info("Derived new encryption key from password");
        }
    }

    if (ring_.empty()) {
        auto generated = ring_.generate();
        if (generated.is_error()) {
            throw KeyInitializationError(generated.error_message());
        }
        dirty = true;
        utils::log::info("Generated new encryption key");
    }

    if (dirty) {
        auto saved = store_.save(ring_);
        if (saved.is_error()) {
            throw KeyInitializationError(
                std::format("Cannot persist encryption keys: {}", saved.error_message()));
        }
    }
}

bool EncryptionManager::rotation_due() const {
    const auto* primary = ring_.primary();
    if (!primary) return true;
    return std::chrono::system_clock::now() - primary->created_at > config_.rotation_interval;
}

void EncryptionManager::check_rotation() {
    if (!rotation_due()) return;

    utils::log::info("Key rotation needed - primary key has expired");
    auto rotated = rotate_keys(config_.max_keys, config_.reencrypt_dirs);
    if (rotated.is_error()) {
        utils::log::error(std::format("Error rotating expired key, continuing with existing keys: {}",
                                      rotated.error_message()));
    }
}

std::chrono::system_clock::time_point EncryptionManager::primary_created_at() const {
    const auto* primary = ring_.primary();
    return primary ? primary->created_at : std::chrono::system_clock::time_point{};
}

Result<size_t> EncryptionManager::rotate_keys(size_t max_keys) {
    return rotate_keys(max_keys, config_.reencrypt_dirs);
}

Result<size_t> EncryptionManager::rotate_keys(
    size_t max_keys, const std::vector<std::filesystem::path>& reencrypt_dirs) {
    // Work on a copy so a failed generate or save leaves the ring untouched
    KeyRing next = ring_;
    auto generated = next.generate();
    if (generated.is_error()) {
        return generated;
    }
    // Keys to be evicted stay until the directories have been moved off them
    if (reencrypt_dirs.empty()) {
        next.truncate(max_keys);
    }

    auto saved = store_.save(next);
    if (saved.is_error()) {
        utils::log::error(std::format("Key rotation aborted: {}", saved.error_message()));
        return saved;
    }
    ring_ = std::move(next);
    utils::log::info(std::format("Rotated encryption keys, now using {} keys", ring_.size()));

    if (reencrypt_dirs.empty()) {
        return Result<size_t>::ok(ring_.size());
    }

    size_t total_success = 0;
    size_t total_files = 0;
    for (const auto& dir : reencrypt_dirs) {
        utils::log::info(std::format("Reencrypting files in {}", dir.string()));
        const auto [success, total] = reencrypt_directory(dir, config_.reencrypt_pattern);
        total_success += success;
        total_files += total;
    }
    utils::log::info(std::format(
        "Reencryption after key rotation: {}/{} files successfully reencrypted",
        total_success, total_files));

    KeyRing trimmed = ring_;
    trimmed.truncate(max_keys);
    if (trimmed.size() != ring_.size()) {
        auto trimmed_saved = store_.save(trimmed);
        if (trimmed_saved.is_error()) {
            utils::log::warn(std::format("Could not evict old keys, keeping {}: {}",
                                         ring_.size(), trimmed_saved.error_message()));
        } else {
            ring_ = std::move(trimmed);
        }
    }
    return Result<size_t>::ok(ring_.size());
}

// ============================================================================
// Values
// ============================================================================

Result<Token> EncryptionManager::encrypt_raw(const uint8_t* data, size_t len) const {
    const auto* primary = ring_.primary();
    if (!primary || primary->secret.size() != AeadCipher::kKeyLen) {
        return Result<Token>::error(ErrorCategory::ENCRYPTION_ERROR,
                                    "Encryption key not initialized");
    }
    const AeadCipher cipher(primary->secret);
    return cipher.seal_token(data, len);
}

Result<Token> EncryptionManager::encrypt(std::string_view text) const {
    return encrypt_raw(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

Result<Token> EncryptionManager::encrypt(const std::vector<uint8_t>& bytes) const {
    return encrypt_raw(bytes.data(), bytes.size());
}

Result<Token> EncryptionManager::encrypt(const json& record) const {
    const std::string text = record.dump();
    return encrypt_raw(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

Result<std::vector<uint8_t>> EncryptionManager::decrypt_bytes(const Token& token) const {
    using R = Result<std::vector<uint8_t>>;
    if (token.size() < AeadCipher::kIvLen + AeadCipher::kTagLen) {
        return R::error(ErrorCategory::DECRYPTION_ERROR, "Token too short");
    }

    // Newest first; the first key whose tag verifies wins
    for (const auto& key : ring_.keys()) {
        if (key.secret.size() != AeadCipher::kKeyLen) continue;
        const AeadCipher cipher(key.secret);
        if (auto plain = cipher.open_token(token)) {
            return R::ok(std::move(*plain));
        }
    }
    return R::error(ErrorCategory::DECRYPTION_ERROR,
                    std::format("No key in the ring ({} keys) authenticates the token",
                                ring_.size()));
}

Result<DecryptedValue> EncryptionManager::decrypt(const Token& token) const {
    auto plain = decrypt_bytes(token);
    if (plain.is_error()) {
        return Result<DecryptedValue>::error_from(plain);
    }

    std::string text(plain.value().begin(), plain.value().end());
    json parsed = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (!parsed.is_discarded() && (parsed.is_object() || parsed.is_array())) {
        return Result<DecryptedValue>::ok(DecryptedValue(std::in_place_type<json>, std::move(parsed)));
    }
    return Result<DecryptedValue>::ok(DecryptedValue(std::in_place_type<std::string>, std::move(text)));
}

// ============================================================================
// Files
// ============================================================================

Result<std::filesystem::path> EncryptionManager::encrypt_file(
    const std::filesystem::path& path) const {
    using R = Result<std::filesystem::path>;
    auto data = file_io::read_bytes(path);
    if (data.is_error()) {
        utils::log::error(std::format("Error encrypting file {}: {}",
                                      path.string(), data.error_message()));
        return R::error_from(data);
    }

    auto token = encrypt(data.value());
    if (token.is_error()) {
        return R::error_from(token);
    }

    std::filesystem::path out = path;
    out += kEncryptedSuffix;
    auto written = file_io::write_atomic(out, token.value());
    if (written.is_error()) {
        return R::error_from(written);
    }
    return R::ok(std::move(out));
}

Result<std::filesystem::path> EncryptionManager::decrypt_file(
    const std::filesystem::path& path) const {
    using R = Result<std::filesystem::path>;
    auto data = file_io::read_bytes(path);
    if (data.is_error()) {
        utils::log::error(std::format("Error decrypting file {}: {}",
                                      path.string(), data.error_message()));
        return R::error_from(data);
    }

    auto plain = decrypt_bytes(data.value());
    if (plain.is_error()) {
        return R::error_from(plain);
    }

    std::filesystem::path out = path;
    if (path.extension() == std::filesystem::path(kEncryptedSuffix)) {
        out.replace_extension();
    } else {
        out += kDecryptedSuffix;
    }

    auto written = file_io::write_atomic(out, plain.value());
    if (written.is_error()) {
        return R::error_from(written);
    }
    return R::ok(std::move(out));
}

bool EncryptionManager::reencrypt_file(const std::filesystem::path& path) const {
    try {
        auto data = file_io::read_bytes(path);
        if (data.is_error()) {
            utils::log::error(std::format("Error re-encrypting file {}: {}",
                                          path.string(), data.error_message()));
            return false;
        }

        auto plain = decrypt_bytes(data.value());
        if (plain.is_error()) {
            utils::log::error(std::format("Error re-encrypting file {}: {}",
                                          path.string(), plain.error_message()));
            return false;
        }

        auto token = encrypt(plain.value());
        if (token.is_error()) {
            utils::log::error(std::format("Error re-encrypting file {}: {}",
                                          path.string(), token.error_message()));
            return false;
        }

        // Plaintext never touches the disk: the new ciphertext replaces the old by rename
        auto written = file_io::write_atomic(path, token.value());
        if (written.is_error()) {
            utils::log::error(std::format("Error re-encrypting file {}: {}",
                                          path.string(), written.error_message()));
            return false;
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Error re-encrypting file {}: {}", path.string(), e.what()));
        return false;
    }

    utils::log::info(std::format("Successfully re-encrypted file {} with the primary key",
                                 path.string()));
    return true;
}

std::pair<size_t, size_t> EncryptionManager::reencrypt_directory(
    const std::filesystem::path& dir, const std::string& pattern) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        utils::log::info(std::format("Directory not found: {}", dir.string()));
        return {0, 0};
    }

    std::vector<std::filesystem::path> files;
    std::filesystem::directory_iterator it(dir, ec);
    const std::filesystem::directory_iterator end;
    while (!ec && it != end) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) &&
            ::fnmatch(pattern.c_str(), it->path().filename().c_str(), 0) == 0) {
            files.push_back(it->path());
        }
        it.increment(ec);
    }
    if (ec) {
        utils::log::error(std::format("Error listing {}: {}", dir.string(), ec.message()));
    }
    std::sort(files.begin(), files.end());

    if (files.empty()) {
        utils::log::info(std::format("No encrypted files found in {}", dir.string()));
        return {0, 0};
    }

    size_t success = 0;
    for (const auto& file : files) {
        if (reencrypt_file(file)) {
            ++success;
        }
    }

    utils::log::info(std::format("Re-encrypted {}/{} files in {}",
                                 success, files.size(), dir.string()));
    return {success, files.size()};
}

} // namespace vaultstream
