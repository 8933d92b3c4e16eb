#include "security/key_store.hpp"
#include "core/base64.hpp"
#include "core/file_io.hpp"
#include "core/utils.hpp"
#include "security/aead_cipher.hpp"
#include "security/password_kdf.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace vaultstream {

using json = nlohmann::json;

namespace {

constexpr auto kOwnerOnly = std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;

} // anonymous namespace

KeyStore::KeyStore(std::filesystem::path key_file)
    : key_file_(std::move(key_file)) {}

bool KeyStore::exists() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(key_file_, ec);
}

std::filesystem::path KeyStore::salt_path() const {
    std::filesystem::path p = key_file_;
    p += ".salt";
    return p;
}

std::string KeyStore::serialize(const KeyRing& ring) {
    json arr = json::array();
    for (const auto& key : ring.keys()) {
        arr.push_back({
            {"key", base64::encode(key.secret)},
            {"timestamp", utils::format_timestamp(key.created_at)},
        });
    }
    return arr.dump(2);
}

Result<KeyRing> KeyStore::parse(const std::string& content) {
    using R = Result<KeyRing>;
    json doc;
    try {
        doc = json::parse(content);
    } catch (const json::parse_error& e) {
        return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR,
                        std::format("Key store is not valid JSON: {}", e.what()));
    }
    if (!doc.is_array()) {
        return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR, "Key store must be a JSON array");
    }

    std::vector<KeyRecord> records;
    records.reserve(doc.size());
    for (size_t i = 0; i < doc.size(); ++i) {
        const auto& entry = doc[i];
        if (!entry.is_object() || !entry.contains("key") || !entry["key"].is_string() ||
            !entry.contains("timestamp") || !entry["timestamp"].is_string()) {
            return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR,
                            std::format("Key store entry {} is malformed", i));
        }
        auto secret = base64::decode(entry["key"].get<std::string>());
        if (!secret || secret->size() != AeadCipher::kKeyLen) {
            return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR,
                            std::format("Key store entry {} has an invalid key", i));
        }
        auto created = utils::parse_timestamp(entry["timestamp"].get<std::string>());
        if (!created) {
            return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR,
                            std::format("Key store entry {} has an invalid timestamp", i));
        }
        records.emplace_back(std::move(*secret), *created);
    }
    return R::ok(KeyRing(std::move(records)));
}

Result<KeyRing> KeyStore::load() const {
    auto bytes = file_io::read_bytes(key_file_);
    if (bytes.is_error()) {
        return Result<KeyRing>::error_from(bytes);
    }
    return parse(std::string(bytes.value().begin(), bytes.value().end()));
}

Result<size_t> KeyStore::save(const KeyRing& ring) const {
    std::error_code ec;
    if (key_file_.has_parent_path()) {
        std::filesystem::create_directories(key_file_.parent_path(), ec);
        if (ec) {
            return Result<size_t>::error(ErrorCategory::FILE_ACCESS_ERROR,
                std::format("Cannot create {}: {}", key_file_.parent_path().string(), ec.message()));
        }
    }

    auto written = file_io::write_atomic(key_file_, serialize(ring), kOwnerOnly);
    if (written.is_error()) {
        return written;
    }

    utils::log::debug(std::format("Saved {} encryption keys to {}", ring.size(), key_file_.string()));
    return Result<size_t>::ok(ring.size());
}

Result<std::vector<uint8_t>> KeyStore::load_or_create_salt() const {
    using R = Result<std::vector<uint8_t>>;
    const auto path = salt_path();

    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec)) {
        auto bytes = file_io::read_bytes(path);
        if (bytes.is_error()) return bytes;
        auto salt = base64::decode(utils::trim(
            std::string(bytes.value().begin(), bytes.value().end())));
        if (!salt || salt->size() != PasswordKdf::kSaltLen) {
            return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR,
                            std::format("Salt file {} is corrupt", path.string()));
        }
        return R::ok(std::move(*salt));
    }

    auto salt = AeadCipher::random_bytes(PasswordKdf::kSaltLen);
    if (!salt) {
        return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR, "RAND_bytes failed generating salt");
    }
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    auto written = file_io::write_atomic(path, base64::encode(*salt) + "\n", kOwnerOnly);
    if (written.is_error()) {
        return R::error_from(written);
    }
    utils::log::info(std::format("Created key-derivation salt {}", path.string()));
    return R::ok(std::move(*salt));
}

} // namespace vaultstream
