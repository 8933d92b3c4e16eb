#pragma once

#include "security/encryption_manager.hpp"
#include "stream/stream_encoder.hpp"

#include <toml.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vaultstream {

// ============================================================================
// Config sections (mirror the TOML hierarchy)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct EncryptionConfig {
    std::string key_file = "config/encryption_keys/current_keys.json";
    std::optional<std::string> password;       // empty after env expansion -> unset
    int64_t rotation_days = 90;
    int64_t max_keys = 5;
    std::vector<std::string> reencrypt_dirs;
    std::string reencrypt_pattern = "*.enc";
};

struct StreamConfig {
    int64_t max_tokens = 20;
    int64_t max_bytes = 2048;
    int64_t max_delay_ms = 40;
};

struct VaultConfig {
    LoggingConfig logging;
    EncryptionConfig encryption;
    StreamConfig stream;
};

/// Typed manager settings; call only on a validated config
[[nodiscard]] EncryptionManager::Config to_manager_config(const EncryptionConfig& cfg);

[[nodiscard]] stream::BatchingConfig to_batching_config(const StreamConfig& cfg);

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    static constexpr const char* kDefaultPath = "config/vaultstream.toml";

    struct LoadResult {
        bool success = false;
        std::string error_message;
        VaultConfig config;

        static LoadResult ok(VaultConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     *
     * Resolves `include = "other.toml"` relative to the file (the including
     * file wins on conflicts) and expands ${VAR} in every string value.
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /// Same as load_from_file() for in-memory TOML; includes are not resolved
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every problem found, empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const VaultConfig& config);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static EncryptionConfig extract_encryption(const toml::table& root);
    static StreamConfig extract_stream(const toml::table& root);
    static VaultConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(VaultConfig config);
};

} // namespace vaultstream
