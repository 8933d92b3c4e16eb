#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace vaultstream {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars and arrays.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::filesystem::path& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const fs::path abs_path = fs::canonical(base_dir / rel_path);

        if (!visited.insert(abs_path.string()).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path.string()));
        }

        auto included = toml::parse_file(abs_path.string());
        resolve_includes(included, abs_path.parent_path(), visited, depth + 1);

        // Included file is the base, the including file overrides it
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    namespace fs = std::filesystem;
    auto result = toml::parse_file(file_path);

    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, fs::path(file_path).parent_path(), visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// Typed views
// ============================================================================

EncryptionManager::Config to_manager_config(const EncryptionConfig& cfg) {
    EncryptionManager::Config out;
    out.key_file = cfg.key_file;
    out.password = cfg.password;
    out.rotation_interval = std::chrono::hours(24 * cfg.rotation_days);
    out.max_keys = static_cast<size_t>(cfg.max_keys);
    out.reencrypt_dirs.assign(cfg.reencrypt_dirs.begin(), cfg.reencrypt_dirs.end());
    out.reencrypt_pattern = cfg.reencrypt_pattern;
    return out;
}

stream::BatchingConfig to_batching_config(const StreamConfig& cfg) {
    stream::BatchingConfig out;
    out.max_tokens = static_cast<size_t>(cfg.max_tokens);
    out.max_bytes = static_cast<size_t>(cfg.max_bytes);
    out.max_delay = std::chrono::milliseconds(cfg.max_delay_ms);
    return out;
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or("info"s);
    return cfg;
}

EncryptionConfig ConfigLoader::extract_encryption(const toml::table& root) {
    EncryptionConfig cfg;
    const auto* encryption = root["encryption"].as_table();
    if (!encryption) return cfg;
    const auto& e = *encryption;

    cfg.key_file = e["key_file"].value_or(cfg.key_file);
    cfg.password = toml_optional_string(e, "password");
    if (cfg.password && cfg.password->empty()) {
        cfg.password.reset();
    }
    cfg.rotation_days = e["rotation_days"].value_or(cfg.rotation_days);
    cfg.max_keys = e["max_keys"].value_or(cfg.max_keys);
    cfg.reencrypt_dirs = toml_string_array(e, "reencrypt_dirs");
    cfg.reencrypt_pattern = e["reencrypt_pattern"].value_or(cfg.reencrypt_pattern);
    return cfg;
}

StreamConfig ConfigLoader::extract_stream(const toml::table& root) {
    StreamConfig cfg;
    const auto* stream = root["stream"].as_table();
    if (!stream) return cfg;
    const auto& s = *stream;

    cfg.max_tokens = s["max_tokens"].value_or(cfg.max_tokens);
    cfg.max_bytes = s["max_bytes"].value_or(cfg.max_bytes);
    cfg.max_delay_ms = s["max_delay_ms"].value_or(cfg.max_delay_ms);
    return cfg;
}

VaultConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    VaultConfig config;
    config.logging = extract_logging(tbl);
    config.encryption = extract_encryption(tbl);
    config.stream = extract_stream(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(VaultConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const VaultConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of debug, info, warn, error",
                                     config.logging.level));
    }

    const auto& enc = config.encryption;
    if (enc.key_file.empty()) {
        errors.push_back("encryption.key_file must not be empty");
    }
    if (enc.rotation_days <= 0) {
        errors.push_back(std::format("encryption.rotation_days must be > 0, got {}",
                                     enc.rotation_days));
    }
    if (enc.max_keys < 1) {
        errors.push_back(std::format("encryption.max_keys must be >= 1, got {}", enc.max_keys));
    }
    if (enc.reencrypt_pattern.empty()) {
        errors.push_back("encryption.reencrypt_pattern must not be empty");
    }

    const auto& st = config.stream;
    if (st.max_tokens <= 0) {
        errors.push_back(std::format("stream.max_tokens must be > 0, got {}", st.max_tokens));
    }
    if (st.max_bytes <= 0) {
        errors.push_back(std::format("stream.max_bytes must be > 0, got {}", st.max_bytes));
    }
    if (st.max_delay_ms < 0) {
        errors.push_back(std::format("stream.max_delay_ms must be >= 0, got {}", st.max_delay_ms));
    }

    return errors;
}

} // namespace vaultstream
