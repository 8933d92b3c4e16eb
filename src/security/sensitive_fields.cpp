#include "security/sensitive_fields.hpp"
#include "core/base64.hpp"
#include "core/utils.hpp"

#include <format>
#include <variant>

namespace vaultstream {

using json = nlohmann::json;

Result<json> encrypt_sensitive_fields(const EncryptionManager& manager,
                                      const json& record,
                                      const std::vector<std::string>& fields) {
    if (!record.is_object()) {
        return Result<json>::error(ErrorCategory::ENCRYPTION_ERROR,
                                   "Sensitive-field encryption needs a JSON object");
    }

    json result = record;
    for (const auto& field : fields) {
        auto it = result.find(field);
        if (it == result.end() || it->is_null()) continue;

        auto token = it->is_string()
            ? manager.encrypt(it->get_ref<const std::string&>())
            : manager.encrypt(*it);
        if (token.is_error()) {
            return Result<json>::error(token.error_category(),
                std::format("Field '{}': {}", field, token.error_message()));
        }
        *it = base64::encode(token.value());
        result[field + std::string(kEncryptedFlagSuffix)] = true;
    }
    return Result<json>::ok(std::move(result));
}

Result<json> decrypt_sensitive_fields(const EncryptionManager& manager,
                                      const json& record) {
    if (!record.is_object()) {
        return Result<json>::error(ErrorCategory::DECRYPTION_ERROR,
                                   "Sensitive-field decryption needs a JSON object");
    }

    // Collect flags first; the result object is mutated below
    std::vector<std::string> flagged;
    for (const auto& [key, value] : record.items()) {
        if (key.size() > kEncryptedFlagSuffix.size() &&
            utils::ends_with(key, kEncryptedFlagSuffix) &&
            value.is_boolean() && value.get<bool>()) {
            flagged.push_back(key);
        }
    }

    json result = record;
    for (const auto& flag : flagged) {
        const std::string field = flag.substr(0, flag.size() - kEncryptedFlagSuffix.size());
        auto it = result.find(field);
        if (it == result.end()) continue;

        if (!it->is_string()) {
            return Result<json>::error(ErrorCategory::DECRYPTION_ERROR,
                std::format("Field '{}' is flagged encrypted but holds no token", field));
        }
        auto token = base64::decode(it->get_ref<const std::string&>());
        if (!token) {
            return Result<json>::error(ErrorCategory::DECRYPTION_ERROR,
                std::format("Field '{}' is not valid base64", field));
        }
        auto value = manager.decrypt(*token);
        if (value.is_error()) {
            return Result<json>::error(value.error_category(),
                std::format("Field '{}': {}", field, value.error_message()));
        }

        if (const auto* text = std::get_if<std::string>(&value.value())) {
            *it = *text;
        } else {
            *it = std::get<json>(value.value());
        }
        result.erase(flag);
    }
    return Result<json>::ok(std::move(result));
}

} // namespace vaultstream
