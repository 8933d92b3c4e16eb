#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace vaultstream {

/**
 * @brief Error categories for crypto operations
 */
enum class ErrorCategory {
    NONE,
    KEY_INITIALIZATION_ERROR,
    ENCRYPTION_ERROR,
    DECRYPTION_ERROR,
    FILE_ACCESS_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                     return "none";
        case ErrorCategory::KEY_INITIALIZATION_ERROR: return "key_initialization";
        case ErrorCategory::ENCRYPTION_ERROR:         return "encryption";
        case ErrorCategory::DECRYPTION_ERROR:         return "decryption";
        case ErrorCategory::FILE_ACCESS_ERROR:        return "file_access";
        case ErrorCategory::CONFIG_ERROR:             return "config";
        case ErrorCategory::INTERNAL_ERROR:           return "internal";
    }
    return "unknown";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    // Re-wrap another result's error under a different value type
    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/// No key could be generated, derived or loaded. The subsystem is unusable.
class KeyInitializationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The CSPRNG or cipher failed while sealing a payload.
class EncryptionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace vaultstream
