#include "stream/stream_key.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/sha.h>

#include <memory>
#include <string>

namespace vaultstream::stream {

std::vector<uint8_t> conversation_salt(std::string_view conversation_id) {
    std::string input(kSaltPrefix);
    input.append(conversation_id);

    std::vector<uint8_t> digest(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const uint8_t*>(input.data()), input.size(), digest.data());
    return digest;
}

Result<std::vector<uint8_t>> derive_stream_key_bytes(
    const std::vector<uint8_t>& shared_secret, std::string_view conversation_id) {
    using R = Result<std::vector<uint8_t>>;
    if (shared_secret.empty()) {
        return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR, "Empty stream secret");
    }

    const auto salt = conversation_salt(conversation_id);

    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
        EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr), &EVP_PKEY_CTX_free);
    if (!ctx) {
        return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR, "HKDF context allocation failed");
    }

    std::vector<uint8_t> key(AeadCipher::kKeyLen);
    size_t key_len = key.size();
    if (EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt.data(), static_cast<int>(salt.size())) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), shared_secret.data(),
                                   static_cast<int>(shared_secret.size())) <= 0 ||
        EVP_PKEY_CTX_add1_hkdf_info(ctx.get(),
                                    reinterpret_cast<const uint8_t*>(kHkdfInfo.data()),
                                    static_cast<int>(kHkdfInfo.size())) <= 0 ||
        EVP_PKEY_derive(ctx.get(), key.data(), &key_len) <= 0 ||
        key_len != AeadCipher::kKeyLen) {
        return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR, "HKDF derivation failed");
    }
    return R::ok(std::move(key));
}

AeadCipher derive_stream_key(const std::vector<uint8_t>& shared_secret,
                             std::string_view conversation_id) {
    auto key = derive_stream_key_bytes(shared_secret, conversation_id);
    if (key.is_error()) {
        throw EncryptionError(key.error_message());
    }
    return AeadCipher(std::move(key.value()));
}

} // namespace vaultstream::stream
