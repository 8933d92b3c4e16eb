#include "security/aead_cipher.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>
#include <stdexcept>

namespace vaultstream {

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtx make_ctx() {
    return CipherCtx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
}

} // anonymous namespace

AeadCipher::AeadCipher(std::vector<uint8_t> key)
    : key_(std::move(key)) {
    if (key_.size() != kKeyLen) {
        throw std::invalid_argument("AeadCipher: key must be 32 bytes");
    }
}

std::optional<std::vector<uint8_t>> AeadCipher::random_bytes(size_t count) {
    std::vector<uint8_t> out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        return std::nullopt;
    }
    return out;
}

Result<std::vector<uint8_t>> AeadCipher::seal(
    const std::vector<uint8_t>& iv,
    const uint8_t* plaintext, size_t plaintext_len,
    std::string_view aad) const {
    using R = Result<std::vector<uint8_t>>;
    if (iv.size() != kIvLen) {
        return R::error(ErrorCategory::ENCRYPTION_ERROR, "IV must be 12 bytes");
    }

    auto ctx = make_ctx();
    if (!ctx) return R::error(ErrorCategory::ENCRYPTION_ERROR, "EVP_CIPHER_CTX_new failed");

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLen, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv.data()) != 1) {
        return R::error(ErrorCategory::ENCRYPTION_ERROR, "EncryptInit failed");
    }

    int len = 0;
    if (!aad.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &len,
                reinterpret_cast<const uint8_t*>(aad.data()),
                static_cast<int>(aad.size())) != 1) {
            return R::error(ErrorCategory::ENCRYPTION_ERROR, "EncryptUpdate AAD failed");
        }
    }

    std::vector<uint8_t> out(plaintext_len + kTagLen);
    int out_len1 = 0;
    if (plaintext_len > 0 &&
        EVP_EncryptUpdate(ctx.get(), out.data(), &out_len1,
                          plaintext, static_cast<int>(plaintext_len)) != 1) {
        return R::error(ErrorCategory::ENCRYPTION_ERROR, "EncryptUpdate data failed");
    }

    int out_len2 = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + out_len1, &out_len2) != 1) {
        return R::error(ErrorCategory::ENCRYPTION_ERROR, "EncryptFinal failed");
    }

    const auto ct_len = static_cast<size_t>(out_len1 + out_len2);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagLen,
                            out.data() + ct_len) != 1) {
        return R::error(ErrorCategory::ENCRYPTION_ERROR, "GET_TAG failed");
    }
    out.resize(ct_len + kTagLen);
    return R::ok(std::move(out));
}

std::optional<std::vector<uint8_t>> AeadCipher::open(
    const std::vector<uint8_t>& iv,
    const std::vector<uint8_t>& ciphertext_and_tag,
    std::string_view aad) const {
    if (iv.size() != kIvLen || ciphertext_and_tag.size() < kTagLen) {
        return std::nullopt;
    }

    const size_t ct_len = ciphertext_and_tag.size() - kTagLen;
    const uint8_t* ct = ciphertext_and_tag.data();
    const uint8_t* tag = ciphertext_and_tag.data() + ct_len;

    auto ctx = make_ctx();
    if (!ctx) return std::nullopt;

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLen, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv.data()) != 1) {
        return std::nullopt;
    }

    int len = 0;
    if (!aad.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &len,
                reinterpret_cast<const uint8_t*>(aad.data()),
                static_cast<int>(aad.size())) != 1) {
            return std::nullopt;
        }
    }

    // One spare byte keeps data() valid for empty payloads
    std::vector<uint8_t> plaintext(ct_len + 1);
    int pt_len1 = 0;
    if (ct_len > 0 &&
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), &pt_len1,
                          ct, static_cast<int>(ct_len)) != 1) {
        return std::nullopt;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagLen,
                            const_cast<uint8_t*>(tag)) != 1) {
        return std::nullopt;
    }

    int pt_len2 = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + pt_len1, &pt_len2) != 1) {
        return std::nullopt; // Authentication failed
    }

    plaintext.resize(static_cast<size_t>(pt_len1 + pt_len2));
    return plaintext;
}

Result<std::vector<uint8_t>> AeadCipher::seal_token(
    const uint8_t* plaintext, size_t plaintext_len) const {
    using R = Result<std::vector<uint8_t>>;
    auto iv = random_bytes(kIvLen);
    if (!iv) return R::error(ErrorCategory::ENCRYPTION_ERROR, "RAND_bytes(IV) failed");

    auto sealed = seal(*iv, plaintext, plaintext_len);
    if (sealed.is_error()) return sealed;

    // Pack: iv + ciphertext + tag
    std::vector<uint8_t> packed;
    packed.reserve(kIvLen + sealed.value().size());
    packed.insert(packed.end(), iv->begin(), iv->end());
    packed.insert(packed.end(), sealed.value().begin(), sealed.value().end());
    return R::ok(std::move(packed));
}

std::optional<std::vector<uint8_t>> AeadCipher::open_token(
    const std::vector<uint8_t>& token) const {
    if (token.size() < kIvLen + kTagLen) {
        return std::nullopt;
    }
    const std::vector<uint8_t> iv(token.begin(), token.begin() + kIvLen);
    const std::vector<uint8_t> body(token.begin() + kIvLen, token.end());
    return open(iv, body);
}

} // namespace vaultstream
