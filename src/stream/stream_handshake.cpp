#include "stream/stream_handshake.hpp"
#include "stream/packet_codec.hpp"
#include "stream/stream_key.hpp"

namespace vaultstream::stream {

namespace {

using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;

} // anonymous namespace

Result<StreamHandshake> StreamHandshake::generate() {
    using R = Result<StreamHandshake>;
    PkeyCtxPtr pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr), &EVP_PKEY_CTX_free);
    if (!pctx || EVP_PKEY_keygen_init(pctx.get()) <= 0) {
        return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR, "X25519 keygen init failed");
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(pctx.get(), &raw) <= 0) {
        return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR, "X25519 keygen failed");
    }
    PkeyPtr key(raw, &EVP_PKEY_free);

    std::vector<uint8_t> pub(kPublicKeyLen);
    size_t pub_len = pub.size();
    if (EVP_PKEY_get_raw_public_key(key.get(), pub.data(), &pub_len) <= 0 ||
        pub_len != kPublicKeyLen) {
        return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR, "X25519 public key export failed");
    }
    return R::ok(StreamHandshake(std::move(key), std::move(pub)));
}

Result<std::vector<uint8_t>> StreamHandshake::shared_secret(
    const std::vector<uint8_t>& peer_public) const {
    using R = Result<std::vector<uint8_t>>;
    if (peer_public.size() != kPublicKeyLen) {
        return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR, "Peer public key must be 32 bytes");
    }

    PkeyPtr peer(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr,
                                             peer_public.data(), peer_public.size()),
                 &EVP_PKEY_free);
    if (!peer) {
        return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR, "Invalid peer public key");
    }

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(key_.get(), nullptr), &EVP_PKEY_CTX_free);
    if (!ctx || EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_derive_set_peer(ctx.get(), peer.get()) <= 0) {
        return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR, "X25519 derive init failed");
    }

    std::vector<uint8_t> secret(kPublicKeyLen);
    size_t secret_len = secret.size();
    // OpenSSL fails the derive on an all-zero output (low-order peer point)
    if (EVP_PKEY_derive(ctx.get(), secret.data(), &secret_len) <= 0) {
        return R::error(ErrorCategory::KEY_INITIALIZATION_ERROR, "X25519 derive failed");
    }
    secret.resize(secret_len);
    return R::ok(std::move(secret));
}

Result<ServerHandshake> accept_client_key(const std::vector<uint8_t>& client_public,
                                          std::string_view conversation_id) {
    using R = Result<ServerHandshake>;
    auto server = StreamHandshake::generate();
    if (server.is_error()) {
        return R::error_from(server);
    }

    auto secret = server.value().shared_secret(client_public);
    if (secret.is_error()) {
        return R::error_from(secret);
    }

    auto key = derive_stream_key_bytes(secret.value(), conversation_id);
    if (key.is_error()) {
        return R::error_from(key);
    }

    return R::ok(ServerHandshake{
        encode_pubkey_packet(server.value().public_key()),
        AeadCipher(std::move(key.value())),
    });
}

} // namespace vaultstream::stream
