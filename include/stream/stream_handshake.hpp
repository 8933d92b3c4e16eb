#pragma once

#include "core/error.hpp"
#include "security/aead_cipher.hpp"

#include <openssl/evp.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace vaultstream::stream {

/**
 * @brief Ephemeral X25519 key pair for negotiating a stream secret in-band.
 *
 * The server answers a client public key with a "server_pubkey" line; both
 * sides then feed the X25519 output to derive_stream_key().
 */
class StreamHandshake {
public:
    static constexpr size_t kPublicKeyLen = 32;

    [[nodiscard]] static Result<StreamHandshake> generate();

    [[nodiscard]] const std::vector<uint8_t>& public_key() const { return public_key_; }

    /// Raw X25519 output; rejects malformed or low-order peer keys
    [[nodiscard]] Result<std::vector<uint8_t>> shared_secret(
        const std::vector<uint8_t>& peer_public) const;

private:
    using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

    StreamHandshake(PkeyPtr key, std::vector<uint8_t> public_key)
        : key_(std::move(key)), public_key_(std::move(public_key)) {}

    PkeyPtr key_;
    std::vector<uint8_t> public_key_;
};

struct ServerHandshake {
    std::string pubkey_line;    // NDJSON line to send before any ciphertext
    AeadCipher cipher;
};

/// Server side: fresh key pair, shared secret with the client, stream cipher for cid
[[nodiscard]] Result<ServerHandshake> accept_client_key(
    const std::vector<uint8_t>& client_public, std::string_view conversation_id);

} // namespace vaultstream::stream
