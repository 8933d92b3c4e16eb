#pragma once

#include "core/error.hpp"
#include "security/aead_cipher.hpp"
#include "stream/stream_handshake.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vaultstream::stream {

struct DecodedLine {
    enum class Kind { TEXT, HANDSHAKE, EMPTY };

    Kind kind = Kind::EMPTY;
    std::string text;   // TEXT only
};

/**
 * @brief Receiver side of the encrypted NDJSON stream.
 *
 * Sequence numbers must strictly increase. A replayed, reordered or
 * foreign-conversation packet is rejected and leaves the decoder state
 * unchanged, so the caller may keep reading.
 */
class StreamDecoder {
public:
    /// Key known up front (pre-shared secret)
    StreamDecoder(std::string conversation_id, AeadCipher cipher);

    /// Key installed on the first server_pubkey line
    StreamDecoder(std::string conversation_id, StreamHandshake client);

    [[nodiscard]] Result<DecodedLine> decode_line(std::string_view line);

    [[nodiscard]] uint64_t last_seq() const { return last_seq_; }
    [[nodiscard]] bool has_key() const { return cipher_.has_value(); }

private:
    std::string conversation_id_;
    std::optional<AeadCipher> cipher_;
    std::optional<StreamHandshake> handshake_;
    uint64_t last_seq_ = 0;

    Result<DecodedLine> install_server_key(const std::vector<uint8_t>& server_public);
};

} // namespace vaultstream::stream
