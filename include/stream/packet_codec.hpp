#pragma once

#include "core/error.hpp"
#include "security/aead_cipher.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace vaultstream::stream {

inline constexpr std::string_view kCiphertextType = "ciphertext";
inline constexpr std::string_view kServerPubkeyType = "server_pubkey";

/**
 * @brief One encrypted batch of the stream.
 *
 * Wire form is a single compact JSON object per line:
 *   {"type":"ciphertext","seq":N,"iv":"<b64>","ciphertext":"<b64>","aad":"cid=..;seq=N"}
 * ciphertext carries the 16-byte GCM tag at its end.
 */
struct Packet {
    std::string type{kCiphertextType};
    uint64_t seq = 0;
    std::vector<uint8_t> iv;
    std::vector<uint8_t> ciphertext;
    std::string aad;
};

struct StreamMessage {
    enum class Kind { CIPHERTEXT, SERVER_PUBKEY };

    Kind kind = Kind::CIPHERTEXT;
    Packet packet;                  // CIPHERTEXT
    std::vector<uint8_t> pubkey;    // SERVER_PUBKEY, 32 raw bytes
};

/// "cid=<conversation_id>;seq=<seq>"
[[nodiscard]] std::string make_aad(std::string_view conversation_id, uint64_t seq);

/// Seal payload under a fresh random IV with make_aad(cid, seq) bound in
[[nodiscard]] Result<Packet> seal_packet(const AeadCipher& cipher,
                                         std::string_view conversation_id,
                                         uint64_t seq,
                                         std::string_view payload);

/// Compact JSON, keys in wire order, terminated by '\n'
[[nodiscard]] std::string encode_packet(const Packet& packet);

[[nodiscard]] std::string encode_pubkey_packet(const std::vector<uint8_t>& pubkey);

/**
 * @brief Parse one NDJSON line into a ciphertext or handshake message.
 *
 * Checks structure only: JSON object, known type, base64 fields, 12-byte
 * IV, ciphertext long enough for a tag, seq >= 1. Authentication happens
 * in open_packet().
 */
[[nodiscard]] Result<StreamMessage> parse_line(std::string_view line);

/**
 * @brief Authenticate and decrypt a packet.
 *
 * The packet's aad must equal make_aad(conversation_id, packet.seq) and is
 * the associated data handed to GCM. Any mismatch or tag failure rejects
 * the whole packet.
 */
[[nodiscard]] Result<std::string> open_packet(const AeadCipher& cipher,
                                              std::string_view conversation_id,
                                              const Packet& packet);

} // namespace vaultstream::stream
