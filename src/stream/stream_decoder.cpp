#include "stream/stream_decoder.hpp"
#include "core/utils.hpp"
#include "stream/packet_codec.hpp"
#include "stream/stream_key.hpp"

#include <format>

namespace vaultstream::stream {

StreamDecoder::StreamDecoder(std::string conversation_id, AeadCipher cipher)
    : conversation_id_(std::move(conversation_id)), cipher_(std::move(cipher)) {}

StreamDecoder::StreamDecoder(std::string conversation_id, StreamHandshake client)
    : conversation_id_(std::move(conversation_id)), handshake_(std::move(client)) {}

Result<DecodedLine> StreamDecoder::install_server_key(const std::vector<uint8_t>& server_public) {
    using R = Result<DecodedLine>;
    if (cipher_) {
        return R::error(ErrorCategory::DECRYPTION_ERROR, "Unexpected server_pubkey: key already set");
    }
    if (!handshake_) {
        return R::error(ErrorCategory::DECRYPTION_ERROR, "Unexpected server_pubkey: no client handshake");
    }

    auto secret = handshake_->shared_secret(server_public);
    if (secret.is_error()) {
        return R::error_from(secret);
    }
    auto key = derive_stream_key_bytes(secret.value(), conversation_id_);
    if (key.is_error()) {
        return R::error_from(key);
    }
    cipher_.emplace(std::move(key.value()));
    // The private half is single-use
    handshake_.reset();

    utils::log::debug(std::format("Stream key established for conversation {}", conversation_id_));
    return R::ok(DecodedLine{DecodedLine::Kind::HANDSHAKE, {}});
}

Result<DecodedLine> StreamDecoder::decode_line(std::string_view line) {
    using R = Result<DecodedLine>;
    if (utils::trim(std::string(line)).empty()) {
        return R::ok(DecodedLine{});
    }

    auto msg = parse_line(line);
    if (msg.is_error()) {
        return R::error_from(msg);
    }

    if (msg.value().kind == StreamMessage::Kind::SERVER_PUBKEY) {
        return install_server_key(msg.value().pubkey);
    }

    if (!cipher_) {
        return R::error(ErrorCategory::DECRYPTION_ERROR,
                        "Packet rejected: ciphertext before key exchange");
    }

    const Packet& packet = msg.value().packet;
    if (packet.seq <= last_seq_) {
        return R::error(ErrorCategory::DECRYPTION_ERROR,
                        std::format("Packet rejected: seq {} after {}", packet.seq, last_seq_));
    }

    auto text = open_packet(*cipher_, conversation_id_, packet);
    if (text.is_error()) {
        return R::error_from(text);
    }
    last_seq_ = packet.seq;
    return R::ok(DecodedLine{DecodedLine::Kind::TEXT, std::move(text.value())});
}

} // namespace vaultstream::stream
