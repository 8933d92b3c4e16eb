#include "stream/stream_encoder.hpp"
#include "core/error.hpp"
#include "stream/packet_codec.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>

namespace vaultstream::stream {

StreamEncoder::StreamEncoder(std::string conversation_id, AeadCipher cipher,
                             BatchingConfig config, SteadyClock clock)
    : conversation_id_(std::move(conversation_id)),
      cipher_(std::move(cipher)),
      config_(config),
      clock_(clock ? std::move(clock) : SteadyClock([] { return std::chrono::steady_clock::now(); })) {
    // The id travels inside the JSON packet line, which must be valid UTF-8
    try {
        (void)nlohmann::json(conversation_id_).dump();
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(std::format("Conversation id is not valid UTF-8: {}", e.what()));
    }
    last_flush_ = clock_();
}

bool StreamEncoder::delay_elapsed() const {
    return clock_() - last_flush_ >= config_.max_delay;
}

std::string StreamEncoder::flush() {
    auto packet = seal_packet(cipher_, conversation_id_, seq_ + 1, buffer_);
    if (packet.is_error()) {
        throw EncryptionError(packet.error_message());
    }
    std::string line = encode_packet(packet.value());

    // State advances only once the line exists, so no number is skipped or reused
    ++seq_;
    buffer_.clear();
    fragments_ = 0;
    last_flush_ = clock_();
    return line;
}

std::optional<std::string> StreamEncoder::push(std::string_view fragment) {
    buffer_.append(fragment);
    ++fragments_;

    if (fragments_ >= config_.max_tokens || buffer_.size() >= config_.max_bytes) {
        return flush();
    }
    if (delay_elapsed()) {
        return flush();
    }
    return std::nullopt;
}

std::optional<std::string> StreamEncoder::poll() {
    if (fragments_ == 0 || !delay_elapsed()) {
        return std::nullopt;
    }
    return flush();
}

std::optional<std::chrono::milliseconds> StreamEncoder::time_until_flush() const {
    if (fragments_ == 0) {
        return std::nullopt;
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - last_flush_);
    return elapsed >= config_.max_delay ? std::chrono::milliseconds(0) : config_.max_delay - elapsed;
}

std::optional<std::string> StreamEncoder::finish() {
    if (fragments_ == 0) {
        return std::nullopt;
    }
    return flush();
}

std::optional<std::string> EncryptedStream::next() {
    while (!finished_) {
        auto event = source_(encoder_.time_until_flush());
        switch (event.kind) {
            case SourceEvent::Kind::END:
                finished_ = true;
                return encoder_.finish();
            case SourceEvent::Kind::IDLE:
                if (auto line = encoder_.poll()) {
                    return line;
                }
                break;
            case SourceEvent::Kind::FRAGMENT:
                if (auto line = encoder_.push(event.text)) {
                    return line;
                }
                break;
        }
    }
    return std::nullopt;
}

std::vector<std::string> encode_stream(std::string_view conversation_id,
                                       const std::vector<std::string>& fragments,
                                       const AeadCipher& cipher,
                                       const BatchingConfig& config) {
    StreamEncoder encoder(std::string(conversation_id), cipher, config);

    size_t index = 0;
    EncryptedStream stream(encoder, [&](std::optional<std::chrono::milliseconds>) {
        if (index >= fragments.size()) return SourceEvent::end();
        return SourceEvent::fragment(fragments[index++]);
    });

    std::vector<std::string> lines;
    while (auto line = stream.next()) {
        lines.push_back(std::move(*line));
    }
    return lines;
}

} // namespace vaultstream::stream
