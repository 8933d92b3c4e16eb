#pragma once

#include "security/aead_cipher.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vaultstream::stream {

struct BatchingConfig {
    size_t max_tokens = 20;                        // fragments per packet
    size_t max_bytes = 2048;                       // UTF-8 payload bytes per packet
    std::chrono::milliseconds max_delay{40};       // since the last flush
};

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

/**
 * @brief Sender side of the encrypted NDJSON stream.
 *
 * Fragments accumulate until the count or size threshold is reached, or,
 * failing both, until max_delay has elapsed since the previous flush. Each
 * flush seals the concatenated buffer as one packet with the next seq.
 * Single-threaded; one instance per conversation.
 */
class StreamEncoder {
public:
    /**
     * clock defaults to std::chrono::steady_clock::now
     * @throws std::invalid_argument if conversation_id is not valid UTF-8
     */
    StreamEncoder(std::string conversation_id, AeadCipher cipher,
                  BatchingConfig config = {}, SteadyClock clock = {});

    /**
     * @brief Buffer a fragment and flush if a trigger fires.
     * @return the packet line when a flush happened
     * @throws EncryptionError if sealing fails
     */
    std::optional<std::string> push(std::string_view fragment);

    /// Time trigger only, for a host timer between fragments
    std::optional<std::string> poll();

    /// How long poll() may wait before the time trigger is due; nullopt while empty
    [[nodiscard]] std::optional<std::chrono::milliseconds> time_until_flush() const;

    /// Final flush; nothing when the buffer is empty
    std::optional<std::string> finish();

    [[nodiscard]] uint64_t last_seq() const { return seq_; }
    [[nodiscard]] size_t buffered_fragments() const { return fragments_; }
    [[nodiscard]] size_t buffered_bytes() const { return buffer_.size(); }
    [[nodiscard]] const std::string& conversation_id() const { return conversation_id_; }
    [[nodiscard]] const BatchingConfig& config() const { return config_; }

private:
    std::string conversation_id_;
    AeadCipher cipher_;
    BatchingConfig config_;
    SteadyClock clock_;

    std::string buffer_;
    size_t fragments_ = 0;
    uint64_t seq_ = 0;
    std::chrono::steady_clock::time_point last_flush_;

    bool delay_elapsed() const;
    std::string flush();
};

/// One pull from a fragment source
struct SourceEvent {
    enum class Kind { FRAGMENT, IDLE, END };

    Kind kind = Kind::END;
    std::string text;

    static SourceEvent fragment(std::string text) { return {Kind::FRAGMENT, std::move(text)}; }
    static SourceEvent idle() { return {Kind::IDLE, {}}; }
    static SourceEvent end() { return {Kind::END, {}}; }
};

/**
 * Pull source of fragments. The argument bounds how long the source may
 * wait for input (nullopt: as long as it takes); a source that times out
 * returns IDLE.
 */
using FragmentSource = std::function<SourceEvent(std::optional<std::chrono::milliseconds>)>;

/**
 * @brief Cooperative producer over a fragment source.
 *
 * next() consumes fragments until exactly one flush happens and hands that
 * line back to the caller, who regains control after every packet and can
 * write it to the transport before asking for more. While fragments are
 * buffered the source is given the time left until the time trigger, and
 * an IDLE answer runs the timer check, so a stalled source still gets its
 * buffered text out within max_delay.
 */
class EncryptedStream {
public:
    EncryptedStream(StreamEncoder& encoder, FragmentSource source)
        : encoder_(encoder), source_(std::move(source)) {}

    /// Next packet line, or nullopt when the stream is complete
    std::optional<std::string> next();

    [[nodiscard]] bool done() const { return finished_; }

private:
    StreamEncoder& encoder_;
    FragmentSource source_;
    bool finished_ = false;
};

/// Encode a whole fragment sequence; one line per packet, in seq order
[[nodiscard]] std::vector<std::string> encode_stream(
    std::string_view conversation_id,
    const std::vector<std::string>& fragments,
    const AeadCipher& cipher,
    const BatchingConfig& config = {});

} // namespace vaultstream::stream
