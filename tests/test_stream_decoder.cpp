#include <catch2/catch_test_macros.hpp>
#include "stream/packet_codec.hpp"
#include "stream/stream_decoder.hpp"
#include "stream/stream_encoder.hpp"
#include "stream/stream_key.hpp"

#include <string>
#include <vector>

using namespace vaultstream;
using namespace vaultstream::stream;

namespace {

const std::vector<uint8_t> kSecret(32, 0x5C);

std::string sealed_line(const std::string& cid, uint64_t seq, const std::string& text) {
    auto packet = seal_packet(derive_stream_key(kSecret, cid), cid, seq, text);
    REQUIRE(packet.is_ok());
    return encode_packet(packet.value());
}

} // namespace

TEST_CASE("Decoder reassembles an encoded stream", "[stream][decoder]") {
    BatchingConfig cfg;
    cfg.max_tokens = 2;
    const std::vector<std::string> tokens = {"hello ", "world", "! this ", "is ", "a ", "test"};
    const auto lines = encode_stream("conv", tokens, derive_stream_key(kSecret, "conv"), cfg);

    StreamDecoder decoder("conv", derive_stream_key(kSecret, "conv"));
    std::string text;
    for (const auto& line : lines) {
        auto decoded = decoder.decode_line(line);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value().kind == DecodedLine::Kind::TEXT);
        text += decoded.value().text;
    }
    CHECK(text == "hello world! this is a test");
    CHECK(decoder.last_seq() == lines.size());
}

TEST_CASE("Blank lines are skipped", "[stream][decoder]") {
    StreamDecoder decoder("conv", derive_stream_key(kSecret, "conv"));
    auto decoded = decoder.decode_line("   \r\n");
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value().kind == DecodedLine::Kind::EMPTY);
}

TEST_CASE("Replayed and reordered packets are rejected", "[stream][decoder]") {
    StreamDecoder decoder("conv", derive_stream_key(kSecret, "conv"));
    const auto first = sealed_line("conv", 1, "one");
    const auto second = sealed_line("conv", 2, "two");

    REQUIRE(decoder.decode_line(first).is_ok());
    REQUIRE(decoder.decode_line(second).is_ok());

    auto replay = decoder.decode_line(first);
    REQUIRE(replay.is_error());
    CHECK(replay.error_category() == ErrorCategory::DECRYPTION_ERROR);
    CHECK(decoder.decode_line(second).is_error());
    CHECK(decoder.last_seq() == 2);

    // A gap is allowed; ordering is what matters
    auto later = decoder.decode_line(sealed_line("conv", 5, "five"));
    REQUIRE(later.is_ok());
    CHECK(later.value().text == "five");
}

TEST_CASE("Rejected packet leaves decoder state unchanged", "[stream][decoder]") {
    StreamDecoder decoder("conv", derive_stream_key(kSecret, "conv"));

    // Spliced in from another conversation
    CHECK(decoder.decode_line(sealed_line("other", 1, "foreign")).is_error());
    CHECK(decoder.last_seq() == 0);

    auto ok = decoder.decode_line(sealed_line("conv", 1, "mine"));
    REQUIRE(ok.is_ok());
    CHECK(ok.value().text == "mine");
}

TEST_CASE("Handshake line without a client key pair is rejected", "[stream][decoder]") {
    StreamDecoder decoder("conv", derive_stream_key(kSecret, "conv"));
    auto result = decoder.decode_line(encode_pubkey_packet(std::vector<uint8_t>(32, 9)));
    CHECK(result.is_error());
}
