#include <catch2/catch_test_macros.hpp>
#include "core/base64.hpp"
#include "stream/packet_codec.hpp"
#include "stream/stream_key.hpp"

#include <nlohmann/json.hpp>

using namespace vaultstream;
using namespace vaultstream::stream;
using json = nlohmann::json;

namespace {

AeadCipher test_cipher(const std::string& cid = "c1") {
    return derive_stream_key(std::vector<uint8_t>(32, 0x33), cid);
}

Packet parse_packet(const std::string& line) {
    auto msg = parse_line(line);
    REQUIRE(msg.is_ok());
    REQUIRE(msg.value().kind == StreamMessage::Kind::CIPHERTEXT);
    return msg.value().packet;
}

} // namespace

// ============================================================================
// Encoding
// ============================================================================

TEST_CASE("AAD binds conversation and sequence", "[stream][packet]") {
    CHECK(make_aad("c1", 1) == "cid=c1;seq=1");
    CHECK(make_aad("abc-123", 42) == "cid=abc-123;seq=42");
}

TEST_CASE("Packet line is compact JSON in wire key order", "[stream][packet]") {
    const auto cipher = test_cipher();
    auto packet = seal_packet(cipher, "c1", 1, "hello");
    REQUIRE(packet.is_ok());
    CHECK(packet.value().iv.size() == AeadCipher::kIvLen);
    CHECK(packet.value().ciphertext.size() == 5 + AeadCipher::kTagLen);

    const auto line = encode_packet(packet.value());
    REQUIRE(line.back() == '\n');
    CHECK(line.find('\n') == line.size() - 1);
    CHECK(line.find(' ') == std::string::npos);
    CHECK(line.rfind(R"({"type":"ciphertext","seq":1,"iv":")", 0) == 0);
    CHECK(line.find(R"(","aad":"cid=c1;seq=1"})") != std::string::npos);

    const auto doc = json::parse(line);
    CHECK(doc["type"] == "ciphertext");
    CHECK(doc["seq"] == 1);
}

TEST_CASE("Handshake line carries the base64 public key", "[stream][packet]") {
    const std::vector<uint8_t> pub(32, 0xAB);
    const auto line = encode_pubkey_packet(pub);
    CHECK(line == R"({"type":"server_pubkey","pubkey":")" + base64::encode(pub) + "\"}\n");

    auto msg = parse_line(line);
    REQUIRE(msg.is_ok());
    CHECK(msg.value().kind == StreamMessage::Kind::SERVER_PUBKEY);
    CHECK(msg.value().pubkey == pub);
}

// ============================================================================
// Opening
// ============================================================================

TEST_CASE("Sealed packet opens after a trip through the wire format", "[stream][packet]") {
    const auto cipher = test_cipher();
    auto packet = seal_packet(cipher, "c1", 7, "héllo wörld");
    REQUIRE(packet.is_ok());

    const auto received = parse_packet(encode_packet(packet.value()));
    CHECK(received.seq == 7);
    auto text = open_packet(cipher, "c1", received);
    REQUIRE(text.is_ok());
    CHECK(text.value() == "héllo wörld");
}

TEST_CASE("Tampering with any field rejects the packet", "[stream][packet]") {
    const auto cipher = test_cipher();
    auto sealed = seal_packet(cipher, "c1", 3, "payload");
    REQUIRE(sealed.is_ok());
    const Packet& good = sealed.value();

    SECTION("iv") {
        Packet p = good;
        p.iv[0] ^= 0x01;
        CHECK(open_packet(cipher, "c1", p).is_error());
    }
    SECTION("ciphertext") {
        Packet p = good;
        p.ciphertext[0] ^= 0x01;
        CHECK(open_packet(cipher, "c1", p).is_error());
    }
    SECTION("tag") {
        Packet p = good;
        p.ciphertext.back() ^= 0x01;
        CHECK(open_packet(cipher, "c1", p).is_error());
    }
    SECTION("aad") {
        Packet p = good;
        p.aad = "cid=c1;seq=4";
        auto r = open_packet(cipher, "c1", p);
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::DECRYPTION_ERROR);
    }
    SECTION("seq without matching aad") {
        Packet p = good;
        p.seq = 4;
        CHECK(open_packet(cipher, "c1", p).is_error());
    }
    SECTION("seq and aad rewritten together") {
        Packet p = good;
        p.seq = 4;
        p.aad = make_aad("c1", 4);
        CHECK(open_packet(cipher, "c1", p).is_error());
    }
}

TEST_CASE("Packets from another conversation are rejected", "[stream][packet]") {
    const auto cipher = test_cipher("c1");
    auto packet = seal_packet(cipher, "c1", 1, "mine");
    REQUIRE(packet.is_ok());

    // Same key, other cid: AAD check fails
    CHECK(open_packet(cipher, "c2", packet.value()).is_error());

    // Other conversation's key, forged AAD: authentication fails
    Packet forged = packet.value();
    forged.aad = make_aad("c2", 1);
    CHECK(open_packet(test_cipher("c2"), "c2", forged).is_error());
}

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("parse_line rejects malformed lines", "[stream][packet]") {
    const std::string iv = base64::encode(std::vector<uint8_t>(12, 1));
    const std::string ct = base64::encode(std::vector<uint8_t>(20, 2));

    CHECK(parse_line("").is_error());
    CHECK(parse_line("not json").is_error());
    CHECK(parse_line("[1,2,3]").is_error());
    CHECK(parse_line(R"({"seq":1})").is_error());
    CHECK(parse_line(R"({"type":"mystery"})").is_error());
    CHECK(parse_line(R"({"type":"ciphertext","seq":0,"iv":")" + iv + R"(","ciphertext":")" + ct +
                     R"(","aad":"cid=c;seq=0"})").is_error());
    CHECK(parse_line(R"({"type":"ciphertext","seq":"1","iv":")" + iv + R"(","ciphertext":")" + ct +
                     R"(","aad":"cid=c;seq=1"})").is_error());
    CHECK(parse_line(R"({"type":"ciphertext","seq":1,"iv":"AAAA","ciphertext":")" + ct +
                     R"(","aad":"cid=c;seq=1"})").is_error());
    CHECK(parse_line(R"({"type":"ciphertext","seq":1,"iv":")" + iv + R"(","ciphertext":"AAAA","aad":"cid=c;seq=1"})").is_error());
    CHECK(parse_line(R"({"type":"ciphertext","seq":1,"iv":")" + iv + R"(","ciphertext":")" + ct + R"("})").is_error());
    CHECK(parse_line(R"({"type":"server_pubkey","pubkey":"AAAA"})").is_error());

    auto ok = parse_line(R"({"type":"ciphertext","seq":1,"iv":")" + iv + R"(","ciphertext":")" + ct +
                         R"(","aad":"cid=c;seq=1"})");
    CHECK(ok.is_ok());
}
