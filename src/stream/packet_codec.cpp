#include "stream/packet_codec.hpp"
#include "core/base64.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace vaultstream::stream {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace {

Result<StreamMessage> reject(std::string_view reason) {
    return Result<StreamMessage>::error(ErrorCategory::DECRYPTION_ERROR,
                                        std::format("Packet rejected: {}", reason));
}

const json* string_field(const json& obj, const char* name) {
    auto it = obj.find(name);
    if (it == obj.end() || !it->is_string()) return nullptr;
    return &*it;
}

} // anonymous namespace

std::string make_aad(std::string_view conversation_id, uint64_t seq) {
    return std::format("cid={};seq={}", conversation_id, seq);
}

Result<Packet> seal_packet(const AeadCipher& cipher,
                           std::string_view conversation_id,
                           uint64_t seq,
                           std::string_view payload) {
    using R = Result<Packet>;
    auto iv = AeadCipher::random_bytes(AeadCipher::kIvLen);
    if (!iv) {
        return R::error(ErrorCategory::ENCRYPTION_ERROR, "RAND_bytes failed generating IV");
    }

    Packet packet;
    packet.seq = seq;
    packet.aad = make_aad(conversation_id, seq);
    auto sealed = cipher.seal(*iv, reinterpret_cast<const uint8_t*>(payload.data()),
                              payload.size(), packet.aad);
    if (sealed.is_error()) {
        return R::error_from(sealed);
    }
    packet.iv = std::move(*iv);
    packet.ciphertext = std::move(sealed.value());
    return R::ok(std::move(packet));
}

std::string encode_packet(const Packet& packet) {
    ordered_json j;
    j["type"] = packet.type;
    j["seq"] = packet.seq;
    j["iv"] = base64::encode(packet.iv);
    j["ciphertext"] = base64::encode(packet.ciphertext);
    j["aad"] = packet.aad;
    return j.dump() + "\n";
}

std::string encode_pubkey_packet(const std::vector<uint8_t>& pubkey) {
    ordered_json j;
    j["type"] = std::string(kServerPubkeyType);
    j["pubkey"] = base64::encode(pubkey);
    return j.dump() + "\n";
}

Result<StreamMessage> parse_line(std::string_view line) {
    const std::string trimmed = utils::trim(std::string(line));
    if (trimmed.empty()) {
        return reject("empty line");
    }

    json doc = json::parse(trimmed, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return reject("not a JSON object");
    }
    const json* type = string_field(doc, "type");
    if (!type) {
        return reject("missing type");
    }

    StreamMessage msg;
    const auto& type_name = type->get_ref<const std::string&>();

    if (type_name == kServerPubkeyType) {
        const json* field = string_field(doc, "pubkey");
        if (!field) return reject("missing pubkey");
        auto pubkey = base64::decode(field->get_ref<const std::string&>());
        if (!pubkey || pubkey->size() != 32) return reject("invalid pubkey");
        msg.kind = StreamMessage::Kind::SERVER_PUBKEY;
        msg.pubkey = std::move(*pubkey);
        return Result<StreamMessage>::ok(std::move(msg));
    }

    if (type_name != kCiphertextType) {
        return reject(std::format("unknown type '{}'", type_name));
    }

    auto seq_it = doc.find("seq");
    if (seq_it == doc.end() || !seq_it->is_number_integer() ||
        seq_it->get<int64_t>() < 1) {
        return reject("invalid seq");
    }
    const json* iv = string_field(doc, "iv");
    const json* ciphertext = string_field(doc, "ciphertext");
    const json* aad = string_field(doc, "aad");
    if (!iv || !ciphertext || !aad) {
        return reject("missing field");
    }

    auto iv_bytes = base64::decode(iv->get_ref<const std::string&>());
    if (!iv_bytes || iv_bytes->size() != AeadCipher::kIvLen) {
        return reject("invalid iv");
    }
    auto ct_bytes = base64::decode(ciphertext->get_ref<const std::string&>());
    if (!ct_bytes || ct_bytes->size() < AeadCipher::kTagLen) {
        return reject("invalid ciphertext");
    }

    msg.kind = StreamMessage::Kind::CIPHERTEXT;
    msg.packet.seq = seq_it->get<uint64_t>();
    msg.packet.iv = std::move(*iv_bytes);
    msg.packet.ciphertext = std::move(*ct_bytes);
    msg.packet.aad = aad->get<std::string>();
    return Result<StreamMessage>::ok(std::move(msg));
}

Result<std::string> open_packet(const AeadCipher& cipher,
                                std::string_view conversation_id,
                                const Packet& packet) {
    using R = Result<std::string>;
    if (packet.aad != make_aad(conversation_id, packet.seq)) {
        return R::error(ErrorCategory::DECRYPTION_ERROR,
                        std::format("Packet rejected: aad does not match seq {}", packet.seq));
    }
    auto plain = cipher.open(packet.iv, packet.ciphertext, packet.aad);
    if (!plain) {
        return R::error(ErrorCategory::DECRYPTION_ERROR,
                        std::format("Packet rejected: authentication failed at seq {}", packet.seq));
    }
    return R::ok(std::string(plain->begin(), plain->end()));
}

} // namespace vaultstream::stream
