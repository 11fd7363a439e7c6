/**
 * QueryCache - Prefix-invalidating query cache
 * Payload Codec Implementation
 */

#include "cache/payload_codec.hpp"

#include "config/config.hpp"

#include <cstdint>
#include <vector>

namespace querycache::cache {

namespace {

std::string to_string(const std::vector<std::uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

std::optional<PayloadFormat> parse_payload_format(std::string_view name) {
    if (config::iequals(name, "json")) return PayloadFormat::Json;
    if (config::iequals(name, "cbor")) return PayloadFormat::Cbor;
    if (config::iequals(name, "msgpack") || config::iequals(name, "messagepack")) return PayloadFormat::MessagePack;
    return std::nullopt;
}

std::string JsonCodec::encode(const nlohmann::json& document) const {
    return document.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
}

nlohmann::json JsonCodec::decode(std::string_view payload) const {
    return nlohmann::json::parse(payload.begin(), payload.end());
}

std::string CborCodec::encode(const nlohmann::json& document) const {
    return to_string(nlohmann::json::to_cbor(document));
}

nlohmann::json CborCodec::decode(std::string_view payload) const {
    return nlohmann::json::from_cbor(payload.begin(), payload.end());
}

std::string MessagePackCodec::encode(const nlohmann::json& document) const {
    return to_string(nlohmann::json::to_msgpack(document));
}

nlohmann::json MessagePackCodec::decode(std::string_view payload) const {
    return nlohmann::json::from_msgpack(payload.begin(), payload.end());
}

std::shared_ptr<const PayloadCodec> make_codec(PayloadFormat format) {
    switch (format) {
        case PayloadFormat::Cbor:        return std::make_shared<CborCodec>();
        case PayloadFormat::MessagePack: return std::make_shared<MessagePackCodec>();
        case PayloadFormat::Json:
        default:                         return std::make_shared<JsonCodec>();
    }
}

} // namespace querycache::cache
