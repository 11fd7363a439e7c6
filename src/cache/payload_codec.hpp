/**
 * QueryCache - Prefix-invalidating query cache
 * Payload Codec - Wire format for cached values
 *
 * Values are converted to nlohmann::json through the usual to_json/from_json
 * ADL hooks; the codec only decides how that document is laid out in bytes.
 */

#ifndef QUERYCACHE_CACHE_PAYLOAD_CODEC_HPP
#define QUERYCACHE_CACHE_PAYLOAD_CODEC_HPP

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace querycache::cache {

enum class PayloadFormat {
    Json,
    Cbor,
    MessagePack
};

std::optional<PayloadFormat> parse_payload_format(std::string_view name);

class PayloadCodec {
public:
    virtual ~PayloadCodec() = default;

    virtual std::string encode(const nlohmann::json& document) const = 0;

    /**
     * @throws nlohmann::json::exception if the payload is malformed
     */
    virtual nlohmann::json decode(std::string_view payload) const = 0;

    virtual std::string_view name() const = 0;
};

/**
 * UTF-8 JSON text; encode throws json::type_error on invalid UTF-8 in strings
 */
class JsonCodec final : public PayloadCodec {
public:
    std::string encode(const nlohmann::json& document) const override;
    nlohmann::json decode(std::string_view payload) const override;
    std::string_view name() const override { return "json"; }
};

class CborCodec final : public PayloadCodec {
public:
    std::string encode(const nlohmann::json& document) const override;
    nlohmann::json decode(std::string_view payload) const override;
    std::string_view name() const override { return "cbor"; }
};

class MessagePackCodec final : public PayloadCodec {
public:
    std::string encode(const nlohmann::json& document) const override;
    nlohmann::json decode(std::string_view payload) const override;
    std::string_view name() const override { return "msgpack"; }
};

std::shared_ptr<const PayloadCodec> make_codec(PayloadFormat format);

} // namespace querycache::cache

#endif // QUERYCACHE_CACHE_PAYLOAD_CODEC_HPP
