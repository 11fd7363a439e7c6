/**
 * QueryCache - Prefix-invalidating query cache
 * Cache Key Implementation
 */

#include "cache/cache_key.hpp"

#include <openssl/evp.h>
#include <xxhash.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace querycache::cache {

namespace {

constexpr std::string_view kIndexSuffix = ":__index";
constexpr std::string_view kCatalogSuffix = ":__prefix_catalog";
constexpr std::string_view kHashSegment = "__hash:";

std::string join(std::string_view head, std::string_view tail) {
    std::string key;
    key.reserve(head.size() + 1 + tail.size());
    key.append(head);
    key.push_back(':');
    key.append(tail);
    return key;
}

} // namespace

std::string build_cache_key(const config::CachingSettings& settings, std::string_view logical_key) {
    return join(settings.key_prefix, logical_key);
}

std::string build_prefix_key(const config::CachingSettings& settings, std::string_view prefix) {
    return join(settings.key_prefix, prefix);
}

std::string build_index_key(std::string_view prefix_key) {
    std::string key(prefix_key);
    key.append(kIndexSuffix);
    return key;
}

std::string build_catalog_key(const config::CachingSettings& settings) {
    std::string key(settings.key_prefix);
    key.append(kCatalogSuffix);
    return key;
}

std::string build_hash_key(const config::CachingSettings& settings, std::string_view hashed_key) {
    std::string tail(kHashSegment);
    tail.append(hashed_key);
    return join(settings.key_prefix, tail);
}

std::string extract_prefix(std::string_view logical_key) {
    if (is_blank(logical_key)) {
        return {};
    }

    std::size_t search_from = 0;
    while (search_from < logical_key.size()) {
        auto colon = logical_key.find(':', search_from);
        if (colon == std::string_view::npos) {
            break;
        }

        auto next_colon = logical_key.find(':', colon + 1);
        auto segment = logical_key.substr(colon + 1,
            next_colon == std::string_view::npos ? std::string_view::npos : next_colon - colon - 1);
        if (segment.find('=') != std::string_view::npos) {
            return std::string(logical_key.substr(0, colon));
        }

        search_from = colon + 1;
    }

    return std::string(logical_key);
}

std::string hash_key(std::string_view logical_key) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), logical_key.data(), logical_key.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

bool is_blank(std::string_view value) {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::size_t PhysicalKeyHash::operator()(std::string_view key) const noexcept {
    return static_cast<std::size_t>(XXH64(key.data(), key.size(), 0));
}

} // namespace querycache::cache
