#include "security/hasher.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <format>

namespace pipeshield {

namespace {
constexpr char kFieldSeparator = '\x1f';
}

Hasher::Hasher(std::vector<uint8_t> salt, size_t digest_width)
    : salt_(std::move(salt)), digest_width_(digest_width) {
    if (salt_.size() < kMinSaltBytes) {
        throw ConfigError(std::format(
            "Salt must be at least {} bytes (got {})", kMinSaltBytes, salt_.size()));
    }
    if (digest_width_ < kMinDigestWidth || digest_width_ > kMaxDigestWidth) {
        throw ConfigError(std::format(
            "digest_width must be between {} and {} (got {})",
            kMinDigestWidth, kMaxDigestWidth, digest_width_));
    }
}

std::string Hasher::digest(std::string_view category,
                           std::string_view value,
                           uint32_t attempt) const {
    std::string message;
    message.reserve(category.size() + value.size() + 12);
    message.append(category);
    message += kFieldSeparator;
    message.append(value);
    if (attempt > 0) {
        message += kFieldSeparator;
        message += std::format("{}", attempt);
    }

    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha256(),
              salt_.data(), static_cast<int>(salt_.size()),
              reinterpret_cast<const unsigned char*>(message.data()),
              message.size(),
              mac, &mac_len)) {
        throw std::runtime_error("HMAC failed");
    }

    auto hex = utils::bytes_to_hex(mac, mac_len);
    hex.resize(digest_width_);
    return hex;
}

} // namespace pipeshield
