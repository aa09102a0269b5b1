#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pipeshield {

/**
 * @brief Deterministic, salted digest generator
 *
 * digest = hex(HMAC-SHA-256(salt, category 0x1F value [0x1F attempt]))
 * truncated to the configured width. The salt is fixed at construction
 * and never changes, so identical inputs always yield identical digests.
 * Immutable after construction; safe to share across threads.
 */
class Hasher {
public:
    static constexpr size_t kMinSaltBytes = 16;
    static constexpr size_t kMinDigestWidth = 4;
    static constexpr size_t kMaxDigestWidth = 64;

    /**
     * @throws ConfigError if the salt is shorter than kMinSaltBytes or the
     *         width lies outside [kMinDigestWidth, kMaxDigestWidth]
     */
    Hasher(std::vector<uint8_t> salt, size_t digest_width);

    /**
     * @brief Digest of (category, value)
     * @param attempt Disambiguation counter; 0 for the first attempt.
     *                Non-zero attempts append a suffix to the hash input.
     */
    [[nodiscard]] std::string digest(std::string_view category,
                                     std::string_view value,
                                     uint32_t attempt = 0) const;

    [[nodiscard]] size_t digest_width() const { return digest_width_; }

private:
    std::vector<uint8_t> salt_;
    size_t digest_width_;
};

} // namespace pipeshield
