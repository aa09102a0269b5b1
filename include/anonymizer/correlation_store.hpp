#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pipeshield {

class Hasher;

/**
 * @brief Per-context bidirectional map between original values and tokens
 *
 * Keyed by (category, original) for dedup and by rendered token for
 * rehydration. When a freshly digested token is already taken by a
 * different original, the value is re-digested with an attempt counter
 * until a free token is found, so two distinct originals never share a
 * token. Owned by exactly one AnonymizationContext; not thread-safe.
 */
class CorrelationStore {
public:
    static constexpr uint32_t kMaxAttempts = 64;

    struct InternResult {
        Token token;
        bool minted = false;        // false: existing entry reused
        uint32_t collisions = 0;    // re-digests needed to mint
    };

    explicit CorrelationStore(const Hasher& hasher, uint32_t max_attempts = kMaxAttempts);

    /**
     * @brief Token for (category, value), minting one if new
     * @throws TokenSpaceExhausted if max_attempts digests all collide
     */
    InternResult intern(const std::string& category,
                        const std::string& token_prefix,
                        const std::string& value);

    [[nodiscard]] std::optional<std::string> resolve(const Token& token) const;

    [[nodiscard]] const CorrelationEntry* find(std::string_view category, std::string_view value) const;
    [[nodiscard]] const CorrelationEntry* find_token(std::string_view rendered) const;

    /// Entries in the order they were minted
    [[nodiscard]] const std::vector<CorrelationEntry>& entries() const { return entries_; }

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t collisions() const { return collisions_; }

    void clear();

private:
    static std::string value_key(std::string_view category, std::string_view value);

    const Hasher& hasher_;
    uint32_t max_attempts_;
    std::vector<CorrelationEntry> entries_;
    std::unordered_map<std::string, size_t> by_value_;
    std::unordered_map<std::string, size_t> by_token_;
    size_t collisions_ = 0;
};

} // namespace pipeshield
