#pragma once

#include "core/types.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace pipeshield {

class PatternRegistry;

/**
 * @brief Recognizes rendered tokens ("<PREFIX>_<digest>") in text
 *
 * A string is token-shaped when its prefix belongs to a configured
 * category and the digest is exactly digest_width lowercase hex
 * characters. Tokens are found only on word boundaries, so
 * "xPIPELINE_..." or "PIPELINE_...abc" (too long) never match.
 */
class TokenFormat {
public:
    struct Span {
        size_t offset = 0;
        size_t length = 0;
        Token token;
    };

    TokenFormat(const PatternRegistry& registry, size_t digest_width);

    [[nodiscard]] std::optional<Token> parse(std::string_view text) const;
    [[nodiscard]] bool is_token(std::string_view text) const { return parse(text).has_value(); }

    /// All token occurrences in text, in order
    [[nodiscard]] std::vector<Span> find_all(std::string_view text) const;

    [[nodiscard]] size_t digest_width() const { return digest_width_; }

private:
    /// Token starting exactly at pos; length in `length`
    [[nodiscard]] std::optional<Token> match_at(std::string_view text, size_t pos, size_t& length) const;

    std::set<std::string, std::less<>> prefixes_;
    size_t digest_width_;
};

} // namespace pipeshield
