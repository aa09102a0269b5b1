#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pipeshield {

// ============================================================================
// Markers
// ============================================================================

inline constexpr std::string_view kTruncatedCycle = "TRUNCATED_CYCLE";
inline constexpr std::string_view kTruncatedDepth = "TRUNCATED_DEPTH";
inline constexpr std::string_view kTruncatedSize  = "TRUNCATED_SIZE";
inline constexpr std::string_view kUnresolvedPrefix = "[UNRESOLVED:";

[[nodiscard]] inline bool is_marker(std::string_view s) {
    return s == kTruncatedCycle || s == kTruncatedDepth || s == kTruncatedSize;
}

// ============================================================================
// Categories and Patterns
// ============================================================================

/**
 * @brief A named class of sensitive information
 *
 * token_prefix is the uppercase tag tokens of this category start with.
 * rehydrate=false keeps the token in the final answer.
 */
struct CategoryDef {
    std::string name;
    std::string token_prefix;
    bool enabled = true;
    bool rehydrate = true;
};

enum class MatchKind : uint8_t {
    FIELD_NAME,     // key under which the value appears
    VALUE_REGEX,    // textual shape of the value
    TYPE_TAG        // semantic tag declared by the producer
};

enum class Confidence : uint8_t {
    CONFIDENT,
    AMBIGUOUS
};

/**
 * @brief One row of the classification table
 *
 * For FIELD_NAME and TYPE_TAG rules, `names` lists normalized field names
 * or tags. For VALUE_REGEX rules, `regex` is an ECMAScript pattern;
 * `capture_group` selects the sensitive part when the rule is applied to
 * free text (`embedded`).
 */
struct SensitivePattern {
    std::string category;
    MatchKind kind = MatchKind::FIELD_NAME;
    std::vector<std::string> names;
    std::string regex;
    int priority = 0;
    Confidence confidence = Confidence::CONFIDENT;
    bool embedded = false;
    bool case_insensitive = false;
    size_t capture_group = 0;
    bool partial_confident = false;   // FIELD_NAME: keys that merely contain a name keep `confidence`
};

struct Classification {
    std::string category;
    Confidence confidence = Confidence::CONFIDENT;
    int priority = 0;

    [[nodiscard]] bool ambiguous() const { return confidence == Confidence::AMBIGUOUS; }
};

/// A sensitive substring found inside free text
struct EmbeddedMatch {
    size_t offset = 0;
    size_t length = 0;
    std::string category;
    int priority = 0;
    Confidence confidence = Confidence::CONFIDENT;
};

// ============================================================================
// Tokens and Correlation
// ============================================================================

/**
 * @brief Category-prefixed, hashed stand-in for a sensitive value
 *
 * Rendered as "<PREFIX>_<digest>". Two tokens are equal iff prefix and
 * digest are equal.
 */
struct Token {
    std::string prefix;
    std::string digest;

    [[nodiscard]] std::string str() const { return prefix + "_" + digest; }

    friend bool operator==(const Token& a, const Token& b) {
        return a.prefix == b.prefix && a.digest == b.digest;
    }
    friend bool operator!=(const Token& a, const Token& b) { return !(a == b); }
};

struct CorrelationEntry {
    std::string original;
    Token token;
    std::string category;
};

// ============================================================================
// Reports
// ============================================================================

/**
 * @brief What happened during one anonymization pass
 *
 * Recoverable conditions are counted here instead of failing the pass.
 */
struct AnonymizationReport {
    size_t nodes_visited = 0;
    size_t tokens_minted = 0;
    size_t tokens_reused = 0;
    size_t collisions_resolved = 0;
    size_t ambiguous_redacted = 0;
    size_t ambiguous_passed = 0;
    size_t embedded_replaced = 0;
    size_t propagated_replaced = 0;
    size_t truncated_cycles = 0;
    size_t truncated_depth = 0;
    size_t truncated_size = 0;

    /// Some substructure was replaced by a truncation marker
    [[nodiscard]] bool partial() const {
        return truncated_cycles + truncated_depth + truncated_size > 0;
    }

    void merge(const AnonymizationReport& other) {
        nodes_visited += other.nodes_visited;
        tokens_minted += other.tokens_minted;
        tokens_reused += other.tokens_reused;
        collisions_resolved += other.collisions_resolved;
        ambiguous_redacted += other.ambiguous_redacted;
        ambiguous_passed += other.ambiguous_passed;
        embedded_replaced += other.embedded_replaced;
        propagated_replaced += other.propagated_replaced;
        truncated_cycles += other.truncated_cycles;
        truncated_depth += other.truncated_depth;
        truncated_size += other.truncated_size;
    }
};

struct RehydrationResult {
    std::string text;
    size_t resolved = 0;
    size_t withheld = 0;                    // category not rehydratable
    std::vector<std::string> unresolved;    // tokens unknown to this context

    [[nodiscard]] bool complete() const { return unresolved.empty(); }
};

// ============================================================================
// Round Trip State
// ============================================================================

enum class RoundTripState : uint8_t {
    RAW,
    ANONYMIZED,
    TRANSMITTED,
    RESPONSE_RECEIVED,
    REHYDRATED,
    DELIVERED,
    ABORTED
};

[[nodiscard]] inline const char* round_trip_state_to_string(RoundTripState state) {
    switch (state) {
        case RoundTripState::RAW:               return "raw";
        case RoundTripState::ANONYMIZED:        return "anonymized";
        case RoundTripState::TRANSMITTED:       return "transmitted";
        case RoundTripState::RESPONSE_RECEIVED: return "response_received";
        case RoundTripState::REHYDRATED:        return "rehydrated";
        case RoundTripState::DELIVERED:         return "delivered";
        case RoundTripState::ABORTED:           return "aborted";
        default:                                return "unknown";
    }
}

[[nodiscard]] inline const char* match_kind_to_string(MatchKind kind) {
    switch (kind) {
        case MatchKind::FIELD_NAME:  return "field_name";
        case MatchKind::VALUE_REGEX: return "value_regex";
        case MatchKind::TYPE_TAG:    return "type_tag";
        default:                     return "unknown";
    }
}

} // namespace pipeshield
