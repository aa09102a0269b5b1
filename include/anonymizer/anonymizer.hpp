#pragma once

#include "anonymizer/anonymization_context.hpp"
#include "core/types.hpp"
#include "core/value.hpp"

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace pipeshield {

class PatternRegistry;
class TokenFormat;

struct AnonymizerOptions {
    bool strict_mode = false;               // tokenize AMBIGUOUS matches
    size_t max_depth = 64;                  // container nesting limit
    size_t max_nodes = 100000;              // total nodes per anonymize() call
    size_t min_propagation_length = 4;      // shorter originals are propagated as whole words only
};

/**
 * @brief Recursive structural walker producing a leak-free copy of a tree
 *
 * - Mappings: each key is classified by name. A sensitive key has its whole
 *   value replaced by a token (containers as canonical JSON, null kept).
 *   String leaves of a redacted container are recorded as well.
 *   Other values are walked.
 * - Sequences and scalars under non-sensitive keys: strings are classified
 *   by shape and type tag; unclassified strings are scanned for embedded
 *   secrets, which are replaced in place.
 * - Cycles on the active path become TRUNCATED_CYCLE; containers past
 *   max_depth become TRUNCATED_DEPTH; nodes past max_nodes TRUNCATED_SIZE.
 * - After the walk, originals known to the context are replaced wherever
 *   they still occur in passed-through text. An occurrence glued to word
 *   characters ("frontend-deploy2") is widened to the enclosing word, which
 *   gets its own token, so every inserted token stays recognizable.
 *
 * Strings that already are tokens or markers pass through unchanged, which
 * makes anonymize() idempotent. The output is always a fresh tree; input is
 * never modified.
 *
 * Stateless apart from its configuration: one instance serves concurrent
 * round trips, each with its own context.
 */
class Anonymizer {
public:
    Anonymizer(const PatternRegistry& registry,
               const TokenFormat& tokens,
               AnonymizerOptions options);

    /**
     * @throws TokenSpaceExhausted when a token cannot be minted
     */
    [[nodiscard]] Value anonymize(const Value& input, AnonymizationContext& ctx) const;

    /// Free text (e.g. the user's question) through the same rules
    [[nodiscard]] std::string anonymize_text(std::string_view text, AnonymizationContext& ctx) const;

    [[nodiscard]] const AnonymizerOptions& options() const { return options_; }

private:
    struct Walk {
        AnonymizationContext& ctx;
        std::unordered_set<const void*> active_path;
        size_t nodes = 0;
    };

    Value walk(const Value& node, size_t depth, Walk& w) const;
    Value walk_object(const Value& node, size_t depth, Walk& w) const;
    Value walk_array(const Value& node, size_t depth, Walk& w) const;
    Value walk_string(const Value& node, Walk& w) const;

    /// Value under a key classified as `category`
    Value redact_member(const Value& member, const Classification& cls, Walk& w) const;

    void intern_leaves(const Value& node, const std::string& category, size_t depth,
                       std::unordered_set<const void*>& seen, Walk& w) const;

    /// Whether a match is tokenized under the current policy (counts ambiguity)
    bool accept(const Classification& cls, Walk& w) const;

    std::string tokenize(const std::string& category, const std::string& original, Walk& w) const;
    std::string replace_embedded(const std::string& text, Walk& w) const;

    void propagate(Value& node, AnonymizationContext& ctx) const;
    std::string propagate_text(const std::string& text,
                               const std::vector<CorrelationEntry>& originals,
                               Walk& w,
                               size_t& replaced) const;

    const PatternRegistry& registry_;
    const TokenFormat& tokens_;
    AnonymizerOptions options_;
};

} // namespace pipeshield
