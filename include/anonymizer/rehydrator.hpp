#pragma once

#include "anonymizer/anonymization_context.hpp"
#include "core/types.hpp"
#include "core/value.hpp"

#include <string>
#include <string_view>

namespace pipeshield {

class PatternRegistry;
class TokenFormat;

/**
 * @brief Resolves tokens in an AI response back to original values
 *
 * Only the given context's store is consulted, so tokens minted by any
 * other round trip are never resolved. Tokens that cannot be resolved are
 * rendered "[UNRESOLVED:<token>]" and listed in the result; tokens of a
 * category with rehydrate=false stay as they are and are counted as
 * withheld.
 */
class Rehydrator {
public:
    Rehydrator(const PatternRegistry& registry, const TokenFormat& tokens);

    [[nodiscard]] RehydrationResult rehydrate(std::string_view text,
                                              const AnonymizationContext& ctx) const;

    /// Rehydrate every string in an acyclic tree; counters accumulate into `summary`
    [[nodiscard]] Value rehydrate(const Value& value,
                                  const AnonymizationContext& ctx,
                                  RehydrationResult& summary) const;

private:
    void rehydrate_into(std::string_view text, const AnonymizationContext& ctx,
                        RehydrationResult& result) const;

    const PatternRegistry& registry_;
    const TokenFormat& tokens_;
};

} // namespace pipeshield
