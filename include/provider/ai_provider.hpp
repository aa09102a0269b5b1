#pragma once

#include "core/anonymized_payload.hpp"

#include <chrono>
#include <string>

namespace pipeshield {

struct ProviderResponse {
    bool success = false;
    std::string content;
    std::string error;
    std::string model_used;
    std::chrono::milliseconds latency{0};
};

/**
 * @brief The external natural-language reasoning service
 *
 * Implementations must be safe to call from concurrent round trips.
 */
class IAiProvider {
public:
    virtual ~IAiProvider() = default;

    [[nodiscard]] virtual ProviderResponse complete(const AnonymizedPayload& payload) = 0;

    /// Human-readable provider name for logging (e.g. "openai:gpt-4")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace pipeshield
