#pragma once

#include "anonymizer/correlation_store.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <string>

namespace pipeshield {

/**
 * @brief Scope of one logical request
 *
 * Owns the correlation store and the running report for one round trip.
 * Never shared between round trips; discarding it discards every mapping.
 */
class AnonymizationContext {
public:
    explicit AnonymizationContext(const Hasher& hasher,
                                  std::string id = utils::generate_uuid(),
                                  uint32_t max_attempts = CorrelationStore::kMaxAttempts)
        : id_(std::move(id)), store_(hasher, max_attempts) {}

    AnonymizationContext(const AnonymizationContext&) = delete;
    AnonymizationContext& operator=(const AnonymizationContext&) = delete;

    [[nodiscard]] const std::string& id() const { return id_; }

    [[nodiscard]] CorrelationStore& store() { return store_; }
    [[nodiscard]] const CorrelationStore& store() const { return store_; }

    [[nodiscard]] AnonymizationReport& report() { return report_; }
    [[nodiscard]] const AnonymizationReport& report() const { return report_; }

    /// Drop all mappings (round trip aborted or finished); the report is kept
    void discard() { store_.clear(); }

private:
    std::string id_;
    CorrelationStore store_;
    AnonymizationReport report_;
};

} // namespace pipeshield
