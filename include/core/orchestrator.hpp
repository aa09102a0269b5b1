#pragma once

#include "core/engine.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "core/value.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace pipeshield {

class AuditRecorder;
class IAiProvider;

struct Answer {
    std::string text;                   // rehydrated answer
    std::string round_trip_id;
    AnonymizationReport report;
    RehydrationResult rehydration;

    /// Some input substructure was truncated before transmission
    [[nodiscard]] bool partial() const { return report.partial(); }
};

/**
 * @brief Single entry and exit point for every AI-backed operation
 *
 * run() drives one RoundTrip from raw collaborator data to a delivered
 * answer: anonymize, hand the AnonymizedPayload to the provider, rehydrate
 * the response within the same context. Any failure aborts the round trip
 * and is returned as an error Result; raw data never leaves the process.
 * When an AuditRecorder is attached every finished round trip is recorded.
 *
 * Holds only immutable shared state; run() may be called concurrently.
 */
class Orchestrator {
public:
    explicit Orchestrator(std::shared_ptr<const Engine> engine,
                          std::shared_ptr<AuditRecorder> audit = nullptr);

    [[nodiscard]] Result<Answer> run(std::string_view operation,
                                     const Value& payload,
                                     std::string_view question,
                                     IAiProvider& provider) const;

    [[nodiscard]] const Engine& engine() const { return *engine_; }
    [[nodiscard]] std::shared_ptr<const Engine> engine_ptr() const { return engine_; }

private:
    std::shared_ptr<const Engine> engine_;
    std::shared_ptr<AuditRecorder> audit_;
};

} // namespace pipeshield
