#pragma once

#include "core/anonymized_payload.hpp"
#include "core/engine.hpp"
#include "core/types.hpp"
#include "core/value.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pipeshield {

/**
 * @brief One request's trip to the AI collaborator and back
 *
 *   RAW -> ANONYMIZED -> TRANSMITTED -> RESPONSE_RECEIVED -> REHYDRATED -> DELIVERED
 *
 * Any step invoked out of order, and any exception inside a step, moves the
 * round trip to ABORTED: the correlation store is cleared and nothing is
 * delivered. DELIVERED and ABORTED are terminal.
 *
 * Owns its AnonymizationContext exclusively. Not thread-safe; concurrent
 * requests use separate round trips over the same Engine.
 */
class RoundTrip {
public:
    RoundTrip(std::shared_ptr<const Engine> engine, std::string operation);

    RoundTrip(const RoundTrip&) = delete;
    RoundTrip& operator=(const RoundTrip&) = delete;

    /// RAW -> ANONYMIZED. The question is anonymized after the data.
    const AnonymizedPayload& anonymize(const Value& raw, std::string_view question = {});

    /// ANONYMIZED -> TRANSMITTED; returns what may be handed to the provider
    const AnonymizedPayload& transmit();

    /// TRANSMITTED -> RESPONSE_RECEIVED
    void receive(std::string response);

    /// RESPONSE_RECEIVED -> REHYDRATED
    const RehydrationResult& rehydrate();

    /// REHYDRATED -> DELIVERED; returns the final answer text
    std::string deliver();

    /// Any non-terminal state -> ABORTED. No-op once terminal.
    void abort(std::string reason);

    [[nodiscard]] RoundTripState state() const { return state_; }
    [[nodiscard]] bool terminal() const {
        return state_ == RoundTripState::DELIVERED || state_ == RoundTripState::ABORTED;
    }

    [[nodiscard]] const std::string& id() const { return context_->id(); }
    [[nodiscard]] const std::string& operation() const { return operation_; }
    [[nodiscard]] const std::string& abort_reason() const { return abort_reason_; }

    [[nodiscard]] const AnonymizationContext& context() const { return *context_; }
    [[nodiscard]] const AnonymizationReport& report() const { return context_->report(); }
    [[nodiscard]] const std::optional<RehydrationResult>& rehydration() const { return rehydration_; }
    [[nodiscard]] std::chrono::system_clock::time_point started_at() const { return started_at_; }

private:
    /// Aborts and throws StateError unless in `expected`
    void expect(RoundTripState expected, const char* step);

    void advance(RoundTripState next);

    std::shared_ptr<const Engine> engine_;
    std::unique_ptr<AnonymizationContext> context_;
    std::string operation_;
    RoundTripState state_ = RoundTripState::RAW;
    std::chrono::system_clock::time_point started_at_;

    std::optional<AnonymizedPayload> payload_;
    std::string response_;
    std::optional<RehydrationResult> rehydration_;
    std::string abort_reason_;
};

} // namespace pipeshield
