#include "core/orchestrator.hpp"
#include "audit/audit_recorder.hpp"
#include "core/round_trip.hpp"
#include "core/utils.hpp"
#include "provider/ai_provider.hpp"

#include <format>
#include <stdexcept>

namespace pipeshield {

Orchestrator::Orchestrator(std::shared_ptr<const Engine> engine,
                           std::shared_ptr<AuditRecorder> audit)
    : engine_(std::move(engine)), audit_(std::move(audit)) {
    if (!engine_) {
        throw std::invalid_argument("Orchestrator requires an engine");
    }
}

Result<Answer> Orchestrator::run(std::string_view operation,
                                 const Value& payload,
                                 std::string_view question,
                                 IAiProvider& provider) const {
    RoundTrip trip(engine_, std::string(operation));
    utils::Timer timer;

    // Abort, audit and report in one place
    const auto fail = [&](ErrorCategory category, const std::string& message) {
        trip.abort(message);
        if (audit_) audit_->record(trip);
        return Result<Answer>::error(category, message);
    };

    try {
        trip.anonymize(payload, question);
        const auto& outbound = trip.transmit();

        auto response = provider.complete(outbound);
        if (!response.success) {
            return fail(ErrorCategory::PROVIDER_ERROR,
                        std::format("{}: {}", provider.name(), response.error));
        }

        trip.receive(std::move(response.content));
        trip.rehydrate();

        Answer answer;
        answer.text = trip.deliver();
        answer.round_trip_id = trip.id();
        answer.report = trip.report();
        answer.rehydration = *trip.rehydration();

        utils::log::info(std::format(
            "[{}] {} delivered in {}us: {} tokens, {} resolved, {} withheld, {} unresolved{}",
            trip.id(), trip.operation(), timer.elapsed_us().count(),
            answer.report.tokens_minted, answer.rehydration.resolved,
            answer.rehydration.withheld, answer.rehydration.unresolved.size(),
            answer.partial() ? ", partial coverage" : ""));

        if (audit_) audit_->record(trip);
        return Result<Answer>::ok(std::move(answer));

    } catch (const TokenSpaceExhausted& e) {
        return fail(ErrorCategory::TOKEN_COLLISION, e.what());
    } catch (const StateError& e) {
        return fail(ErrorCategory::INTERNAL_ERROR, e.what());
    } catch (const std::exception& e) {
        return fail(ErrorCategory::INTERNAL_ERROR, std::format("unexpected error: {}", e.what()));
    }
}

} // namespace pipeshield
