#include "core/round_trip.hpp"
#include "core/error.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace pipeshield {

RoundTrip::RoundTrip(std::shared_ptr<const Engine> engine, std::string operation)
    : engine_(std::move(engine)),
      operation_(std::move(operation)),
      started_at_(std::chrono::system_clock::now()) {
    if (!engine_) {
        throw std::invalid_argument("RoundTrip requires an engine");
    }
    context_ = engine_->new_context();
}

void RoundTrip::expect(RoundTripState expected, const char* step) {
    if (state_ == expected) return;

    const auto message = std::format("{}() called in state '{}' (expected '{}')",
        step, round_trip_state_to_string(state_), round_trip_state_to_string(expected));
    abort(message);
    throw StateError(message);
}

void RoundTrip::advance(RoundTripState next) {
    utils::log::debug(std::format("[{}] {} -> {}", id(),
        round_trip_state_to_string(state_), round_trip_state_to_string(next)));
    state_ = next;
}

const AnonymizedPayload& RoundTrip::anonymize(const Value& raw, std::string_view question) {
    expect(RoundTripState::RAW, "anonymize");
    try {
        const auto& anonymizer = engine_->anonymizer();
        auto data = anonymizer.anonymize(raw, *context_);
        auto safe_question = anonymizer.anonymize_text(question, *context_);
        auto text = json::write(data);
        payload_.emplace(AnonymizedPayload(std::move(data), std::move(text), std::move(safe_question),
                                           operation_, context_->id()));
    } catch (const std::exception& e) {
        abort(std::format("anonymization failed: {}", e.what()));
        throw;
    }
    advance(RoundTripState::ANONYMIZED);
    return *payload_;
}

const AnonymizedPayload& RoundTrip::transmit() {
    expect(RoundTripState::ANONYMIZED, "transmit");
    advance(RoundTripState::TRANSMITTED);
    return *payload_;
}

void RoundTrip::receive(std::string response) {
    expect(RoundTripState::TRANSMITTED, "receive");
    response_ = std::move(response);
    advance(RoundTripState::RESPONSE_RECEIVED);
}

const RehydrationResult& RoundTrip::rehydrate() {
    expect(RoundTripState::RESPONSE_RECEIVED, "rehydrate");
    try {
        rehydration_ = engine_->rehydrator().rehydrate(response_, *context_);
    } catch (const std::exception& e) {
        abort(std::format("rehydration failed: {}", e.what()));
        throw;
    }
    if (!rehydration_->complete()) {
        utils::log::warn(std::format("[{}] {} token(s) in the response are unknown to this context",
            id(), rehydration_->unresolved.size()));
    }
    advance(RoundTripState::REHYDRATED);
    return *rehydration_;
}

std::string RoundTrip::deliver() {
    expect(RoundTripState::REHYDRATED, "deliver");
    advance(RoundTripState::DELIVERED);
    return rehydration_->text;
}

void RoundTrip::abort(std::string reason) {
    if (terminal()) return;

    utils::log::warn(std::format("[{}] round trip '{}' aborted in state '{}': {}",
        id(), operation_, round_trip_state_to_string(state_), reason));

    abort_reason_ = std::move(reason);
    payload_.reset();
    response_.clear();
    rehydration_.reset();
    context_->discard();
    state_ = RoundTripState::ABORTED;
}

} // namespace pipeshield
