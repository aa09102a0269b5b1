#include "audit/audit_recorder.hpp"
#include "core/json.hpp"
#include "core/round_trip.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace pipeshield {

AuditRecorder::AuditRecorder(std::unique_ptr<IAuditSink> sink)
    : sink_(std::move(sink)) {
    if (!sink_) {
        throw std::invalid_argument("AuditRecorder requires a sink");
    }
    utils::log::info(std::format("Audit mode enabled: {}", sink_->name()));
}

AuditRecorder::~AuditRecorder() {
    std::lock_guard lock(mutex_);
    sink_->shutdown();
}

std::string AuditRecorder::sink_name() const {
    return sink_->name();
}

Value AuditRecorder::to_value(const RoundTrip& round_trip) {
    Value record = Value::object();
    record["timestamp"] = utils::format_timestamp(round_trip.started_at());
    record["round_trip_id"] = round_trip.id();
    record["operation"] = round_trip.operation();
    record["state"] = round_trip_state_to_string(round_trip.state());
    if (round_trip.state() == RoundTripState::ABORTED) {
        record["abort_reason"] = round_trip.abort_reason();
    }

    const auto& r = round_trip.report();
    auto& report = record["report"];
    report["nodes_visited"] = r.nodes_visited;
    report["tokens_minted"] = r.tokens_minted;
    report["tokens_reused"] = r.tokens_reused;
    report["collisions_resolved"] = r.collisions_resolved;
    report["ambiguous_redacted"] = r.ambiguous_redacted;
    report["ambiguous_passed"] = r.ambiguous_passed;
    report["embedded_replaced"] = r.embedded_replaced;
    report["propagated_replaced"] = r.propagated_replaced;
    report["truncated_cycles"] = r.truncated_cycles;
    report["truncated_depth"] = r.truncated_depth;
    report["truncated_size"] = r.truncated_size;
    report["partial"] = r.partial();

    if (const auto& rehydration = round_trip.rehydration()) {
        auto& summary = record["rehydration"];
        summary["resolved"] = rehydration->resolved;
        summary["withheld"] = rehydration->withheld;
        Value unresolved = Value::array();
        for (const auto& token : rehydration->unresolved) {
            unresolved.push_back(token);
        }
        summary["unresolved"] = std::move(unresolved);
    }

    Value entries = Value::array();
    for (const auto& entry : round_trip.context().store().entries()) {
        Value e = Value::object();
        e["category"] = entry.category;
        e["token"] = entry.token.str();
        e["original"] = entry.original;
        entries.push_back(std::move(e));
    }
    record["entries"] = std::move(entries);
    return record;
}

bool AuditRecorder::record(const RoundTrip& round_trip) {
    if (!round_trip.terminal()) {
        utils::log::warn(std::format("[{}] audit record requested in non-terminal state '{}'",
            round_trip.id(), round_trip_state_to_string(round_trip.state())));
    }

    auto line = json::write(to_value(round_trip));
    line += '\n';

    std::lock_guard lock(mutex_);
    if (!sink_->write(line)) {
        write_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("[{}] audit write to {} failed", round_trip.id(), sink_->name()));
        return false;
    }
    records_written_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void AuditRecorder::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

} // namespace pipeshield
