#pragma once

#include "audit/audit_sink.hpp"
#include "core/value.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace pipeshield {

class RoundTrip;

/**
 * @brief Append-only record of finished round trips (audit mode)
 *
 * One JSON line per round trip: identity, operation, final state, report
 * counters, rehydration summary and, for delivered trips, the correlation
 * entries. Aborted trips have cleared their store, so their records carry
 * no entries. Audit is the only path by which a correlation store outlives
 * its round trip.
 *
 * Shared by concurrent round trips; sink access is serialized.
 */
class AuditRecorder {
public:
    explicit AuditRecorder(std::unique_ptr<IAuditSink> sink);
    ~AuditRecorder();

    AuditRecorder(const AuditRecorder&) = delete;
    AuditRecorder& operator=(const AuditRecorder&) = delete;

    /// Record a round trip in a terminal state. Returns false on sink failure.
    bool record(const RoundTrip& round_trip);

    void flush();

    [[nodiscard]] uint64_t records_written() const { return records_written_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t write_failures() const { return write_failures_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::string sink_name() const;

    /// Record as a Value (for testing)
    [[nodiscard]] static Value to_value(const RoundTrip& round_trip);

private:
    std::unique_ptr<IAuditSink> sink_;
    std::mutex mutex_;
    std::atomic<uint64_t> records_written_{0};
    std::atomic<uint64_t> write_failures_{0};
};

} // namespace pipeshield
