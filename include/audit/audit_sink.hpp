#pragma once

#include <string>
#include <string_view>

namespace pipeshield {

/**
 * @brief Destination for audit records
 *
 * The AuditRecorder serializes all calls, so implementations need no
 * internal locking.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    /// Write one newline-terminated JSON record. Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view json_line) = 0;

    virtual void flush() = 0;

    /// Flush and release handles; further writes fail.
    virtual void shutdown() = 0;

    /// Human-readable sink name for logging (e.g. "file:/var/log/pipeshield/audit.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace pipeshield
