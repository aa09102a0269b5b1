#pragma once

#include "config/config_types.hpp"
#include "core/engine.hpp"

#include <memory>

namespace pipeshield {

class AuditRecorder;
class ISaltSource;

/**
 * @brief Turn a validated PipeshieldConfig into runtime objects
 *
 * All functions throw ConfigError when the configuration cannot be honored
 * (e.g. the salt source is empty or a pattern fails to compile).
 */

/// Built-in table with [categories] overrides and [[patterns]] appended
[[nodiscard]] PatternRegistry build_registry(const PipeshieldConfig& config);

/// salt_file, else inline salt, else salt_env
[[nodiscard]] std::unique_ptr<ISaltSource> make_salt_source(const EngineConfig& config);

[[nodiscard]] EngineSettings engine_settings(const EngineConfig& config);

[[nodiscard]] std::shared_ptr<const Engine> build_engine(const PipeshieldConfig& config);

/// nullptr unless audit is enabled
[[nodiscard]] std::shared_ptr<AuditRecorder> build_audit_recorder(const AuditConfig& config);

} // namespace pipeshield
