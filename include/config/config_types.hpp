#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pipeshield {

// ============================================================================
// Configuration Types (mirror the TOML layout)
// ============================================================================

struct EngineConfig {
    std::string salt_env = "PIPESHIELD_SALT";   // used when neither file nor inline salt is set
    std::string salt_file;
    std::string salt;                           // inline; discouraged outside tests
    size_t digest_width = 12;
    bool strict_mode = false;
    size_t max_depth = 64;
    size_t max_nodes = 100000;
    size_t min_propagation_length = 4;
};

/// [categories.<name>]: overrides a built-in category or declares a new one
struct CategoryConfig {
    std::string name;
    std::string token_prefix;                   // required for new categories
    std::optional<bool> enabled;
    std::optional<bool> rehydrate;
};

/// [[patterns]]: appended after the built-in rules
struct PatternConfig {
    std::string category;
    std::string kind = "field_name";            // field_name | value_regex | type_tag
    std::vector<std::string> match;
    std::string regex;
    int priority = 50;
    bool ambiguous = false;
    bool partial_confident = false;
    bool embedded = false;
    bool case_insensitive = false;
    size_t capture_group = 0;
};

struct AuditConfig {
    bool enabled = false;
    std::string file = "pipeshield-audit.jsonl";
    size_t max_file_size_mb = 100;
    int max_files = 10;
};

struct LoggingConfig {
    std::string level = "info";
};

struct AiConfig {
    std::string provider = "openai";
    std::string endpoint = "https://api.openai.com";
    std::string api_key;
    std::string model = "gpt-4";
    double temperature = 0.3;
    int max_tokens = 2048;
    uint32_t timeout_ms = 30000;
    uint32_t max_retries = 2;
};

struct PipeshieldConfig {
    EngineConfig engine;
    std::vector<CategoryConfig> categories;
    std::vector<PatternConfig> patterns;
    AuditConfig audit;
    LoggingConfig logging;
    AiConfig ai;
};

} // namespace pipeshield
