#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace pipeshield {

/**
 * @brief Typed configuration from TOML (toml++)
 *
 * Before extraction, `include = "other.toml"` (or an array of paths)
 * merges other files (the including file wins on conflicts, arrays of
 * tables concatenate) and ${VAR} references in strings are expanded from
 * the environment. Validation errors are collected and reported together.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        PipeshieldConfig config;

        static LoadResult ok(PipeshieldConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every problem found, empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const PipeshieldConfig& config);

private:
    static LoadResult validate_and_return(PipeshieldConfig config);
};

} // namespace pipeshield
