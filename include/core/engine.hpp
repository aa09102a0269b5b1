#pragma once

#include "anonymizer/anonymization_context.hpp"
#include "anonymizer/anonymizer.hpp"
#include "anonymizer/rehydrator.hpp"
#include "anonymizer/token_format.hpp"
#include "classifier/pattern_registry.hpp"
#include "security/hasher.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pipeshield {

class ISaltSource;

struct EngineSettings {
    size_t digest_width = 12;
    AnonymizerOptions anonymizer;
};

/**
 * @brief Process-wide, immutable anonymization state
 *
 * Bundles the salt-keyed hasher, the pattern registry and the walkers built
 * on them. Created once at startup and shared as shared_ptr<const Engine>
 * by every round trip; nothing in it changes afterwards, so concurrent
 * round trips read it without locking.
 */
class Engine {
    struct Private {
        explicit Private() = default;
    };

public:
    /**
     * @throws ConfigError on a short salt, bad digest width or zero limits
     */
    [[nodiscard]] static std::shared_ptr<const Engine> create(
        std::vector<uint8_t> salt,
        PatternRegistry registry,
        EngineSettings settings = {});

    /**
     * @brief Same, reading the salt from a source
     * @throws ConfigError if the source yields no salt
     */
    [[nodiscard]] static std::shared_ptr<const Engine> create(
        const ISaltSource& salt_source,
        PatternRegistry registry,
        EngineSettings settings = {});

    /// Only reachable through create()
    Engine(Private, std::vector<uint8_t> salt, PatternRegistry registry, EngineSettings settings);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    [[nodiscard]] std::unique_ptr<AnonymizationContext> new_context(
        std::string id = utils::generate_uuid()) const;

    [[nodiscard]] const PatternRegistry& registry() const { return registry_; }
    [[nodiscard]] const Hasher& hasher() const { return hasher_; }
    [[nodiscard]] const TokenFormat& tokens() const { return tokens_; }
    [[nodiscard]] const Anonymizer& anonymizer() const { return anonymizer_; }
    [[nodiscard]] const Rehydrator& rehydrator() const { return rehydrator_; }
    [[nodiscard]] const EngineSettings& settings() const { return settings_; }

private:
    // Declaration order matters: later members refer to earlier ones
    EngineSettings settings_;
    PatternRegistry registry_;
    Hasher hasher_;
    TokenFormat tokens_;
    Anonymizer anonymizer_;
    Rehydrator rehydrator_;
};

} // namespace pipeshield
