#include "core/engine.hpp"
#include "core/error.hpp"
#include "security/salt_source.hpp"

#include <format>

namespace pipeshield {

namespace {

void validate(const EngineSettings& settings) {
    if (settings.anonymizer.max_depth == 0) {
        throw ConfigError("max_depth must be at least 1");
    }
    if (settings.anonymizer.max_nodes == 0) {
        throw ConfigError("max_nodes must be at least 1");
    }
}

} // anonymous namespace

Engine::Engine(Private, std::vector<uint8_t> salt, PatternRegistry registry, EngineSettings settings)
    : settings_(settings),
      registry_(std::move(registry)),
      hasher_(std::move(salt), settings_.digest_width),
      tokens_(registry_, settings_.digest_width),
      anonymizer_(registry_, tokens_, settings_.anonymizer),
      rehydrator_(registry_, tokens_) {}

std::shared_ptr<const Engine> Engine::create(std::vector<uint8_t> salt,
                                             PatternRegistry registry,
                                             EngineSettings settings) {
    validate(settings);
    std::shared_ptr<const Engine> engine =
        std::make_shared<Engine>(Private{}, std::move(salt), std::move(registry), settings);

    utils::log::info(std::format(
        "Engine ready: {} categories, {} patterns, digest width {}, {} mode",
        engine->registry().categories().size(),
        engine->registry().pattern_count(),
        settings.digest_width,
        settings.anonymizer.strict_mode ? "strict" : "permissive"));
    return engine;
}

std::shared_ptr<const Engine> Engine::create(const ISaltSource& salt_source,
                                             PatternRegistry registry,
                                             EngineSettings settings) {
    auto salt = salt_source.load();
    if (!salt) {
        throw ConfigError(std::format("No salt available from {}", salt_source.describe()));
    }
    return create(std::move(*salt), std::move(registry), settings);
}

std::unique_ptr<AnonymizationContext> Engine::new_context(std::string id) const {
    return std::make_unique<AnonymizationContext>(hasher_, std::move(id));
}

} // namespace pipeshield
