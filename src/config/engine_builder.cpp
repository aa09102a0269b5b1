#include "config/engine_builder.hpp"
#include "audit/audit_recorder.hpp"
#include "audit/file_sink.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "security/salt_source.hpp"

#include <algorithm>
#include <format>

namespace pipeshield {

namespace {

MatchKind parse_kind(const std::string& kind) {
    if (kind == "field_name") return MatchKind::FIELD_NAME;
    if (kind == "value_regex") return MatchKind::VALUE_REGEX;
    if (kind == "type_tag") return MatchKind::TYPE_TAG;
    throw ConfigError(std::format("Unknown pattern kind '{}'", kind));
}

} // anonymous namespace

PatternRegistry build_registry(const PipeshieldConfig& config) {
    auto categories = PatternRegistry::default_categories();

    for (const auto& override_cfg : config.categories) {
        auto it = std::find_if(categories.begin(), categories.end(),
                               [&](const CategoryDef& c) { return c.name == override_cfg.name; });
        if (it == categories.end()) {
            categories.push_back({override_cfg.name, override_cfg.token_prefix, true, true});
            it = categories.end() - 1;
        }
        if (override_cfg.enabled) it->enabled = *override_cfg.enabled;
        if (override_cfg.rehydrate) it->rehydrate = *override_cfg.rehydrate;

        if (!it->enabled) {
            utils::log::warn(std::format("Category '{}' disabled by configuration", it->name));
        }
    }

    auto patterns = PatternRegistry::default_patterns();
    for (const auto& p : config.patterns) {
        SensitivePattern pattern;
        pattern.category = p.category;
        pattern.kind = parse_kind(p.kind);
        pattern.names = p.match;
        pattern.regex = p.regex;
        pattern.priority = p.priority;
        pattern.confidence = p.ambiguous ? Confidence::AMBIGUOUS : Confidence::CONFIDENT;
        pattern.partial_confident = p.partial_confident;
        pattern.embedded = p.embedded;
        pattern.case_insensitive = p.case_insensitive;
        pattern.capture_group = p.capture_group;
        patterns.push_back(std::move(pattern));
    }

    return PatternRegistry(std::move(categories), std::move(patterns));
}

std::unique_ptr<ISaltSource> make_salt_source(const EngineConfig& config) {
    if (!config.salt_file.empty()) {
        return std::make_unique<FileSaltSource>(config.salt_file);
    }
    if (!config.salt.empty()) {
        utils::log::warn("Salt is configured inline; prefer salt_env or salt_file");
        return std::make_unique<StaticSaltSource>(config.salt);
    }
    return std::make_unique<EnvSaltSource>(config.salt_env);
}

EngineSettings engine_settings(const EngineConfig& config) {
    EngineSettings settings;
    settings.digest_width = config.digest_width;
    settings.anonymizer.strict_mode = config.strict_mode;
    settings.anonymizer.max_depth = config.max_depth;
    settings.anonymizer.max_nodes = config.max_nodes;
    settings.anonymizer.min_propagation_length = config.min_propagation_length;
    return settings;
}

std::shared_ptr<const Engine> build_engine(const PipeshieldConfig& config) {
    const auto salt_source = make_salt_source(config.engine);
    utils::log::info(std::format("Loading salt from {}", salt_source->describe()));
    return Engine::create(*salt_source, build_registry(config), engine_settings(config.engine));
}

std::shared_ptr<AuditRecorder> build_audit_recorder(const AuditConfig& config) {
    if (!config.enabled) return nullptr;

    FileSink::Config sink_config;
    sink_config.output_file = config.file;
    sink_config.max_file_size_bytes = config.max_file_size_mb * 1024 * 1024;
    sink_config.max_files = config.max_files;

    try {
        return std::make_shared<AuditRecorder>(std::make_unique<FileSink>(sink_config));
    } catch (const std::runtime_error& e) {
        throw ConfigError(std::format("Cannot enable audit mode: {}", e.what()));
    }
}

} // namespace pipeshield
