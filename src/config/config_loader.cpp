#include "config/config_loader.hpp"
#include "classifier/pattern_registry.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "security/hasher.hpp"

#include <toml.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <regex>
#include <stdexcept>
#include <string_view>
#include <unordered_set>
#include <vector>

using namespace std::string_literals;

namespace pipeshield {

namespace {

namespace fs = std::filesystem;

constexpr size_t kMaxIncludeDepth = 8;

// ---- Scalar helpers --------------------------------------------------------

/// A string or an array of strings under `key`; anything else reads as empty
std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    } else if (const auto* s = tbl[key].as_string()) {
        result.emplace_back(s->get());
    }
    return result;
}

size_t toml_size(const toml::table& tbl, const std::string_view key, int64_t fallback) {
    const int64_t v = tbl[key].value_or(fallback);
    return v < 0 ? 0 : static_cast<size_t>(v);
}

// ---- ${VAR} substitution ---------------------------------------------------

/// "${NAME}" becomes the value of NAME, or nothing when NAME is unset
std::string expand_env(std::string_view text) {
    std::string out;
    size_t pos = 0;
    for (size_t open = text.find("${"); open != std::string_view::npos; open = text.find("${", pos)) {
        const size_t close = text.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw ConfigError(std::format("Unterminated '${{' in \"{}\"", text));
        }
        out.append(text.substr(pos, open - pos));
        const std::string name(text.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(name.c_str())) out += value;
        pos = close + 1;
    }
    out.append(text.substr(pos));
    return out;
}

void expand_env_in(toml::node& node) {
    if (auto* s = node.as_string()) {
        if (s->get().find("${") != std::string::npos) {
            *s = expand_env(s->get());
        }
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) expand_env_in(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) expand_env_in(child);
    }
}

// ---- include = [...] -------------------------------------------------------

/// Lay `top` over `base`: tables merge, arrays append, anything else is replaced
void layer(toml::table& base, const toml::table& top) {
    for (const auto& [key, node] : top) {
        toml::node* below = base.get(key.str());
        if (below && below->is_table() && node.is_table()) {
            layer(*below->as_table(), *node.as_table());
        } else if (below && below->is_array() && node.is_array()) {
            for (const auto& elem : *node.as_array()) below->as_array()->push_back(elem);
        } else {
            base.insert_or_assign(key, node);
        }
    }
}

/**
 * Replaces each document's `include` key with the listed files, resolved
 * against the including file's directory. Includes are layered in order
 * and the including document is layered last. A file may appear more than
 * once in the tree but never inside its own include chain.
 */
class IncludeResolver {
public:
    explicit IncludeResolver(const std::string& root_file) {
        chain_.push_back(fs::canonical(root_file));
    }

    void resolve(toml::table& doc) {
        const auto targets = toml_string_array(doc, "include");
        doc.erase("include");
        if (targets.empty()) return;

        if (chain_.size() > kMaxIncludeDepth) {
            throw ConfigError(std::format("Includes nest deeper than {} files below {}",
                kMaxIncludeDepth, chain_.front().string()));
        }

        const auto dir = chain_.back().parent_path();
        toml::table merged;
        for (const auto& target : targets) {
            const auto path = fs::canonical(dir / target);
            if (std::find(chain_.begin(), chain_.end(), path) != chain_.end()) {
                throw ConfigError(std::format("{} includes itself", path.string()));
            }

            auto included = toml::parse_file(path.string());
            chain_.push_back(path);
            resolve(included);
            chain_.pop_back();
            layer(merged, included);
        }
        layer(merged, doc);
        doc = std::move(merged);
    }

private:
    std::vector<fs::path> chain_;
};

toml::table read_file(const std::string& path) {
    auto doc = toml::parse_file(path);
    IncludeResolver(path).resolve(doc);
    expand_env_in(doc);
    return doc;
}

toml::table read_string(const std::string& content) {
    auto doc = toml::parse(content);
    expand_env_in(doc);
    return doc;
}

// ---- Section extractors ----------------------------------------------------

EngineConfig extract_engine(const toml::table& root) {
    EngineConfig cfg;
    const auto* engine = root["engine"].as_table();
    if (!engine) return cfg;
    const auto& e = *engine;

    cfg.salt_env = e["salt_env"].value_or("PIPESHIELD_SALT"s);
    cfg.salt_file = e["salt_file"].value_or(""s);
    cfg.salt = e["salt"].value_or(""s);
    cfg.digest_width = toml_size(e, "digest_width", 12);
    cfg.strict_mode = e["strict_mode"].value_or(false);
    cfg.max_depth = toml_size(e, "max_depth", 64);
    cfg.max_nodes = toml_size(e, "max_nodes", 100000);
    cfg.min_propagation_length = toml_size(e, "min_propagation_length", 4);
    return cfg;
}

std::vector<CategoryConfig> extract_categories(const toml::table& root) {
    std::vector<CategoryConfig> result;
    const auto* cats = root["categories"].as_table();
    if (!cats) return result;

    for (const auto& [name, node] : *cats) {
        const auto* tbl = node.as_table();
        if (!tbl) continue;

        CategoryConfig cfg;
        cfg.name = std::string(name.str());
        cfg.token_prefix = (*tbl)["prefix"].value_or(""s);
        cfg.enabled = (*tbl)["enabled"].value<bool>();
        cfg.rehydrate = (*tbl)["rehydrate"].value<bool>();
        result.push_back(std::move(cfg));
    }
    return result;
}

std::vector<PatternConfig> extract_patterns(const toml::table& root) {
    std::vector<PatternConfig> result;
    const auto* arr = root["patterns"].as_array();
    if (!arr) return result;

    for (const auto& elem : *arr) {
        const auto* tbl = elem.as_table();
        if (!tbl) continue;
        const auto& p = *tbl;

        PatternConfig cfg;
        cfg.category = p["category"].value_or(""s);
        cfg.kind = p["kind"].value_or("field_name"s);
        cfg.match = toml_string_array(p, "match");
        cfg.regex = p["regex"].value_or(""s);
        cfg.priority = static_cast<int>(p["priority"].value_or(int64_t{50}));
        cfg.ambiguous = p["ambiguous"].value_or(false);
        cfg.partial_confident = p["partial_confident"].value_or(false);
        cfg.embedded = p["embedded"].value_or(false);
        cfg.case_insensitive = p["case_insensitive"].value_or(false);
        cfg.capture_group = toml_size(p, "capture_group", 0);
        result.push_back(std::move(cfg));
    }
    return result;
}

AuditConfig extract_audit(const toml::table& root) {
    AuditConfig cfg;
    const auto* audit = root["audit"].as_table();
    if (!audit) return cfg;
    const auto& a = *audit;

    cfg.enabled = a["enabled"].value_or(false);
    cfg.file = a["file"].value_or("pipeshield-audit.jsonl"s);
    cfg.max_file_size_mb = toml_size(a, "max_file_size_mb", 100);
    cfg.max_files = static_cast<int>(a["max_files"].value_or(int64_t{10}));
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

AiConfig extract_ai(const toml::table& root) {
    AiConfig cfg;
    const auto* sec = root["ai"].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;

    cfg.provider = s["provider"].value_or("openai"s);
    cfg.endpoint = s["endpoint"].value_or(cfg.provider == "anthropic"
        ? "https://api.anthropic.com"s : "https://api.openai.com"s);
    cfg.api_key = s["api_key"].value_or(""s);
    cfg.model = s["model"].value_or("gpt-4"s);
    cfg.temperature = s["temperature"].value_or(0.3);
    cfg.max_tokens = static_cast<int>(s["max_tokens"].value_or(int64_t{2048}));
    cfg.timeout_ms = static_cast<uint32_t>(s["timeout_ms"].value_or(int64_t{30000}));
    cfg.max_retries = static_cast<uint32_t>(s["max_retries"].value_or(int64_t{2}));
    return cfg;
}

PipeshieldConfig extract_all_sections(const toml::table& tbl) {
    PipeshieldConfig config;
    config.engine = extract_engine(tbl);
    config.categories = extract_categories(tbl);
    config.patterns = extract_patterns(tbl);
    config.audit = extract_audit(tbl);
    config.logging = extract_logging(tbl);
    config.ai = extract_ai(tbl);
    return config;
}

bool valid_prefix(const std::string& prefix) {
    static const std::regex kPrefix("[A-Z][A-Z0-9]*");
    return std::regex_match(prefix, kPrefix);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(PipeshieldConfig config) {
    const auto errors = validate_config(config);
    if (errors.empty()) return LoadResult::ok(std::move(config));

    std::string message = std::format("Config validation failed ({} problem(s)):", errors.size());
    for (const auto& err : errors) message += std::format("\n  - {}", err);
    return LoadResult::error(std::move(message));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        return validate_and_return(extract_all_sections(read_file(config_path)));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config {}: {}", config_path, e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        return validate_and_return(extract_all_sections(read_string(toml_content)));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const PipeshieldConfig& config) {
    std::vector<std::string> errors;

    const auto& engine = config.engine;
    if (engine.digest_width < Hasher::kMinDigestWidth || engine.digest_width > Hasher::kMaxDigestWidth) {
        errors.push_back(std::format("engine.digest_width must be {}-{}, got {}",
            Hasher::kMinDigestWidth, Hasher::kMaxDigestWidth, engine.digest_width));
    }
    if (engine.max_depth == 0 || engine.max_depth > 1024) {
        errors.push_back(std::format("engine.max_depth must be 1-1024, got {}", engine.max_depth));
    }
    if (engine.max_nodes == 0) {
        errors.push_back("engine.max_nodes must be > 0");
    }
    if (engine.salt_file.empty() && engine.salt.empty() && engine.salt_env.empty()) {
        errors.push_back("engine: one of salt_env, salt_file or salt is required");
    }

    // Categories: built-ins plus the new ones declared here
    std::unordered_set<std::string> known;
    std::unordered_set<std::string> prefixes;
    for (const auto& cat : PatternRegistry::default_categories()) {
        known.insert(cat.name);
        prefixes.insert(cat.token_prefix);
    }
    for (const auto& cat : config.categories) {
        const bool builtin = known.contains(cat.name);
        if (!cat.token_prefix.empty()) {
            if (builtin) {
                errors.push_back(std::format(
                    "categories.{}: the prefix of a built-in category cannot be changed", cat.name));
            } else if (!valid_prefix(cat.token_prefix)) {
                errors.push_back(std::format(
                    "categories.{}.prefix must match [A-Z][A-Z0-9]*, got '{}'", cat.name, cat.token_prefix));
            } else if (!prefixes.insert(cat.token_prefix).second) {
                errors.push_back(std::format(
                    "categories.{}.prefix '{}' is already in use", cat.name, cat.token_prefix));
            }
        } else if (!builtin) {
            errors.push_back(std::format("categories.{}: new category requires a prefix", cat.name));
        }
        known.insert(cat.name);
    }

    for (size_t i = 0; i < config.patterns.size(); ++i) {
        const auto& p = config.patterns[i];
        if (!known.contains(p.category)) {
            errors.push_back(std::format("patterns[{}].category '{}' is unknown", i, p.category));
        }
        if (p.kind == "field_name" || p.kind == "type_tag") {
            if (p.match.empty()) {
                errors.push_back(std::format("patterns[{}].match must list at least one name", i));
            }
        } else if (p.kind == "value_regex") {
            if (p.regex.empty()) {
                errors.push_back(std::format("patterns[{}].regex must not be empty", i));
            } else {
                try {
                    const std::regex re(p.regex, std::regex::ECMAScript);
                    if (p.capture_group > re.mark_count()) {
                        errors.push_back(std::format(
                            "patterns[{}].capture_group {} exceeds the regex's {} group(s)",
                            i, p.capture_group, re.mark_count()));
                    }
                } catch (const std::regex_error& e) {
                    errors.push_back(std::format("patterns[{}].regex is invalid: {}", i, e.what()));
                }
            }
        } else {
            errors.push_back(std::format(
                "patterns[{}].kind must be field_name, value_regex or type_tag, got '{}'", i, p.kind));
        }
    }

    if (config.audit.enabled) {
        if (config.audit.file.empty()) {
            errors.push_back("audit.file required when audit is enabled");
        }
        if (config.audit.max_files <= 0) {
            errors.push_back("audit.max_files must be > 0");
        }
    }

    const auto level = utils::to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warn" && level != "warning" && level != "error") {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    if (config.ai.provider != "openai" && config.ai.provider != "anthropic") {
        errors.push_back(std::format("ai.provider must be openai or anthropic, got '{}'", config.ai.provider));
    }
    if (config.ai.max_tokens <= 0) {
        errors.push_back("ai.max_tokens must be > 0");
    }

    return errors;
}

} // namespace pipeshield
