#include "classifier/pattern_registry.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <numeric>

namespace pipeshield {

namespace {

SensitivePattern field_rule(std::string category,
                            std::vector<std::string> names,
                            int priority,
                            Confidence confidence = Confidence::CONFIDENT,
                            bool partial_confident = false) {
    SensitivePattern p;
    p.category = std::move(category);
    p.kind = MatchKind::FIELD_NAME;
    p.names = std::move(names);
    p.priority = priority;
    p.confidence = confidence;
    p.partial_confident = partial_confident;
    return p;
}

SensitivePattern value_rule(std::string category,
                            std::string regex,
                            int priority,
                            bool embedded,
                            size_t capture_group = 0,
                            bool case_insensitive = false,
                            Confidence confidence = Confidence::CONFIDENT) {
    SensitivePattern p;
    p.category = std::move(category);
    p.kind = MatchKind::VALUE_REGEX;
    p.regex = std::move(regex);
    p.priority = priority;
    p.embedded = embedded;
    p.capture_group = capture_group;
    p.case_insensitive = case_insensitive;
    p.confidence = confidence;
    return p;
}

/// Key words contain the rule words as a contiguous run
bool contains_run(const std::vector<std::string>& key_words,
                  const std::vector<std::string>& rule_words) {
    if (rule_words.empty() || rule_words.size() > key_words.size()) return false;
    const auto it = std::search(key_words.begin(), key_words.end(),
                                rule_words.begin(), rule_words.end());
    return it != key_words.end();
}

constexpr std::string_view kArmorBegin = "-----BEGIN ";
constexpr std::string_view kArmorDashes = "-----";
constexpr std::string_view kPrivateKeyLabel = "PRIVATE KEY";
constexpr int kKeyBlockPriority = 100;

bool valid_prefix(std::string_view prefix) {
    if (prefix.empty() || !std::isupper(static_cast<unsigned char>(prefix[0]))) return false;
    return std::all_of(prefix.begin(), prefix.end(), [](char c) {
        const auto uc = static_cast<unsigned char>(c);
        return std::isupper(uc) || std::isdigit(uc);
    });
}

} // anonymous namespace

// ============================================================================
// Built-in Table
// ============================================================================

std::vector<CategoryDef> PatternRegistry::default_categories() {
    return {
        {"pipeline",       "PIPELINE",  true, true},
        {"branch",         "BRANCH",    true, true},
        {"repository",     "REPO",      true, true},
        {"organization",   "ORG",       true, true},
        {"folder",         "FOLDER",    true, true},
        {"cluster",        "CLUSTER",   true, true},
        {"application",    "APP",       true, true},
        {"namespace",      "NAMESPACE", true, true},
        {"environment",    "ENV",       true, true},
        {"team",           "TEAM",      true, true},
        {"user",           "USER",      true, true},
        {"email",          "EMAIL",     true, true},
        {"host",           "HOST",      true, true},
        {"url",            "URL",       true, true},
        {"ip_address",     "IP",        true, true},
        {"file_path",      "PATH",      true, true},
        {"credential",     "SECRET",    true, false},
        {"commit",         "COMMIT",    true, true},
        {"cloud_account",  "ACCOUNT",   true, true},
        {"registry_image", "IMAGE",     true, true},
    };
}

std::vector<SensitivePattern> PatternRegistry::default_patterns() {
    std::vector<SensitivePattern> p;

    // ---- Field names -------------------------------------------------------
    // Credentials first: a key such as "api_token_url" must never be
    // downgraded to a less protective category. Credential and email names
    // stay confident inside longer keys ("db_password", "JENKINS_API_TOKEN").
    p.push_back(field_rule("credential", {
        "password", "passwd", "pwd", "secret", "token", "api_key", "apikey",
        "access_key", "secret_key", "private_key", "client_secret",
        "credentials", "credential_id", "authorization", "auth_token"}, 100,
        Confidence::CONFIDENT, true));
    p.push_back(field_rule("email", {
        "email", "mail", "author_email", "committer_email", "email_address"}, 90,
        Confidence::CONFIDENT, true));
    p.push_back(field_rule("pipeline", {
        "pipeline", "pipeline_name", "job", "job_name", "full_name",
        "full_display_name", "project_name"}, 50));
    p.push_back(field_rule("branch", {
        "branch", "branch_name", "git_branch", "ref", "source_branch",
        "target_branch"}, 50));
    p.push_back(field_rule("repository", {
        "repo", "repository", "repo_name", "repo_url", "repository_url",
        "git_url", "scm_url", "remote_url"}, 50));
    p.push_back(field_rule("organization", {
        "org", "organization", "org_name", "owner", "company", "tenant"}, 50));
    p.push_back(field_rule("folder", {
        "folder", "folder_name", "parent_folder", "directory"}, 50));
    p.push_back(field_rule("cluster", {
        "cluster", "cluster_name", "eks_cluster", "gke_cluster",
        "aks_cluster", "kube_context"}, 50));
    p.push_back(field_rule("application", {
        "app", "app_name", "application", "service", "service_name"}, 50));
    p.push_back(field_rule("namespace", {
        "namespace", "k8s_namespace", "kube_namespace"}, 50));
    p.push_back(field_rule("environment", {
        "environment", "env", "deploy_env", "target_env"}, 50));
    p.push_back(field_rule("team", {
        "team", "team_name", "group_name", "squad"}, 50));
    p.push_back(field_rule("user", {
        "user", "username", "user_name", "user_id", "author", "committer",
        "triggered_by", "culprits", "approver"}, 50));
    p.push_back(field_rule("host", {
        "host", "hostname", "node", "node_name", "agent", "built_on",
        "executor_host"}, 50));
    p.push_back(field_rule("url", {
        "url", "build_url", "console_url", "webhook_url", "href", "link"}, 50));
    p.push_back(field_rule("ip_address", {
        "ip", "ip_address", "remote_addr", "client_ip"}, 50));
    p.push_back(field_rule("file_path", {
        "path", "file", "file_path", "filename", "workspace", "script_path",
        "jenkinsfile"}, 50));
    p.push_back(field_rule("commit", {
        "commit", "commit_id", "sha", "git_commit", "revision"}, 50));
    p.push_back(field_rule("cloud_account", {
        "account", "account_id", "aws_account", "subscription_id", "project_id"}, 50));
    p.push_back(field_rule("registry_image", {
        "image", "docker_image", "container_image"}, 50));
    // Generic "name" keys usually hold job or stage names
    p.push_back(field_rule("pipeline", {"name", "display_name"}, 10, Confidence::AMBIGUOUS));

    // ---- Credential shapes -------------------------------------------------
    p.push_back(value_rule("credential", R"(gh[pousr]_[A-Za-z0-9]{36,255})", 95, true));
    p.push_back(value_rule("credential", R"(glpat-[A-Za-z0-9_\-]{20,})", 95, true));
    p.push_back(value_rule("credential", R"((?:AKIA|ASIA)[0-9A-Z]{16})", 95, true));
    p.push_back(value_rule("credential", R"(xox[abprs]-[A-Za-z0-9\-]{10,})", 95, true));
    p.push_back(value_rule("credential",
        R"(eyJ[A-Za-z0-9_\-]{5,}\.eyJ[A-Za-z0-9_\-]{5,}\.[A-Za-z0-9_\-]+)", 95, true));
    p.push_back(value_rule("credential",
        R"(-----BEGIN [A-Z ]*PRIVATE KEY-----[\s\S]*?-----END [A-Z ]*PRIVATE KEY-----)", 95, true));
    p.push_back(value_rule("credential", R"(bearer\s+([A-Za-z0-9._~+/\-]{10,}=*))", 95, true, 1, true));

    // ---- key=value assignments in free text --------------------------------
    p.push_back(value_rule("credential",
        R"(\b(?:password|passwd|pwd|secret|token|api[_\-]?key|access[_\-]?key|secret[_\-]?key|private[_\-]?key|client[_\-]?secret|auth[_\-]?token)\s*[:=]\s*["']?([^"'\s,;&]{3,}))",
        90, true, 1, true));

    // ---- Addresses ---------------------------------------------------------
    p.push_back(value_rule("repository",
        R"([A-Za-z0-9._\-]+@[A-Za-z0-9.\-]+:[A-Za-z0-9._~/\-]+)", 82, true));
    p.push_back(value_rule("email",
        R"([A-Za-z0-9._%+\-]+@[A-Za-z0-9.\-]+\.[A-Za-z]{2,})", 80, true));
    p.push_back(value_rule("url",
        R"((?:https?|ssh|git|ftp)://[^\s<>"'{}|\\^`\[\]]+)", 70, true, 0, true));
    p.push_back(value_rule("ip_address",
        R"(\b(?:(?:25[0-5]|2[0-4]\d|1?\d?\d)\.){3}(?:25[0-5]|2[0-4]\d|1?\d?\d)\b)", 70, true));

    // ---- Identifying names written as key=value ----------------------------
    p.push_back(value_rule("pipeline",
        R"(\b(?:pipeline|job|build)[_\-]?name\s*[:=]\s*["']?([A-Za-z0-9._/\-]{3,}))", 65, true, 1, true));
    p.push_back(value_rule("cluster",
        R"(\b(?:cluster|eks|gke|aks)[_\-]?name\s*[:=]\s*["']?([A-Za-z0-9._\-]{3,}))", 65, true, 1, true));
    p.push_back(value_rule("repository",
        R"(\b(?:project|repo|repository)[_\-]?name\s*[:=]\s*["']?([A-Za-z0-9._/\-]{3,}))", 65, true, 1, true));
    p.push_back(value_rule("application",
        R"(\b(?:service|svc|app)[_\-]?name\s*[:=]\s*["']?([A-Za-z0-9._\-]{3,}))", 65, true, 1, true));
    p.push_back(value_rule("namespace",
        R"(\b(?:namespace|ns)\s*[:=]\s*["']?([A-Za-z0-9._\-]{3,}))", 65, true, 1, true));
    p.push_back(value_rule("user",
        R"(\b(?:user|username|user[_\-]name)\s*[:=]\s*["']?([A-Za-z0-9._\-]{3,}))", 65, true, 1, true));
    p.push_back(value_rule("team",
        R"(\b(?:team|group)[_\-]?name\s*[:=]\s*["']?([A-Za-z0-9._\-]{3,}))", 65, true, 1, true));
    p.push_back(value_rule("organization",
        R"(\b(?:company|org|organization)[_\-]?name\s*[:=]\s*["']?([A-Za-z0-9._\-]{3,}))", 65, true, 1, true));
    p.push_back(value_rule("branch",
        R"(\b(?:branch|git[_\-]?branch)\s*[:=]\s*["']?([A-Za-z0-9._/\-]{2,}))", 65, true, 1, true));
    p.push_back(value_rule("environment",
        R"(\b(?:env|environment)\s*[:=]\s*["']?(prod|production|staging|stage|dev|development|test|qa|uat)\b)",
        65, true, 1, true));

    // ---- Whole-value shapes ------------------------------------------------
    p.push_back(value_rule("commit", R"([0-9a-f]{40})", 60, false));
    p.push_back(value_rule("registry_image",
        R"([a-z0-9.\-]+(?::[0-9]+)?/[a-z0-9._/\-]+:[A-Za-z0-9._\-]+)", 55, false));
    p.push_back(value_rule("credential", R"([0-9a-fA-F]{32,})", 50, false));
    p.push_back(value_rule("branch",
        R"((?:feature|feat|bugfix|fix|hotfix|release|releases|support|develop)/[A-Za-z0-9._/\-]+)", 45, false));
    p.push_back(value_rule("file_path", R"((?:~|\.{1,2})?/(?:[^/\s]+/)+[^/\s]*)", 40, false));
    p.push_back(value_rule("file_path", R"([A-Za-z]:\\(?:[^\\\s]+\\)+[^\\\s]*)", 40, false));
    p.push_back(value_rule("file_path",
        R"([A-Za-z0-9._\-]+/(?:[A-Za-z0-9._\-]+/)+[A-Za-z0-9._\-]+)", 40, false));

    // ---- Naming heuristics (ambiguous) -------------------------------------
    const auto heuristic = [&p](const char* category, const char* regex) {
        p.push_back(value_rule(category, regex, 10, false, 0, true, Confidence::AMBIGUOUS));
    };
    heuristic("cluster",      R"((?:cluster|eks|gke|aks|k8s|kube)[\-_][A-Za-z0-9\-_]{2,})");
    heuristic("environment",  R"((?:prod|production|staging|stage|dev|development|qa|uat)(?:[\-_][A-Za-z0-9]+)*)");
    heuristic("team",         R"((?:team|group|squad)[\-_][A-Za-z0-9\-_]{2,})");
    heuristic("organization", R"((?:org|organization|company|corp)[\-_][A-Za-z0-9\-_]{2,})");
    heuristic("repository",   R"((?:repo|repository)[\-_][A-Za-z0-9\-_]{2,})");
    heuristic("application",  R"((?:svc|service|app|application)[\-_][A-Za-z0-9\-_]{2,})");
    heuristic("folder",       R"((?:folder|dir|directory)[\-_][A-Za-z0-9\-_]{2,})");
    heuristic("pipeline",     R"([A-Za-z0-9]+(?:[\-_][A-Za-z0-9]+)*[\-_](?:deploy|build|pipeline|ci|cd|release))");

    return p;
}

PatternRegistry PatternRegistry::with_defaults() {
    return PatternRegistry(default_categories(), default_patterns());
}

// ============================================================================
// Construction
// ============================================================================

PatternRegistry::PatternRegistry(std::vector<CategoryDef> categories,
                                 std::vector<SensitivePattern> patterns)
    : categories_(std::move(categories)) {

    for (size_t i = 0; i < categories_.size(); ++i) {
        const auto& cat = categories_[i];
        if (cat.name.empty()) {
            throw ConfigError("Category with empty name");
        }
        if (!valid_prefix(cat.token_prefix)) {
            throw ConfigError(std::format(
                "Category '{}': token prefix '{}' must match [A-Z][A-Z0-9]*",
                cat.name, cat.token_prefix));
        }
        if (!category_index_.emplace(cat.name, i).second) {
            throw ConfigError(std::format("Duplicate category '{}'", cat.name));
        }
        if (!prefix_index_.emplace(cat.token_prefix, i).second) {
            throw ConfigError(std::format("Duplicate token prefix '{}'", cat.token_prefix));
        }
    }

    // Every category is also a type tag
    for (const auto& cat : categories_) {
        SensitivePattern tag;
        tag.category = cat.name;
        tag.kind = MatchKind::TYPE_TAG;
        tag.names = {cat.name};
        tag.priority = 100;
        patterns.push_back(std::move(tag));
    }

    rules_.reserve(patterns.size());
    for (auto& pattern : patterns) {
        if (!category_index_.contains(pattern.category)) {
            throw ConfigError(std::format("Pattern refers to unknown category '{}'", pattern.category));
        }

        Rule rule;
        rule.order = rules_.size();

        switch (pattern.kind) {
            case MatchKind::FIELD_NAME:
            case MatchKind::TYPE_TAG:
                if (pattern.names.empty()) {
                    throw ConfigError(std::format(
                        "{} pattern for '{}' lists no names",
                        match_kind_to_string(pattern.kind), pattern.category));
                }
                for (const auto& name : pattern.names) {
                    rule.normalized_names.push_back(utils::normalize_identifier(name));
                    rule.name_words.push_back(utils::identifier_words(name));
                }
                break;

            case MatchKind::VALUE_REGEX:
                try {
                    auto flags = std::regex::ECMAScript | std::regex::optimize;
                    if (pattern.case_insensitive) flags |= std::regex::icase;
                    rule.re.emplace(pattern.regex, flags);
                } catch (const std::regex_error& e) {
                    throw ConfigError(std::format(
                        "Invalid regex for category '{}': {} ({})", pattern.category, pattern.regex, e.what()));
                }
                if (pattern.capture_group > rule.re->mark_count()) {
                    throw ConfigError(std::format(
                        "Regex for category '{}' has no capture group {}", pattern.category, pattern.capture_group));
                }
                break;
        }

        rule.pattern = std::move(pattern);
        rules_.push_back(std::move(rule));

        const size_t idx = rules_.size() - 1;
        switch (rules_[idx].pattern.kind) {
            case MatchKind::FIELD_NAME:  field_rules_.push_back(idx); break;
            case MatchKind::TYPE_TAG:    tag_rules_.push_back(idx); break;
            case MatchKind::VALUE_REGEX:
                value_rules_.push_back(idx);
                if (rules_[idx].pattern.embedded) embedded_rules_.push_back(idx);
                break;
        }
    }
}

// ============================================================================
// Lookup
// ============================================================================

const CategoryDef* PatternRegistry::category(std::string_view name) const {
    const auto it = category_index_.find(std::string(name));
    return it != category_index_.end() ? &categories_[it->second] : nullptr;
}

const CategoryDef* PatternRegistry::category_by_prefix(std::string_view prefix) const {
    const auto it = prefix_index_.find(std::string(prefix));
    return it != prefix_index_.end() ? &categories_[it->second] : nullptr;
}

bool PatternRegistry::enabled(const std::string& category) const {
    const auto* cat = this->category(category);
    return cat && cat->enabled;
}

std::optional<Classification> PatternRegistry::pick(const std::vector<Candidate>& candidates) {
    const Candidate* best = nullptr;
    for (const auto& c : candidates) {
        if (!best) {
            best = &c;
            continue;
        }
        if (c.confidence != best->confidence) {
            if (c.confidence == Confidence::CONFIDENT) best = &c;
            continue;
        }
        if (c.rule->pattern.priority > best->rule->pattern.priority ||
            (c.rule->pattern.priority == best->rule->pattern.priority &&
             c.rule->order < best->rule->order)) {
            best = &c;
        }
    }
    if (!best) return std::nullopt;
    return Classification{best->rule->pattern.category, best->confidence, best->rule->pattern.priority};
}

// ============================================================================
// Classification
// ============================================================================

std::optional<Classification> PatternRegistry::classify_field(std::string_view field_name) const {
    if (field_name.empty()) return std::nullopt;

    const auto normalized = utils::normalize_identifier(field_name);
    const auto key_words = utils::identifier_words(field_name);

    std::vector<Candidate> candidates;
    for (const size_t idx : field_rules_) {
        const auto& rule = rules_[idx];
        if (!enabled(rule.pattern.category)) continue;

        bool exact = false;
        bool partial = false;
        for (size_t i = 0; i < rule.normalized_names.size(); ++i) {
            if (rule.normalized_names[i] == normalized) {
                exact = true;
                break;
            }
            if (contains_run(key_words, rule.name_words[i])) {
                partial = true;
            }
        }

        if (exact) {
            candidates.push_back({&rule, rule.pattern.confidence});
        } else if (partial) {
            candidates.push_back({&rule, rule.pattern.partial_confident ? rule.pattern.confidence
                                                                        : Confidence::AMBIGUOUS});
        }
    }
    return pick(candidates);
}

std::optional<Classification> PatternRegistry::classify_value(
    std::string_view text, std::string_view tag) const {

    std::vector<Candidate> candidates;

    if (!tag.empty()) {
        const auto normalized_tag = utils::normalize_identifier(tag);
        for (const size_t idx : tag_rules_) {
            const auto& rule = rules_[idx];
            if (!enabled(rule.pattern.category)) continue;
            if (std::find(rule.normalized_names.begin(), rule.normalized_names.end(),
                          normalized_tag) != rule.normalized_names.end()) {
                candidates.push_back({&rule, rule.pattern.confidence});
            }
        }
    }

    if (!text.empty() && text.size() <= kMaxRegexInput) {
        for (const size_t idx : value_rules_) {
            const auto& rule = rules_[idx];
            if (!enabled(rule.pattern.category)) continue;
            if (std::regex_match(text.begin(), text.end(), *rule.re)) {
                candidates.push_back({&rule, rule.pattern.confidence});
            }
        }
    }

    return pick(candidates);
}

std::optional<Classification> PatternRegistry::classify(
    std::string_view field_name, const Value& value) const {

    if (auto by_field = classify_field(field_name)) {
        return by_field;
    }
    if (value.is_string()) {
        return classify_value(value.as_string(), value.tag());
    }
    return std::nullopt;
}

// ============================================================================
// Embedded Scanning
// ============================================================================

void PatternRegistry::scan_chunk(std::string_view chunk, size_t base_offset,
                                 std::vector<EmbeddedMatch>& out,
                                 std::vector<size_t>& orders) const {
    for (const size_t idx : embedded_rules_) {
        const auto& rule = rules_[idx];
        if (!enabled(rule.pattern.category)) continue;

        using Iter = std::string_view::const_iterator;
        std::regex_iterator<Iter> it(chunk.begin(), chunk.end(), *rule.re);
        const std::regex_iterator<Iter> end;
        for (; it != end; ++it) {
            const auto& m = *it;
            const auto group = rule.pattern.capture_group;
            if (!m[group].matched || m[group].length() == 0) continue;

            EmbeddedMatch match;
            match.offset = base_offset + static_cast<size_t>(m.position(group));
            match.length = static_cast<size_t>(m.length(group));
            match.category = rule.pattern.category;
            match.priority = rule.pattern.priority;
            match.confidence = rule.pattern.confidence;
            out.push_back(std::move(match));
            orders.push_back(rule.order);
        }
    }
}

void PatternRegistry::scan_range(std::string_view text, size_t from, size_t to,
                                 std::vector<EmbeddedMatch>& out,
                                 std::vector<size_t>& orders) const {
    // Bounded chunks cut at whitespace so regex evaluation stays shallow
    size_t pos = from;
    while (pos < to) {
        size_t len = std::min(kMaxRegexInput, to - pos);
        if (pos + len < to) {
            const auto cut = text.substr(pos, len).find_last_of(" \t\n\r");
            if (cut != std::string_view::npos && cut > 0) len = cut + 1;
        }
        scan_chunk(text.substr(pos, len), pos, out, orders);
        pos += len;
    }
}

std::vector<EmbeddedMatch> PatternRegistry::find_key_blocks(std::string_view text) const {
    std::vector<EmbeddedMatch> blocks;
    if (!enabled(std::string(kKeyBlockCategory))) return blocks;

    size_t pos = 0;
    size_t begin = 0;
    while ((begin = text.find(kArmorBegin, pos)) != std::string_view::npos) {
        const size_t label_start = begin + kArmorBegin.size();
        const size_t label_end = text.find(kArmorDashes, label_start);
        if (label_end == std::string_view::npos) break;

        const auto label = text.substr(label_start, label_end - label_start);
        if (label.find(kPrivateKeyLabel) == std::string_view::npos ||
            label.find_first_of("\r\n") != std::string_view::npos) {
            pos = label_start;
            continue;
        }

        const auto end_line = std::format("-----END {}-----", label);
        const size_t end_at = text.find(end_line, label_end + kArmorDashes.size());
        const size_t end = end_at == std::string_view::npos ? text.size() : end_at + end_line.size();

        EmbeddedMatch match;
        match.offset = begin;
        match.length = end - begin;
        match.category = std::string(kKeyBlockCategory);
        match.priority = kKeyBlockPriority;
        match.confidence = Confidence::CONFIDENT;
        blocks.push_back(std::move(match));
        pos = end;
    }
    return blocks;
}

std::vector<EmbeddedMatch> PatternRegistry::scan_embedded(std::string_view text) const {
    std::vector<EmbeddedMatch> found;
    std::vector<size_t> orders;
    if (text.empty()) return found;

    // Key blocks can outgrow a chunk; regexes only see the text between them
    size_t pos = 0;
    for (auto& block : find_key_blocks(text)) {
        scan_range(text, pos, block.offset, found, orders);
        pos = block.offset + block.length;
        found.push_back(std::move(block));
        orders.push_back(0);
    }
    scan_range(text, pos, text.size(), found, orders);

    // Highest priority first, then earliest start, then declaration order
    std::vector<size_t> index(found.size());
    std::iota(index.begin(), index.end(), 0);
    std::sort(index.begin(), index.end(), [&](size_t a, size_t b) {
        if (found[a].priority != found[b].priority) return found[a].priority > found[b].priority;
        if (found[a].offset != found[b].offset) return found[a].offset < found[b].offset;
        if (found[a].length != found[b].length) return found[a].length > found[b].length;
        return orders[a] < orders[b];
    });

    std::vector<EmbeddedMatch> accepted;
    for (const size_t i : index) {
        const auto& cand = found[i];
        const bool overlaps = std::any_of(accepted.begin(), accepted.end(), [&](const EmbeddedMatch& m) {
            return cand.offset < m.offset + m.length && m.offset < cand.offset + cand.length;
        });
        if (!overlaps) accepted.push_back(cand);
    }

    std::sort(accepted.begin(), accepted.end(), [](const EmbeddedMatch& a, const EmbeddedMatch& b) {
        return a.offset < b.offset;
    });
    return accepted;
}

} // namespace pipeshield
