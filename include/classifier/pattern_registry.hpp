#pragma once

#include "core/types.hpp"
#include "core/value.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pipeshield {

/**
 * @brief Data-driven catalog of sensitive categories and detection rules
 *
 * Three rule kinds, evaluated against one ordered table:
 * 1. Field name (key under which a value appears). Exact matches after
 *    normalization ("repoUrl" == "repo_url") carry the rule's confidence;
 *    keys that merely contain the rule's words are AMBIGUOUS matches unless
 *    the rule is marked partial_confident.
 * 2. Value regex (textual shape), matched against the whole value.
 * 3. Type tag declared on the scalar by its producer.
 *
 * Resolution: CONFIDENT candidates beat AMBIGUOUS ones; within a group the
 * highest priority wins; ties go to the rule declared first. The table is
 * built once and immutable afterwards, so concurrent classification needs
 * no locking.
 */
class PatternRegistry {
public:
    /**
     * @throws ConfigError on duplicate category names or prefixes, a
     *         malformed prefix, a pattern naming an unknown category, or a
     *         regex that does not compile
     */
    PatternRegistry(std::vector<CategoryDef> categories,
                    std::vector<SensitivePattern> patterns);

    /// Registry over the built-in CI/CD category table
    [[nodiscard]] static PatternRegistry with_defaults();

    [[nodiscard]] static std::vector<CategoryDef> default_categories();
    [[nodiscard]] static std::vector<SensitivePattern> default_patterns();

    /**
     * @brief Classify a value appearing under a field
     *
     * Field-name rules first; only when the key is not sensitive are the
     * value's shape and tag consulted (strings only).
     */
    [[nodiscard]] std::optional<Classification> classify(
        std::string_view field_name, const Value& value) const;

    [[nodiscard]] std::optional<Classification> classify_field(std::string_view field_name) const;

    [[nodiscard]] std::optional<Classification> classify_value(
        std::string_view text, std::string_view tag = {}) const;

    /**
     * @brief Find sensitive substrings inside free text
     * @return Non-overlapping matches ordered by offset
     */
    [[nodiscard]] std::vector<EmbeddedMatch> scan_embedded(std::string_view text) const;

    [[nodiscard]] const CategoryDef* category(std::string_view name) const;
    [[nodiscard]] const CategoryDef* category_by_prefix(std::string_view prefix) const;
    [[nodiscard]] const std::vector<CategoryDef>& categories() const { return categories_; }
    [[nodiscard]] size_t pattern_count() const { return rules_.size(); }

    /// Longest value checked against whole-value regexes; also the chunk size for scans
    static constexpr size_t kMaxRegexInput = 4096;

    /// Category given to armored private-key blocks
    static constexpr std::string_view kKeyBlockCategory = "credential";

private:
    struct Rule {
        SensitivePattern pattern;
        size_t order = 0;
        std::vector<std::vector<std::string>> name_words;   // FIELD_NAME: words per name
        std::vector<std::string> normalized_names;           // FIELD_NAME / TYPE_TAG
        std::optional<std::regex> re;                        // VALUE_REGEX
    };

    struct Candidate {
        const Rule* rule = nullptr;
        Confidence confidence = Confidence::CONFIDENT;
    };

    [[nodiscard]] bool enabled(const std::string& category) const;
    [[nodiscard]] static std::optional<Classification> pick(const std::vector<Candidate>& candidates);
    void scan_chunk(std::string_view chunk, size_t base_offset,
                    std::vector<EmbeddedMatch>& out, std::vector<size_t>& orders) const;
    void scan_range(std::string_view text, size_t from, size_t to,
                    std::vector<EmbeddedMatch>& out, std::vector<size_t>& orders) const;

    /// Private-key blocks over the whole text; unterminated blocks run to the end
    [[nodiscard]] std::vector<EmbeddedMatch> find_key_blocks(std::string_view text) const;

    std::vector<CategoryDef> categories_;
    std::unordered_map<std::string, size_t> category_index_;
    std::unordered_map<std::string, size_t> prefix_index_;

    std::vector<Rule> rules_;
    std::vector<size_t> field_rules_;
    std::vector<size_t> value_rules_;
    std::vector<size_t> tag_rules_;
    std::vector<size_t> embedded_rules_;
};

} // namespace pipeshield
