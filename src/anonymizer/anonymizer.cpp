#include "anonymizer/anonymizer.hpp"
#include "anonymizer/token_format.hpp"
#include "classifier/pattern_registry.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>

namespace pipeshield {

namespace {

Value marker(std::string_view text) {
    return Value(text);
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool overlaps_any(const std::vector<TokenFormat::Span>& spans, size_t offset, size_t length) {
    return std::any_of(spans.begin(), spans.end(), [&](const TokenFormat::Span& s) {
        return offset < s.offset + s.length && s.offset < offset + length;
    });
}

} // anonymous namespace

Anonymizer::Anonymizer(const PatternRegistry& registry,
                       const TokenFormat& tokens,
                       AnonymizerOptions options)
    : registry_(registry), tokens_(tokens), options_(options) {}

Value Anonymizer::anonymize(const Value& input, AnonymizationContext& ctx) const {
    const AnonymizationReport before = ctx.report();

    Walk w{ctx, {}, 0};
    Value out = walk(input, 0, w);
    propagate(out, ctx);

    const auto& after = ctx.report();
    utils::log::debug(std::format(
        "[{}] anonymized {} nodes: {} minted, {} reused, {} embedded, {} propagated",
        ctx.id(),
        after.nodes_visited - before.nodes_visited,
        after.tokens_minted - before.tokens_minted,
        after.tokens_reused - before.tokens_reused,
        after.embedded_replaced - before.embedded_replaced,
        after.propagated_replaced - before.propagated_replaced));

    if (after.partial() && !before.partial()) {
        utils::log::warn(std::format(
            "[{}] partial coverage: {} cycle, {} depth, {} size truncations",
            ctx.id(), after.truncated_cycles, after.truncated_depth, after.truncated_size));
    }
    return out;
}

std::string Anonymizer::anonymize_text(std::string_view text, AnonymizationContext& ctx) const {
    const Value out = anonymize(Value(text), ctx);
    return out.as_string();
}

// ============================================================================
// Walk
// ============================================================================

Value Anonymizer::walk(const Value& node, size_t depth, Walk& w) const {
    ++w.nodes;
    ++w.ctx.report().nodes_visited;
    if (w.nodes > options_.max_nodes) {
        ++w.ctx.report().truncated_size;
        return marker(kTruncatedSize);
    }

    switch (node.kind()) {
        case Value::Kind::OBJECT: return walk_object(node, depth, w);
        case Value::Kind::ARRAY:  return walk_array(node, depth, w);
        case Value::Kind::STRING: return walk_string(node, w);
        default:                  return node;
    }
}

Value Anonymizer::walk_object(const Value& node, size_t depth, Walk& w) const {
    const void* id = node.identity();
    if (w.active_path.contains(id)) {
        ++w.ctx.report().truncated_cycles;
        return marker(kTruncatedCycle);
    }
    if (depth >= options_.max_depth) {
        ++w.ctx.report().truncated_depth;
        return marker(kTruncatedDepth);
    }

    w.active_path.insert(id);
    Value out = Value::object();
    for (const auto& [key, member] : node.as_object()) {
        const auto cls = registry_.classify_field(key);

        bool redact = false;
        if (cls && !member.is_null()) {
            if (member.is_string()) {
                const auto& s = member.as_string();
                redact = !s.empty() && !is_marker(s) && !tokens_.is_token(s);
            } else {
                redact = true;
            }
        }

        if (redact && accept(*cls, w)) {
            out[key] = redact_member(member, *cls, w);
        } else {
            out[key] = walk(member, depth + 1, w);
        }
    }
    w.active_path.erase(id);
    return out;
}

Value Anonymizer::walk_array(const Value& node, size_t depth, Walk& w) const {
    const void* id = node.identity();
    if (w.active_path.contains(id)) {
        ++w.ctx.report().truncated_cycles;
        return marker(kTruncatedCycle);
    }
    if (depth >= options_.max_depth) {
        ++w.ctx.report().truncated_depth;
        return marker(kTruncatedDepth);
    }

    w.active_path.insert(id);
    Value out = Value::array();
    auto& items = out.as_array();
    items.reserve(node.size());
    for (const auto& item : node.as_array()) {
        items.push_back(walk(item, depth + 1, w));
    }
    w.active_path.erase(id);
    return out;
}

Value Anonymizer::walk_string(const Value& node, Walk& w) const {
    const auto& text = node.as_string();
    if (text.empty() || is_marker(text) || tokens_.is_token(text)) {
        return node;
    }

    // Text that already carries tokens has been through a pass; only its
    // remaining free text is scanned.
    if (tokens_.find_all(text).empty()) {
        if (const auto cls = registry_.classify_value(text, node.tag())) {
            if (accept(*cls, w)) {
                return Value(tokenize(cls->category, text, w));
            }
        }
    }

    Value out(replace_embedded(text, w));
    out.set_tag(node.tag());
    return out;
}

// ============================================================================
// Substitution
// ============================================================================

bool Anonymizer::accept(const Classification& cls, Walk& w) const {
    if (!cls.ambiguous()) return true;
    if (options_.strict_mode) {
        ++w.ctx.report().ambiguous_redacted;
        return true;
    }
    ++w.ctx.report().ambiguous_passed;
    return false;
}

Value Anonymizer::redact_member(const Value& member, const Classification& cls, Walk& w) const {
    if (member.is_string()) {
        return Value(tokenize(cls.category, member.as_string(), w));
    }
    if (member.is_object() || member.is_array()) {
        // Leaves get their own entries so propagation finds them elsewhere
        std::unordered_set<const void*> seen;
        intern_leaves(member, cls.category, 0, seen, w);
    }
    // Numbers, booleans and whole subtrees are tokenized by canonical text
    return Value(tokenize(cls.category, json::write(member), w));
}

void Anonymizer::intern_leaves(const Value& node, const std::string& category, size_t depth,
                               std::unordered_set<const void*>& seen, Walk& w) const {
    switch (node.kind()) {
        case Value::Kind::STRING: {
            const auto& text = node.as_string();
            if (!text.empty() && !is_marker(text) && !tokens_.is_token(text)) {
                tokenize(category, text, w);
            }
            break;
        }
        case Value::Kind::ARRAY:
            if (depth >= options_.max_depth || !seen.insert(node.identity()).second) break;
            for (const auto& item : node.as_array()) {
                intern_leaves(item, category, depth + 1, seen, w);
            }
            break;
        case Value::Kind::OBJECT:
            if (depth >= options_.max_depth || !seen.insert(node.identity()).second) break;
            for (const auto& [key, member] : node.as_object()) {
                intern_leaves(member, category, depth + 1, seen, w);
            }
            break;
        default:
            break;
    }
}

std::string Anonymizer::tokenize(const std::string& category,
                                 const std::string& original,
                                 Walk& w) const {
    const auto* def = registry_.category(category);
    if (!def) {
        throw std::logic_error(std::format("Unknown category '{}'", category));
    }

    const auto result = w.ctx.store().intern(category, def->token_prefix, original);
    auto& report = w.ctx.report();
    if (result.minted) {
        ++report.tokens_minted;
        if (result.collisions > 0) {
            report.collisions_resolved += result.collisions;
            utils::log::warn(std::format(
                "[{}] token collision in category '{}' resolved after {} re-digest(s): {}",
                w.ctx.id(), category, result.collisions, result.token.str()));
        }
    } else {
        ++report.tokens_reused;
    }
    return result.token.str();
}

std::string Anonymizer::replace_embedded(const std::string& text, Walk& w) const {
    const auto matches = registry_.scan_embedded(text);
    if (matches.empty()) return text;

    const auto spans = tokens_.find_all(text);

    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    for (const auto& m : matches) {
        if (m.offset < pos || overlaps_any(spans, m.offset, m.length)) continue;

        const auto original = text.substr(m.offset, m.length);
        if (is_marker(original)) continue;

        const Classification cls{m.category, m.confidence, m.priority};
        if (!accept(cls, w)) continue;

        out.append(text, pos, m.offset - pos);
        out += tokenize(m.category, original, w);
        pos = m.offset + m.length;
        ++w.ctx.report().embedded_replaced;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

// ============================================================================
// Propagation
// ============================================================================

void Anonymizer::propagate(Value& root, AnonymizationContext& ctx) const {
    // Copied: widening below mints entries while the list is in use
    std::vector<CorrelationEntry> originals = ctx.store().entries();
    if (originals.empty()) return;

    // Longest first so "acme-corp-prod" wins over "acme-corp"
    std::stable_sort(originals.begin(), originals.end(),
                     [](const CorrelationEntry& a, const CorrelationEntry& b) {
                         return a.original.size() > b.original.size();
                     });

    Walk w{ctx, {}, 0};
    size_t replaced = 0;
    std::vector<Value*> pending{&root};
    while (!pending.empty()) {
        Value* node = pending.back();
        pending.pop_back();

        switch (node->kind()) {
            case Value::Kind::STRING: {
                const auto& text = node->as_string();
                if (text.empty() || is_marker(text) || tokens_.is_token(text)) break;
                auto rewritten = propagate_text(text, originals, w, replaced);
                if (rewritten != text) {
                    auto tag = node->tag();
                    *node = Value(std::move(rewritten));
                    node->set_tag(std::move(tag));
                }
                break;
            }
            case Value::Kind::ARRAY:
                for (auto& item : node->as_array()) pending.push_back(&item);
                break;
            case Value::Kind::OBJECT:
                for (auto& [key, member] : node->as_object()) pending.push_back(&member);
                break;
            default:
                break;
        }
    }
    ctx.report().propagated_replaced += replaced;
}

std::string Anonymizer::propagate_text(const std::string& text,
                                       const std::vector<CorrelationEntry>& originals,
                                       Walk& w,
                                       size_t& replaced) const {
    std::string current = text;
    for (const auto& entry : originals) {
        const auto& original = entry.original;
        if (current.find(original) == std::string::npos) continue;

        const bool whole_words_only = original.size() < options_.min_propagation_length;
        const auto spans = tokens_.find_all(current);
        const auto token = entry.token.str();

        std::string out;
        out.reserve(current.size());
        size_t pos = 0;
        size_t search = 0;
        size_t found = 0;
        while ((found = current.find(original, search)) != std::string::npos) {
            size_t start = found;
            size_t end = found + original.size();
            if (overlaps_any(spans, start, end - start)) {
                search = found + 1;
                continue;
            }

            // A token glued to word characters is no longer recognizable
            const bool bounded = (start == 0 || !is_word_char(current[start - 1])) &&
                                 (end == current.size() || !is_word_char(current[end]));
            std::string replacement = token;
            if (!bounded) {
                if (whole_words_only) {
                    search = found + 1;
                    continue;
                }
                while (start > pos && is_word_char(current[start - 1])) --start;
                while (end < current.size() && is_word_char(current[end])) ++end;
                if (overlaps_any(spans, start, end - start)) {
                    start = found;
                    end = found + original.size();
                } else {
                    // "frontend-deploy2" gets a token of its own
                    replacement = tokenize(entry.category, current.substr(start, end - start), w);
                }
            }

            out.append(current, pos, start - pos);
            out += replacement;
            pos = end;
            search = end;
            ++replaced;
        }
        out.append(current, pos, std::string::npos);
        current = std::move(out);
    }
    return current;
}

} // namespace pipeshield
