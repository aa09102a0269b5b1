#include "anonymizer/rehydrator.hpp"
#include "anonymizer/token_format.hpp"
#include "classifier/pattern_registry.hpp"

#include <algorithm>

namespace pipeshield {

Rehydrator::Rehydrator(const PatternRegistry& registry, const TokenFormat& tokens)
    : registry_(registry), tokens_(tokens) {}

void Rehydrator::rehydrate_into(std::string_view text, const AnonymizationContext& ctx,
                                RehydrationResult& result) const {
    const auto spans = tokens_.find_all(text);
    size_t pos = 0;
    for (const auto& span : spans) {
        result.text.append(text.substr(pos, span.offset - pos));
        pos = span.offset + span.length;

        const auto rendered = span.token.str();
        const auto* entry = ctx.store().find_token(rendered);
        if (!entry) {
            result.text += kUnresolvedPrefix;
            result.text += rendered;
            result.text += ']';
            if (std::find(result.unresolved.begin(), result.unresolved.end(), rendered)
                    == result.unresolved.end()) {
                result.unresolved.push_back(rendered);
            }
            continue;
        }

        const auto* category = registry_.category(entry->category);
        if (category && !category->rehydrate) {
            result.text += rendered;
            ++result.withheld;
            continue;
        }

        result.text += entry->original;
        ++result.resolved;
    }
    result.text.append(text.substr(pos));
}

RehydrationResult Rehydrator::rehydrate(std::string_view text,
                                        const AnonymizationContext& ctx) const {
    RehydrationResult result;
    result.text.reserve(text.size());
    rehydrate_into(text, ctx, result);
    return result;
}

Value Rehydrator::rehydrate(const Value& value,
                            const AnonymizationContext& ctx,
                            RehydrationResult& summary) const {
    switch (value.kind()) {
        case Value::Kind::STRING: {
            RehydrationResult one;
            rehydrate_into(value.as_string(), ctx, one);
            summary.resolved += one.resolved;
            summary.withheld += one.withheld;
            for (auto& token : one.unresolved) {
                if (std::find(summary.unresolved.begin(), summary.unresolved.end(), token)
                        == summary.unresolved.end()) {
                    summary.unresolved.push_back(std::move(token));
                }
            }
            return Value(std::move(one.text));
        }
        case Value::Kind::ARRAY: {
            Value out = Value::array();
            for (const auto& item : value.as_array()) {
                out.push_back(rehydrate(item, ctx, summary));
            }
            return out;
        }
        case Value::Kind::OBJECT: {
            Value out = Value::object();
            for (const auto& [key, member] : value.as_object()) {
                out[key] = rehydrate(member, ctx, summary);
            }
            return out;
        }
        default:
            return value;
    }
}

} // namespace pipeshield
