#include "anonymizer/correlation_store.hpp"
#include "core/error.hpp"
#include "security/hasher.hpp"

#include <format>

namespace pipeshield {

CorrelationStore::CorrelationStore(const Hasher& hasher, uint32_t max_attempts)
    : hasher_(hasher), max_attempts_(max_attempts == 0 ? 1 : max_attempts) {}

std::string CorrelationStore::value_key(std::string_view category, std::string_view value) {
    std::string key;
    key.reserve(category.size() + value.size() + 1);
    key.append(category);
    key += '\x1f';
    key.append(value);
    return key;
}

CorrelationStore::InternResult CorrelationStore::intern(const std::string& category,
                                                        const std::string& token_prefix,
                                                        const std::string& value) {
    auto key = value_key(category, value);
    if (const auto it = by_value_.find(key); it != by_value_.end()) {
        return {entries_[it->second].token, false, 0};
    }

    for (uint32_t attempt = 0; attempt < max_attempts_; ++attempt) {
        Token token{token_prefix, hasher_.digest(category, value, attempt)};
        auto rendered = token.str();
        if (by_token_.contains(rendered)) {
            ++collisions_;
            continue;
        }

        const size_t index = entries_.size();
        entries_.push_back({value, token, category});
        by_value_.emplace(std::move(key), index);
        by_token_.emplace(std::move(rendered), index);
        return {std::move(token), true, attempt};
    }

    throw TokenSpaceExhausted(std::format(
        "No free {} token after {} attempts ({} entries in context)",
        token_prefix, max_attempts_, entries_.size()));
}

std::optional<std::string> CorrelationStore::resolve(const Token& token) const {
    if (const auto* entry = find_token(token.str())) {
        return entry->original;
    }
    return std::nullopt;
}

const CorrelationEntry* CorrelationStore::find(std::string_view category, std::string_view value) const {
    const auto it = by_value_.find(value_key(category, value));
    return it != by_value_.end() ? &entries_[it->second] : nullptr;
}

const CorrelationEntry* CorrelationStore::find_token(std::string_view rendered) const {
    const auto it = by_token_.find(std::string(rendered));
    return it != by_token_.end() ? &entries_[it->second] : nullptr;
}

void CorrelationStore::clear() {
    entries_.clear();
    by_value_.clear();
    by_token_.clear();
    collisions_ = 0;
}

} // namespace pipeshield
