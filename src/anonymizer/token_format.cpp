#include "anonymizer/token_format.hpp"
#include "classifier/pattern_registry.hpp"

#include <cctype>

namespace pipeshield {

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_lower_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

bool is_prefix_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

} // anonymous namespace

TokenFormat::TokenFormat(const PatternRegistry& registry, size_t digest_width)
    : digest_width_(digest_width) {
    for (const auto& cat : registry.categories()) {
        prefixes_.insert(cat.token_prefix);
    }
}

std::optional<Token> TokenFormat::match_at(std::string_view text, size_t pos, size_t& length) const {
    if (pos >= text.size() || text[pos] < 'A' || text[pos] > 'Z') return std::nullopt;
    if (pos > 0 && is_word_char(text[pos - 1])) return std::nullopt;

    size_t end = pos + 1;
    while (end < text.size() && is_prefix_char(text[end])) ++end;
    if (end >= text.size() || text[end] != '_') return std::nullopt;

    const auto prefix = text.substr(pos, end - pos);
    if (!prefixes_.contains(prefix)) return std::nullopt;

    const size_t digest_start = end + 1;
    if (text.size() - digest_start < digest_width_) return std::nullopt;
    for (size_t i = digest_start; i < digest_start + digest_width_; ++i) {
        if (!is_lower_hex(text[i])) return std::nullopt;
    }
    const size_t digest_end = digest_start + digest_width_;
    if (digest_end < text.size() && is_word_char(text[digest_end])) return std::nullopt;

    length = digest_end - pos;
    return Token{std::string(prefix), std::string(text.substr(digest_start, digest_width_))};
}

std::optional<Token> TokenFormat::parse(std::string_view text) const {
    size_t length = 0;
    auto token = match_at(text, 0, length);
    if (!token || length != text.size()) return std::nullopt;
    return token;
}

std::vector<TokenFormat::Span> TokenFormat::find_all(std::string_view text) const {
    std::vector<Span> spans;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t length = 0;
        if (auto token = match_at(text, pos, length)) {
            spans.push_back({pos, length, std::move(*token)});
            pos += length;
        } else {
            ++pos;
        }
    }
    return spans;
}

} // namespace pipeshield
