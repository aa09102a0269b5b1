#include "security/salt_source.hpp"
#include "core/utils.hpp"

#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace pipeshield {

std::vector<uint8_t> decode_salt(const std::string& text) {
    static constexpr std::string_view kHexPrefix = "hex:";

    if (text.rfind(kHexPrefix, 0) != 0) {
        return {text.begin(), text.end()};
    }

    const std::string_view hex = std::string_view(text).substr(kHexPrefix.size());
    if (hex.size() < 2 || hex.size() % 2 != 0) return {};

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        unsigned int val{};
        const auto [ptr, ec] = std::from_chars(hex.data() + i, hex.data() + i + 2, val, 16);
        if (ec != std::errc{} || ptr != hex.data() + i + 2) return {};
        bytes.push_back(static_cast<uint8_t>(val));
    }
    return bytes;
}

// ============================================================================
// EnvSaltSource
// ============================================================================

EnvSaltSource::EnvSaltSource(std::string env_var_name)
    : env_var_name_(std::move(env_var_name)) {}

std::optional<std::vector<uint8_t>> EnvSaltSource::load() const {
    const char* raw = std::getenv(env_var_name_.c_str());
    if (!raw || !*raw) {
        utils::log::warn(std::format("EnvSaltSource: environment variable '{}' not set", env_var_name_));
        return std::nullopt;
    }

    auto bytes = decode_salt(raw);
    if (bytes.empty()) {
        utils::log::error(std::format("EnvSaltSource: '{}' holds invalid hex", env_var_name_));
        return std::nullopt;
    }
    return bytes;
}

std::string EnvSaltSource::describe() const {
    return "env:" + env_var_name_;
}

// ============================================================================
// FileSaltSource
// ============================================================================

FileSaltSource::FileSaltSource(std::string path)
    : path_(std::move(path)) {}

std::optional<std::vector<uint8_t>> FileSaltSource::load() const {
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        utils::log::error(std::format("FileSaltSource: cannot open '{}'", path_));
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    std::string text = contents.str();
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' ||
                             text.back() == ' ' || text.back() == '\t')) {
        text.pop_back();
    }

    auto bytes = decode_salt(text);
    if (bytes.empty()) {
        utils::log::error(std::format("FileSaltSource: '{}' is empty or holds invalid hex", path_));
        return std::nullopt;
    }
    return bytes;
}

std::string FileSaltSource::describe() const {
    return "file:" + path_;
}

// ============================================================================
// StaticSaltSource
// ============================================================================

StaticSaltSource::StaticSaltSource(std::string salt)
    : salt_(std::move(salt)) {}

std::optional<std::vector<uint8_t>> StaticSaltSource::load() const {
    auto bytes = decode_salt(salt_);
    if (bytes.empty()) return std::nullopt;
    return bytes;
}

std::string StaticSaltSource::describe() const {
    return "inline";
}

} // namespace pipeshield
