#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pipeshield {

/**
 * @brief Where the process-wide hashing salt comes from
 *
 * Salt text is taken as raw bytes unless it starts with "hex:", in which
 * case the remainder is hex-decoded. Sources are read once at startup.
 */
class ISaltSource {
public:
    virtual ~ISaltSource() = default;

    /// Salt bytes, or nullopt when the source has nothing usable
    [[nodiscard]] virtual std::optional<std::vector<uint8_t>> load() const = 0;

    /// Human-readable description for logging (never the salt itself)
    [[nodiscard]] virtual std::string describe() const = 0;
};

/**
 * @brief Salt from an environment variable (12-factor deployments)
 */
class EnvSaltSource : public ISaltSource {
public:
    explicit EnvSaltSource(std::string env_var_name = "PIPESHIELD_SALT");

    [[nodiscard]] std::optional<std::vector<uint8_t>> load() const override;
    [[nodiscard]] std::string describe() const override;

private:
    std::string env_var_name_;
};

/**
 * @brief Salt from a file; trailing whitespace is stripped
 */
class FileSaltSource : public ISaltSource {
public:
    explicit FileSaltSource(std::string path);

    [[nodiscard]] std::optional<std::vector<uint8_t>> load() const override;
    [[nodiscard]] std::string describe() const override;

private:
    std::string path_;
};

/**
 * @brief Salt given inline in the configuration file
 */
class StaticSaltSource : public ISaltSource {
public:
    explicit StaticSaltSource(std::string salt);

    [[nodiscard]] std::optional<std::vector<uint8_t>> load() const override;
    [[nodiscard]] std::string describe() const override;

private:
    std::string salt_;
};

/// Decode salt text ("hex:..." or raw); empty result on invalid hex
[[nodiscard]] std::vector<uint8_t> decode_salt(const std::string& text);

} // namespace pipeshield
