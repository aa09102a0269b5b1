#pragma once

#include "provider/ai_provider.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace pipeshield {

/**
 * @brief AI provider over HTTP (OpenAI-compatible or Anthropic messages API)
 *
 * Uses httplib::Client. Retries connection failures and HTTP 429 with a
 * linear backoff. Only ever sees AnonymizedPayload contents.
 */
class HttpAiProvider : public IAiProvider {
public:
    struct Config {
        std::string provider = "openai";         // "openai" | "anthropic"
        std::string endpoint = "https://api.openai.com";
        std::string api_key;
        std::string model = "gpt-4";
        double temperature = 0.3;
        int max_tokens = 2048;
        uint32_t timeout_ms = 30000;
        uint32_t max_retries = 2;
    };

    explicit HttpAiProvider(Config config);

    [[nodiscard]] ProviderResponse complete(const AnonymizedPayload& payload) override;
    [[nodiscard]] std::string name() const override;

    /// Request body for the configured API flavour (for testing)
    [[nodiscard]] std::string build_request_body(const AnonymizedPayload& payload) const;

    /// Answer text from a response body; empty when the body has an unexpected shape
    [[nodiscard]] static std::string extract_content(const std::string& body, const std::string& provider);

    [[nodiscard]] static std::string system_prompt();

    struct Stats {
        uint64_t api_calls = 0;
        uint64_t api_errors = 0;
        uint64_t retries = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    Config config_;

    std::atomic<uint64_t> api_calls_{0};
    std::atomic<uint64_t> api_errors_{0};
    std::atomic<uint64_t> retries_{0};
};

} // namespace pipeshield
