#include "provider/http_ai_provider.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <thread>

namespace pipeshield {

namespace {

std::chrono::milliseconds since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

std::string user_prompt(const AnonymizedPayload& payload) {
    return std::format("Question:\n{}\n\nPipeline data ({}):\n{}",
                       payload.question(), payload.operation(), payload.json());
}

} // anonymous namespace

HttpAiProvider::HttpAiProvider(Config config)
    : config_(std::move(config)) {}

std::string HttpAiProvider::name() const {
    return config_.provider + ":" + config_.model;
}

std::string HttpAiProvider::system_prompt() {
    return "You are a CI/CD assistant. You answer questions about build pipelines, "
           "branches, repositories and deployments. Identifiers in the data are "
           "replaced by placeholders such as PIPELINE_1a2b3c4d5e6f or "
           "BRANCH_0f9e8d7c6b5a. Refer to them by exactly these placeholders, "
           "never invent new ones and never try to guess what they stand for.";
}

// ============================================================================
// Request / Response
// ============================================================================

std::string HttpAiProvider::build_request_body(const AnonymizedPayload& payload) const {
    if (config_.provider == "anthropic") {
        return std::format(
            R"({{"model":"{}","max_tokens":{},"system":"{}","messages":[{{"role":"user","content":"{}"}}]}})",
            utils::escape_json(config_.model), config_.max_tokens,
            utils::escape_json(system_prompt()),
            utils::escape_json(user_prompt(payload)));
    }
    return std::format(
        R"({{"model":"{}","temperature":{},"max_tokens":{},"messages":[{{"role":"system","content":"{}"}},{{"role":"user","content":"{}"}}]}})",
        utils::escape_json(config_.model), config_.temperature, config_.max_tokens,
        utils::escape_json(system_prompt()),
        utils::escape_json(user_prompt(payload)));
}

std::string HttpAiProvider::extract_content(const std::string& body, const std::string& provider) {
    Value doc;
    try {
        doc = json::parse(body);
    } catch (const json::JsonParseError& e) {
        utils::log::warn(std::format("HttpAiProvider: unparseable response: {}", e.what()));
        return {};
    }

    if (provider == "anthropic") {
        // {"content":[{"type":"text","text":"..."}]}
        const auto* content = doc.find("content");
        if (!content || !content->is_array()) return {};
        std::string text;
        for (const auto& block : content->as_array()) {
            const auto* type = block.find("type");
            const auto* part = block.find("text");
            if (type && type->is_string() && type->as_string() == "text" &&
                part && part->is_string()) {
                text += part->as_string();
            }
        }
        return text;
    }

    // {"choices":[{"message":{"content":"..."}}]}
    const auto* choices = doc.find("choices");
    if (!choices || !choices->is_array() || choices->as_array().empty()) return {};
    const auto* message = choices->as_array().front().find("message");
    if (!message) return {};
    const auto* content = message->find("content");
    if (!content || !content->is_string()) return {};
    return content->as_string();
}

// ============================================================================
// API Call
// ============================================================================

ProviderResponse HttpAiProvider::complete(const AnonymizedPayload& payload) {
    api_calls_.fetch_add(1, std::memory_order_relaxed);
    const auto start = std::chrono::steady_clock::now();

    if (config_.api_key.empty()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", "No API key configured", config_.model, {}};
    }
    if (config_.endpoint.empty()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", "No endpoint configured", config_.model, {}};
    }

    const auto body = build_request_body(payload);

    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));

    httplib::Headers headers;
    std::string path;
    if (config_.provider == "anthropic") {
        headers = {
            {"x-api-key", config_.api_key},
            {"anthropic-version", "2023-06-01"}
        };
        path = "/v1/messages";
    } else {
        headers = {
            {"Authorization", "Bearer " + config_.api_key}
        };
        path = "/v1/chat/completions";
    }

    for (uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        if (attempt > 0) retries_.fetch_add(1, std::memory_order_relaxed);

        const auto res = cli.Post(path, headers, body, "application/json");

        if (!res) {
            utils::log::warn(std::format("HttpAiProvider: request to {} failed ({}), attempt {}/{}",
                config_.endpoint, httplib::to_string(res.error()), attempt + 1, config_.max_retries + 1));
            if (attempt < config_.max_retries) continue;
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            return {false, "", "HTTP request failed: connection error", config_.model, since(start)};
        }

        if (res->status == httplib::StatusCode::TooManyRequests_429 && attempt < config_.max_retries) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1000 * (attempt + 1)));
            continue;
        }

        if (res->status != httplib::StatusCode::OK_200) {
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            return {false, "", std::format("API error: HTTP {} - {}", res->status,
                    res->body.substr(0, 200)), config_.model, since(start)};
        }

        auto content = extract_content(res->body, config_.provider);
        if (content.empty()) {
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            return {false, "", "API response carried no answer text", config_.model, since(start)};
        }
        return {true, std::move(content), "", config_.model, since(start)};
    }

    api_errors_.fetch_add(1, std::memory_order_relaxed);
    return {false, "", "Max retries exceeded", config_.model, since(start)};
}

HttpAiProvider::Stats HttpAiProvider::get_stats() const {
    return {
        api_calls_.load(std::memory_order_relaxed),
        api_errors_.load(std::memory_order_relaxed),
        retries_.load(std::memory_order_relaxed)
    };
}

} // namespace pipeshield
