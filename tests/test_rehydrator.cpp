#include <catch2/catch_test_macros.hpp>
#include "core/engine.hpp"
#include "mocks/test_engine.hpp"

#include <format>

using namespace pipeshield;
using pipeshield::testing::make_engine;

namespace {

struct Anonymized {
    std::string pipeline;
    std::string branch;
};

Anonymized anonymize_job(const Engine& engine, AnonymizationContext& ctx) {
    const auto out = engine.anonymizer().anonymize(Value::object({
        {"pipeline", "frontend-deploy"},
        {"branch", "release/2.3"},
        {"build", 42},
    }), ctx);
    return {out.find("pipeline")->as_string(), out.find("branch")->as_string()};
}

} // anonymous namespace

TEST_CASE("Rehydrator: tokens in the answer resolve to originals", "[rehydrate]") {
    const auto engine = make_engine();
    auto ctx = engine->new_context();
    const auto tokens = anonymize_job(*engine, *ctx);

    const auto response = std::format("The failure in {} at {} was a timeout",
                                      tokens.pipeline, tokens.branch);
    const auto result = engine->rehydrator().rehydrate(response, *ctx);

    CHECK(result.text == "The failure in frontend-deploy at release/2.3 was a timeout");
    CHECK(result.resolved == 2);
    CHECK(result.withheld == 0);
    CHECK(result.complete());
}

TEST_CASE("Rehydrator: tokens with surrounding punctuation", "[rehydrate]") {
    const auto engine = make_engine();
    auto ctx = engine->new_context();
    const auto tokens = anonymize_job(*engine, *ctx);

    const auto result = engine->rehydrator().rehydrate(
        std::format("Check `{}`, then ({}).", tokens.pipeline, tokens.branch), *ctx);

    CHECK(result.text == "Check `frontend-deploy`, then (release/2.3).");
}

TEST_CASE("Rehydrator: text without tokens is unchanged", "[rehydrate]") {
    const auto engine = make_engine();
    auto ctx = engine->new_context();

    const auto result = engine->rehydrator().rehydrate("Retry with a longer timeout.", *ctx);
    CHECK(result.text == "Retry with a longer timeout.");
    CHECK(result.resolved == 0);
    CHECK(result.complete());
}

TEST_CASE("Rehydrator: tokens from another context stay unresolved", "[rehydrate]") {
    const auto engine = make_engine();
    auto origin = engine->new_context();
    const auto tokens = anonymize_job(*engine, *origin);

    auto other = engine->new_context();
    const auto result = engine->rehydrator().rehydrate(
        std::format("{} and {} again", tokens.pipeline, tokens.pipeline), *other);

    CHECK(result.text == std::format("[UNRESOLVED:{0}] and [UNRESOLVED:{0}] again", tokens.pipeline));
    REQUIRE(result.unresolved.size() == 1);
    CHECK(result.unresolved[0] == tokens.pipeline);
    CHECK_FALSE(result.complete());
    CHECK(result.text.find("frontend-deploy") == std::string::npos);
}

TEST_CASE("Rehydrator: invented tokens are flagged", "[rehydrate]") {
    const auto engine = make_engine();
    auto ctx = engine->new_context();
    (void)anonymize_job(*engine, *ctx);

    const auto result = engine->rehydrator().rehydrate("Maybe HOST_0123456789ab is down", *ctx);
    CHECK(result.text == "Maybe [UNRESOLVED:HOST_0123456789ab] is down");
    CHECK(result.unresolved.size() == 1);
}

TEST_CASE("Rehydrator: unknown prefixes are ordinary text", "[rehydrate]") {
    const auto engine = make_engine();
    auto ctx = engine->new_context();

    const auto result = engine->rehydrator().rehydrate("Set MAX_0123456789ab in the job", *ctx);
    CHECK(result.text == "Set MAX_0123456789ab in the job");
    CHECK(result.complete());
}

TEST_CASE("Rehydrator: credentials are withheld", "[rehydrate]") {
    const auto engine = make_engine();
    auto ctx = engine->new_context();

    const auto out = engine->anonymizer().anonymize(
        Value::object({{"api_key", "sk-live-1234567890"}}), *ctx);
    const auto& token = out.find("api_key")->as_string();

    const auto result = engine->rehydrator().rehydrate("Rotate " + token + " now", *ctx);
    CHECK(result.text == "Rotate " + token + " now");
    CHECK(result.withheld == 1);
    CHECK(result.resolved == 0);
    CHECK(result.complete());
}

TEST_CASE("Rehydrator: discarded context resolves nothing", "[rehydrate]") {
    const auto engine = make_engine();
    auto ctx = engine->new_context();
    const auto tokens = anonymize_job(*engine, *ctx);

    ctx->discard();
    const auto result = engine->rehydrator().rehydrate(tokens.branch, *ctx);
    CHECK(result.text == "[UNRESOLVED:" + tokens.branch + "]");
}

TEST_CASE("Rehydrator: structured answers are rehydrated recursively", "[rehydrate]") {
    const auto engine = make_engine();
    auto ctx = engine->new_context();
    const auto tokens = anonymize_job(*engine, *ctx);

    const auto answer = Value::object({
        {"summary", "Timeout in " + tokens.pipeline},
        {"steps", Value::array({tokens.branch, 3})},
    });

    RehydrationResult summary;
    const auto restored = engine->rehydrator().rehydrate(answer, *ctx, summary);

    CHECK(restored.find("summary")->as_string() == "Timeout in frontend-deploy");
    CHECK(restored.find("steps")->as_array()[0] == Value("release/2.3"));
    CHECK(restored.find("steps")->as_array()[1] == Value(3));
    CHECK(summary.resolved == 2);
}
