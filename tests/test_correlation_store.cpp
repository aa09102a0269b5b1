#include <catch2/catch_test_macros.hpp>
#include "anonymizer/correlation_store.hpp"
#include "core/error.hpp"
#include "security/hasher.hpp"

#include <format>
#include <set>
#include <string>

using namespace pipeshield;

namespace {

Hasher make_hasher(size_t width = 12) {
    return Hasher(std::vector<uint8_t>(32, 0x42), width);
}

} // anonymous namespace

TEST_CASE("CorrelationStore: same value reuses its token", "[correlation]") {
    const auto hasher = make_hasher();
    CorrelationStore store(hasher);

    const auto first = store.intern("organization", "ORG", "org-acme");
    const auto second = store.intern("organization", "ORG", "org-acme");

    CHECK(first.minted);
    CHECK_FALSE(second.minted);
    CHECK(first.token == second.token);
    CHECK(first.token.prefix == "ORG");
    CHECK(first.token.digest.size() == 12);
    CHECK(store.size() == 1);
}

TEST_CASE("CorrelationStore: token digest comes from the hasher", "[correlation]") {
    const auto hasher = make_hasher();
    CorrelationStore store(hasher);

    const auto result = store.intern("branch", "BRANCH", "release/2.3");
    CHECK(result.token.digest == hasher.digest("branch", "release/2.3"));
    CHECK(result.collisions == 0);
}

TEST_CASE("CorrelationStore: same text in two categories gets two tokens", "[correlation]") {
    const auto hasher = make_hasher();
    CorrelationStore store(hasher);

    const auto team = store.intern("team", "TEAM", "payments");
    const auto app = store.intern("application", "APP", "payments");

    CHECK(team.token != app.token);
    CHECK(team.token.digest != app.token.digest);
    CHECK(store.size() == 2);
}

TEST_CASE("CorrelationStore: resolve and lookups", "[correlation]") {
    const auto hasher = make_hasher();
    CorrelationStore store(hasher);

    const auto result = store.intern("email", "EMAIL", "alice@example.com");

    REQUIRE(store.resolve(result.token).has_value());
    CHECK(*store.resolve(result.token) == "alice@example.com");
    CHECK_FALSE(store.resolve(Token{"EMAIL", "000000000000"}).has_value());

    const auto* by_value = store.find("email", "alice@example.com");
    REQUIRE(by_value != nullptr);
    CHECK(by_value->token == result.token);
    CHECK(store.find("user", "alice@example.com") == nullptr);

    const auto* by_token = store.find_token(result.token.str());
    REQUIRE(by_token != nullptr);
    CHECK(by_token->category == "email");
}

TEST_CASE("CorrelationStore: entries keep mint order", "[correlation]") {
    const auto hasher = make_hasher();
    CorrelationStore store(hasher);

    (void)store.intern("branch", "BRANCH", "main");
    (void)store.intern("user", "USER", "alice");
    (void)store.intern("branch", "BRANCH", "main");
    (void)store.intern("host", "HOST", "agent-07");

    const auto& entries = store.entries();
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].original == "main");
    CHECK(entries[1].original == "alice");
    CHECK(entries[2].original == "agent-07");
}

TEST_CASE("CorrelationStore: independent stores agree on tokens", "[correlation]") {
    const auto hasher = make_hasher();
    CorrelationStore a(hasher);
    CorrelationStore b(hasher);

    CHECK(a.intern("pipeline", "PIPELINE", "frontend-deploy").token ==
          b.intern("pipeline", "PIPELINE", "frontend-deploy").token);
}

TEST_CASE("CorrelationStore: collisions re-digest to distinct tokens", "[correlation][collision]") {
    // 4 hex chars give 65536 digests; 3000 values are certain to collide
    const auto hasher = make_hasher(4);
    CorrelationStore store(hasher);

    std::set<std::string> rendered;
    for (int i = 0; i < 3000; ++i) {
        const auto value = std::format("job-{}", i);
        const auto result = store.intern("pipeline", "PIPELINE", value);
        CHECK(result.token.digest.size() == 4);
        rendered.insert(result.token.str());
    }

    CHECK(rendered.size() == 3000);
    CHECK(store.size() == 3000);
    CHECK(store.collisions() > 0);

    for (int i = 0; i < 3000; ++i) {
        const auto value = std::format("job-{}", i);
        const auto* entry = store.find("pipeline", value);
        REQUIRE(entry != nullptr);
        REQUIRE(store.resolve(entry->token) == value);
    }
}

TEST_CASE("CorrelationStore: exhausted attempts throw", "[correlation][collision]") {
    const auto hasher = make_hasher(4);
    CorrelationStore store(hasher, 1);

    bool exhausted = false;
    for (int i = 0; i < 20000 && !exhausted; ++i) {
        try {
            (void)store.intern("pipeline", "PIPELINE", std::format("job-{}", i));
        } catch (const TokenSpaceExhausted&) {
            exhausted = true;
        }
    }
    CHECK(exhausted);
}

TEST_CASE("CorrelationStore: clear drops every mapping", "[correlation]") {
    const auto hasher = make_hasher();
    CorrelationStore store(hasher);

    const auto result = store.intern("user", "USER", "alice");
    store.clear();

    CHECK(store.empty());
    CHECK_FALSE(store.resolve(result.token).has_value());
    CHECK(store.find("user", "alice") == nullptr);
}
