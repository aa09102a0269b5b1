#include "audit/audit_recorder.hpp"
#include "config/config_loader.hpp"
#include "config/engine_builder.hpp"
#include "core/engine.hpp"
#include "core/error.hpp"
#include "core/json.hpp"
#include "core/orchestrator.hpp"
#include "core/utils.hpp"
#include "provider/http_ai_provider.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace pipeshield;

namespace {

constexpr const char* kDefaultConfigFile = "pipeshield.toml";

void print_usage() {
    std::cerr <<
        "Usage: pipeshield [--config FILE] <command>\n"
        "\n"
        "Commands:\n"
        "  anonymize [FILE]          Anonymize JSON (file or stdin) and print it\n"
        "  ask QUESTION [FILE]       Round trip QUESTION plus JSON data through the AI provider\n"
        "  check-config              Validate configuration and salt\n"
        "\n"
        "The salt is read from $PIPESHIELD_SALT unless the config names another source.\n";
}

std::string read_input(const std::optional<std::string>& path) {
    if (!path || *path == "-") {
        return {std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    }
    std::ifstream in(*path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error(std::format("Cannot open input file '{}'", *path));
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

std::optional<PipeshieldConfig> load_config(const std::optional<std::string>& explicit_path) {
    std::string path = explicit_path.value_or(kDefaultConfigFile);
    if (!explicit_path && !std::filesystem::exists(path)) {
        utils::log::debug(std::format("{} not found, using built-in defaults", path));
        return PipeshieldConfig{};
    }

    auto result = ConfigLoader::load_from_file(path);
    if (!result.success) {
        utils::log::error(result.error_message);
        return std::nullopt;
    }
    utils::log::info(std::format("Config loaded from {}: {} category override(s), {} extra pattern(s)",
        path, result.config.categories.size(), result.config.patterns.size()));
    return std::move(result.config);
}

void print_report(const AnonymizationReport& r) {
    std::cerr << std::format(
        "nodes={} minted={} reused={} collisions={} ambiguous_redacted={} ambiguous_passed={} "
        "embedded={} propagated={} truncated(cycle={} depth={} size={})\n",
        r.nodes_visited, r.tokens_minted, r.tokens_reused, r.collisions_resolved,
        r.ambiguous_redacted, r.ambiguous_passed, r.embedded_replaced, r.propagated_replaced,
        r.truncated_cycles, r.truncated_depth, r.truncated_size);
}

int cmd_anonymize(const std::shared_ptr<const Engine>& engine, const std::optional<std::string>& file) {
    const auto input = json::parse(read_input(file));
    auto ctx = engine->new_context();
    const auto output = engine->anonymizer().anonymize(input, *ctx);

    std::cout << json::write(output, {.pretty = true}) << "\n";
    print_report(ctx->report());
    return ctx->report().partial() ? 2 : 0;
}

int cmd_ask(const std::shared_ptr<const Engine>& engine,
            const PipeshieldConfig& config,
            const std::string& question,
            const std::optional<std::string>& file) {
    const Value data = file ? json::parse(read_input(file)) : Value::object();

    HttpAiProvider::Config provider_config;
    provider_config.provider = config.ai.provider;
    provider_config.endpoint = config.ai.endpoint;
    provider_config.api_key = config.ai.api_key;
    provider_config.model = config.ai.model;
    provider_config.temperature = config.ai.temperature;
    provider_config.max_tokens = config.ai.max_tokens;
    provider_config.timeout_ms = config.ai.timeout_ms;
    provider_config.max_retries = config.ai.max_retries;
    HttpAiProvider provider(provider_config);

    const Orchestrator orchestrator(engine, build_audit_recorder(config.audit));
    const auto result = orchestrator.run("ask", data, question, provider);
    if (result.is_error()) {
        utils::log::error(std::format("{}: {}",
            error_category_to_string(result.error_category()), result.error_message()));
        return 1;
    }

    const auto& answer = result.value();
    std::cout << answer.text << "\n";
    if (answer.partial()) {
        std::cerr << "note: part of the input was truncated before it was sent\n";
    }
    if (!answer.rehydration.complete()) {
        std::cerr << std::format("note: {} placeholder(s) in the answer could not be resolved\n",
                                 answer.rehydration.unresolved.size());
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::optional<std::string> config_path;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                print_usage();
                return 64;
            }
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage();
        return 64;
    }

    const auto config = load_config(config_path);
    if (!config) return 78;
    utils::log::set_level(utils::log::parse_level(config->logging.level));

    const auto& command = args[0];
    try {
        const auto engine = build_engine(*config);

        if (command == "check-config") {
            std::cout << std::format("ok: {} categories, {} patterns, digest width {}\n",
                engine->registry().categories().size(),
                engine->registry().pattern_count(),
                engine->settings().digest_width);
            return 0;
        }

        if (command == "anonymize") {
            std::optional<std::string> file;
            if (args.size() > 1) file = args[1];
            return cmd_anonymize(engine, file);
        }

        if (command == "ask") {
            if (args.size() < 2) {
                print_usage();
                return 64;
            }
            std::optional<std::string> file;
            if (args.size() > 2) file = args[2];
            return cmd_ask(engine, *config, args[1], file);
        }

        print_usage();
        return 64;

    } catch (const ConfigError& e) {
        utils::log::error(std::format("Configuration invalid: {}", e.what()));
        return 78;
    } catch (const json::JsonParseError& e) {
        utils::log::error(std::format("Invalid JSON input: {}", e.what()));
        return 65;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
