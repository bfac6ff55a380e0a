// Easel Configuration Layer Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "../../src/control/config.hpp"
#include "../../src/core/string_utils.hpp"

using namespace easel::control;

namespace {

bool has_message(const std::vector<std::string>& messages, std::string_view needle) {
    for (const auto& message : messages) {
        if (message.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

Config config_with_secrets() {
    Config config;
    config.secrets.gemini_api_key = "g";
    config.secrets.unsplash_access_key = "u";
    config.secrets.giphy_api_key = "p";
    return config;
}

}  // namespace

TEST_CASE("Config defaults", "[control][config]") {
    Config config;
    REQUIRE(config.server.listen_address == "127.0.0.1");
    REQUIRE(config.server.listen_port == 8080);
    REQUIRE(config.server.idle_timeout == 30000);
    REQUIRE(config.server.max_connections == 0);
    REQUIRE(config.upstreams.gemini.base_url ==
            "https://generativelanguage.googleapis.com/v1beta");
    REQUIRE(config.upstreams.gemini.generate_timeout == 120);
    REQUIRE(config.upstreams.gemini.describe_timeout == 30);
    REQUIRE(config.upstreams.unsplash.timeout == 15);
    REQUIRE_FALSE(config.upstreams.unsplash.insecure_skip_verify);
    REQUIRE(config.models.default_model == "gemini-3-pro-image-preview");
    REQUIRE(config.models.describe == "gemini-2.0-flash");
    REQUIRE(config.static_files.index == "index.html");
    REQUIRE(config.logging.output.empty());
}

TEST_CASE("Config JSON deserialization", "[control][config]") {
    const char* json = R"({
        "server": {"listen_port": 9000, "max_connections": 64},
        "upstreams": {
            "gemini": {"base_url": "http://127.0.0.1:7000/v1beta", "generate_timeout": 5},
            "unsplash": {"insecure_skip_verify": true}
        },
        "models": {"allowed": ["m-a", "m-b"], "default": "m-b"},
        "static": {"root": "/srv/www"},
        "logging": {"level": "debug", "format": "json", "output": "/var/log/easel.log"}
    })";

    auto maybe_config = ConfigLoader::load_from_json(json);
    REQUIRE(maybe_config.has_value());

    const auto& config = *maybe_config;
    REQUIRE(config.server.listen_port == 9000);
    REQUIRE(config.server.max_connections == 64);
    // Missing fields keep their defaults
    REQUIRE(config.server.listen_address == "127.0.0.1");
    REQUIRE(config.upstreams.gemini.base_url == "http://127.0.0.1:7000/v1beta");
    REQUIRE(config.upstreams.gemini.generate_timeout == 5);
    REQUIRE(config.upstreams.gemini.describe_timeout == 30);
    REQUIRE(config.upstreams.unsplash.insecure_skip_verify);
    REQUIRE(config.upstreams.giphy.base_url == "https://api.giphy.com/v1/gifs");
    REQUIRE(config.models.allowed == std::vector<std::string>{"m-a", "m-b"});
    REQUIRE(config.models.default_model == "m-b");
    REQUIRE(config.static_files.root == "/srv/www");
    REQUIRE(config.logging.format == "json");
}

TEST_CASE("Config loading failures", "[control][config]") {
    REQUIRE_FALSE(ConfigLoader::load_from_json("{ not json").has_value());
    REQUIRE_FALSE(ConfigLoader::load_from_json("[1, 2]").has_value());
    REQUIRE_FALSE(ConfigLoader::load_from_json(R"({"server": {"listen_port": "eighty"}})")
                      .has_value());
    REQUIRE_FALSE(ConfigLoader::load_from_file("/nonexistent/easel.json").has_value());
}

TEST_CASE("Config file loading", "[control][config]") {
    auto path = std::filesystem::temp_directory_path() / "easel_config_test.json";
    std::ofstream(path) << R"({"server": {"listen_port": 8181}})";

    auto config = ConfigLoader::load_from_file(path.string());
    REQUIRE(config.has_value());
    REQUIRE(config->server.listen_port == 8181);

    std::filesystem::remove(path);
}

TEST_CASE("Secrets never come from or go to JSON", "[control][config][secrets]") {
    auto config = ConfigLoader::load_from_json(
        R"({"secrets": {"gemini_api_key": "from-file"}, "gemini_api_key": "x"})");
    REQUIRE(config.has_value());
    REQUIRE(config->secrets.gemini_api_key.empty());

    Config with_secrets = config_with_secrets();
    with_secrets.secrets.gemini_api_key = "super-secret-value";
    std::string json = ConfigLoader::to_json(with_secrets);
    REQUIRE_FALSE(json.empty());
    REQUIRE(json.find("super-secret-value") == std::string::npos);
    REQUIRE(json.find("secrets") == std::string::npos);
}

TEST_CASE("Config serialization round trip", "[control][config]") {
    Config config;
    config.server.listen_port = 9999;
    config.models.allowed = {"a", "b"};
    config.models.default_model = "b";

    auto reloaded = ConfigLoader::load_from_json(ConfigLoader::to_json(config));
    REQUIRE(reloaded.has_value());
    REQUIRE(reloaded->server.listen_port == 9999);
    REQUIRE(reloaded->models.allowed == config.models.allowed);
    REQUIRE(reloaded->models.default_model == "b");
    REQUIRE(reloaded->static_files.no_cache_extensions == config.static_files.no_cache_extensions);
}

TEST_CASE("Secrets from the environment", "[control][config][secrets]") {
    ::setenv(kGeminiApiKeyEnv, "env-gemini", 1);
    ::setenv(kUnsplashAccessKeyEnv, "env-unsplash", 1);
    ::unsetenv(kGiphyApiKeyEnv);

    Config config;
    ConfigLoader::apply_environment(config);

    REQUIRE(config.secrets.gemini_api_key == "env-gemini");
    REQUIRE(config.secrets.unsplash_access_key == "env-unsplash");
    REQUIRE(config.secrets.giphy_api_key.empty());

    ::unsetenv(kGeminiApiKeyEnv);
    ::unsetenv(kUnsplashAccessKeyEnv);
}

TEST_CASE("Config validation - valid config", "[control][config][validation]") {
    auto result = ConfigLoader::validate(config_with_secrets());
    REQUIRE(result.valid);
    REQUIRE(result.errors.empty());
    REQUIRE(result.warnings.empty());
}

TEST_CASE("Config validation - errors", "[control][config][validation]") {
    Config config = config_with_secrets();

    SECTION("Port 0") {
        config.server.listen_port = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.has_errors());
        REQUIRE(has_message(result.errors, "listen_port"));
    }

    SECTION("Zero size limits") {
        config.server.max_request_size = 0;
        config.server.max_header_size = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE(has_message(result.errors, "max_request_size"));
        REQUIRE(has_message(result.errors, "max_header_size"));
    }

    SECTION("Empty allowed models") {
        config.models.allowed.clear();
        auto result = ConfigLoader::validate(config);
        REQUIRE(has_message(result.errors, "models.allowed cannot be empty"));
    }

    SECTION("Default model not allowed, with suggestion") {
        config.models.default_model = "gemini-3-pro-image-previw";
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.has_errors());
        REQUIRE(has_message(result.errors, "is not in models.allowed"));
        REQUIRE(has_message(result.errors, "Did you mean: gemini-3-pro-image-preview?"));
    }

    SECTION("Default model with nothing similar") {
        config.models.default_model = "x";
        auto result = ConfigLoader::validate(config);
        REQUIRE(has_message(result.errors, "is not in models.allowed"));
        REQUIRE_FALSE(has_message(result.errors, "Did you mean"));
    }

    SECTION("Bad base URLs") {
        config.upstreams.giphy.base_url = "";
        config.upstreams.unsplash.base_url = "ftp://api.unsplash.com";
        auto result = ConfigLoader::validate(config);
        REQUIRE(has_message(result.errors, "upstreams.giphy.base_url cannot be empty"));
        REQUIRE(has_message(result.errors, "upstreams.unsplash.base_url 'ftp://api.unsplash.com'"));
    }

    SECTION("Zero timeouts") {
        config.upstreams.gemini.describe_timeout = 0;
        config.upstreams.giphy.timeout = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE(has_message(result.errors, "upstreams.gemini timeouts"));
        REQUIRE(has_message(result.errors, "upstreams.giphy timeout"));
    }

    SECTION("Unknown log level and format") {
        config.logging.level = "verbose";
        config.logging.format = "xml";
        auto result = ConfigLoader::validate(config);
        REQUIRE(has_message(result.errors, "Unknown logging level 'verbose'"));
        REQUIRE(has_message(result.errors, "Unknown logging format 'xml'"));
    }
}

TEST_CASE("Config validation - warnings", "[control][config][validation]") {
    Config config;  // No secrets
    config.upstreams.unsplash.insecure_skip_verify = true;

    auto result = ConfigLoader::validate(config);
    REQUIRE(result.valid);
    REQUIRE(has_message(result.warnings, "GEMINI_API_KEY is not set"));
    REQUIRE(has_message(result.warnings, "UNSPLASH_ACCESS_KEY is not set"));
    REQUIRE(has_message(result.warnings, "GIPHY_API_KEY is not set"));
    REQUIRE(has_message(result.warnings, "insecure_skip_verify"));
}

TEST_CASE("Edit distance suggestions", "[control][string_utils]") {
    using easel::core::find_similar_strings;
    using easel::core::levenshtein_distance;

    REQUIRE(levenshtein_distance("kitten", "sitting") == 3);
    REQUIRE(levenshtein_distance("", "abc") == 3);
    REQUIRE(levenshtein_distance("same", "same") == 0);

    std::vector<std::string> models = {"gemini-2.0-flash", "gemini-2.5-flash", "imagen-3"};
    auto suggestions = find_similar_strings("gemini-2.0-flsh", models, 3);
    REQUIRE_FALSE(suggestions.empty());
    REQUIRE(suggestions.front() == "gemini-2.0-flash");
}
