/*
 * Copyright 2025 Easel Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Easel Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace easel::control {

/// Listener and connection settings
struct ServerConfig {
    // Network settings
    std::string listen_address = "127.0.0.1";
    uint16_t listen_port = 8080;
    uint32_t backlog = 128;

    // Timeouts (milliseconds)
    uint32_t idle_timeout = 30000;      // Wait for request bytes
    uint32_t shutdown_timeout = 30000;  // Drain in-flight connections

    // Limits
    uint32_t max_connections = 0;            // 0 = unbounded
    uint32_t max_request_size = 33554432;    // 32MB (image payloads)
    uint32_t max_header_size = 16384;        // 16KB
};

/// Generative language API (generate, describe, legacy passthrough)
struct GeminiUpstreamConfig {
    std::string base_url = "https://generativelanguage.googleapis.com/v1beta";
    std::string legacy_host = "https://generativelanguage.googleapis.com";
    uint32_t generate_timeout = 120;  // seconds
    uint32_t describe_timeout = 30;   // seconds
};

/// Image search API
struct UnsplashUpstreamConfig {
    std::string base_url = "https://api.unsplash.com";
    uint32_t timeout = 15;  // seconds
    bool insecure_skip_verify = false;  // Development only
};

/// GIF search API
struct GiphyUpstreamConfig {
    std::string base_url = "https://api.giphy.com/v1/gifs";
    uint32_t timeout = 15;  // seconds
};

struct UpstreamsConfig {
    GeminiUpstreamConfig gemini;
    UnsplashUpstreamConfig unsplash;
    GiphyUpstreamConfig giphy;
};

/// Model whitelist for the generate route
struct ModelsConfig {
    std::vector<std::string> allowed = {"gemini-3-pro-image-preview"};
    std::string default_model = "gemini-3-pro-image-preview";
    std::string describe = "gemini-2.0-flash";
};

/// Static file fallback
struct StaticConfig {
    std::string root = ".";
    std::string index = "index.html";
    std::vector<std::string> no_cache_extensions = {".js", ".css", ".html"};
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";  // debug, info, warning, error
    std::string format = "text";  // json, text
    std::string output;           // Log file path, empty = console

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Credentials injected into upstream requests.
/// Populated from the environment only; never serialized.
struct SecretsConfig {
    std::string gemini_api_key;
    std::string unsplash_access_key;
    std::string giphy_api_key;
};

/// Full Easel configuration
struct Config {
    ServerConfig server;
    UpstreamsConfig upstreams;
    ModelsConfig models;
    StaticConfig static_files;
    LogConfig logging;

    SecretsConfig secrets;
};

// Custom from_json functions to handle missing fields with defaults

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    s.listen_address = j.value("listen_address", std::string("127.0.0.1"));
    s.listen_port = j.value("listen_port", uint16_t(8080));
    s.backlog = j.value("backlog", 128u);
    s.idle_timeout = j.value("idle_timeout", 30000u);
    s.shutdown_timeout = j.value("shutdown_timeout", 30000u);
    s.max_connections = j.value("max_connections", 0u);
    s.max_request_size = j.value("max_request_size", 33554432u);
    s.max_header_size = j.value("max_header_size", 16384u);
}

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"listen_address", s.listen_address},
                       {"listen_port", s.listen_port},
                       {"backlog", s.backlog},
                       {"idle_timeout", s.idle_timeout},
                       {"shutdown_timeout", s.shutdown_timeout},
                       {"max_connections", s.max_connections},
                       {"max_request_size", s.max_request_size},
                       {"max_header_size", s.max_header_size}};
}

inline void from_json(const nlohmann::json& j, GeminiUpstreamConfig& g) {
    g.base_url =
        j.value("base_url", std::string("https://generativelanguage.googleapis.com/v1beta"));
    g.legacy_host =
        j.value("legacy_host", std::string("https://generativelanguage.googleapis.com"));
    g.generate_timeout = j.value("generate_timeout", 120u);
    g.describe_timeout = j.value("describe_timeout", 30u);
}

inline void to_json(nlohmann::json& j, const GeminiUpstreamConfig& g) {
    j = nlohmann::json{{"base_url", g.base_url},
                       {"legacy_host", g.legacy_host},
                       {"generate_timeout", g.generate_timeout},
                       {"describe_timeout", g.describe_timeout}};
}

inline void from_json(const nlohmann::json& j, UnsplashUpstreamConfig& u) {
    u.base_url = j.value("base_url", std::string("https://api.unsplash.com"));
    u.timeout = j.value("timeout", 15u);
    u.insecure_skip_verify = j.value("insecure_skip_verify", false);
}

inline void to_json(nlohmann::json& j, const UnsplashUpstreamConfig& u) {
    j = nlohmann::json{{"base_url", u.base_url},
                       {"timeout", u.timeout},
                       {"insecure_skip_verify", u.insecure_skip_verify}};
}

inline void from_json(const nlohmann::json& j, GiphyUpstreamConfig& g) {
    g.base_url = j.value("base_url", std::string("https://api.giphy.com/v1/gifs"));
    g.timeout = j.value("timeout", 15u);
}

inline void to_json(nlohmann::json& j, const GiphyUpstreamConfig& g) {
    j = nlohmann::json{{"base_url", g.base_url}, {"timeout", g.timeout}};
}

inline void from_json(const nlohmann::json& j, UpstreamsConfig& u) {
    u.gemini = j.value("gemini", GeminiUpstreamConfig{});
    u.unsplash = j.value("unsplash", UnsplashUpstreamConfig{});
    u.giphy = j.value("giphy", GiphyUpstreamConfig{});
}

inline void to_json(nlohmann::json& j, const UpstreamsConfig& u) {
    j = nlohmann::json{{"gemini", u.gemini}, {"unsplash", u.unsplash}, {"giphy", u.giphy}};
}

inline void from_json(const nlohmann::json& j, ModelsConfig& m) {
    m.allowed = j.value("allowed", std::vector<std::string>{"gemini-3-pro-image-preview"});
    m.default_model = j.value("default", std::string("gemini-3-pro-image-preview"));
    m.describe = j.value("describe", std::string("gemini-2.0-flash"));
}

inline void to_json(nlohmann::json& j, const ModelsConfig& m) {
    j = nlohmann::json{
        {"allowed", m.allowed}, {"default", m.default_model}, {"describe", m.describe}};
}

inline void from_json(const nlohmann::json& j, StaticConfig& s) {
    s.root = j.value("root", std::string("."));
    s.index = j.value("index", std::string("index.html"));
    s.no_cache_extensions =
        j.value("no_cache_extensions", std::vector<std::string>{".js", ".css", ".html"});
}

inline void to_json(nlohmann::json& j, const StaticConfig& s) {
    j = nlohmann::json{
        {"root", s.root}, {"index", s.index}, {"no_cache_extensions", s.no_cache_extensions}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string());
    l.rotation = j.value("rotation", LogConfig::RotationConfig{});
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

// Secrets are intentionally absent: they come from the environment only
inline void from_json(const nlohmann::json& j, Config& c) {
    c.server = j.value("server", ServerConfig{});
    c.upstreams = j.value("upstreams", UpstreamsConfig{});
    c.models = j.value("models", ModelsConfig{});
    c.static_files = j.value("static", StaticConfig{});
    c.logging = j.value("logging", LogConfig{});
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{{"server", c.server},
                       {"upstreams", c.upstreams},
                       {"models", c.models},
                       {"static", c.static_files},
                       {"logging", c.logging}};
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Environment variable names holding the upstream credentials
inline constexpr const char* kGeminiApiKeyEnv = "GEMINI_API_KEY";
inline constexpr const char* kUnsplashAccessKeyEnv = "UNSPLASH_ACCESS_KEY";
inline constexpr const char* kGiphyApiKeyEnv = "GIPHY_API_KEY";

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file (parse only; call validate() afterwards)
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string (parse only; call validate() afterwards)
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Convert configuration to JSON string (secrets excluded)
    [[nodiscard]] static std::string to_json(const Config& config);

    /// Copy upstream credentials from the process environment into config.secrets
    static void apply_environment(Config& config);
};

}  // namespace easel::control
