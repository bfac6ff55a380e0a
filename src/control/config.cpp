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

// Easel Configuration - Implementation

#include "config.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "../core/string_utils.hpp"

namespace easel::control {

static void validate_base_url(const std::string& url, const std::string& field,
                              ValidationResult& result) {
    if (url.empty()) {
        result.add_error(field + " cannot be empty");
        return;
    }
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
        result.add_error(field + " '" + url + "' must start with http:// or https://");
    }
}

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open config file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            fprintf(stderr, "JSON parsing error: top-level value must be an object\n");
            return std::nullopt;
        }
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Server
    if (config.server.listen_port == 0) {
        result.add_error("Server listen_port must be > 0");
    }

    if (config.server.max_request_size == 0) {
        result.add_error("Server max_request_size must be > 0");
    }

    if (config.server.max_header_size == 0) {
        result.add_error("Server max_header_size must be > 0");
    }

    if (config.server.idle_timeout == 0) {
        result.add_error("Server idle_timeout must be > 0");
    }

    // Models
    const auto& models = config.models;
    if (models.allowed.empty()) {
        result.add_error("models.allowed cannot be empty");
    } else if (std::find(models.allowed.begin(), models.allowed.end(), models.default_model) ==
               models.allowed.end()) {
        std::string error =
            "Default model '" + models.default_model + "' is not in models.allowed";
        auto suggestions = core::find_similar_strings(models.default_model, models.allowed, 3);
        if (!suggestions.empty()) {
            error += ". Did you mean: " + core::join(suggestions, ", ") + "?";
        }
        result.add_error(std::move(error));
    }

    if (models.describe.empty()) {
        result.add_error("models.describe cannot be empty");
    }

    // Upstreams
    const auto& upstreams = config.upstreams;
    validate_base_url(upstreams.gemini.base_url, "upstreams.gemini.base_url", result);
    validate_base_url(upstreams.gemini.legacy_host, "upstreams.gemini.legacy_host", result);
    validate_base_url(upstreams.unsplash.base_url, "upstreams.unsplash.base_url", result);
    validate_base_url(upstreams.giphy.base_url, "upstreams.giphy.base_url", result);

    if (upstreams.gemini.generate_timeout == 0 || upstreams.gemini.describe_timeout == 0) {
        result.add_error("upstreams.gemini timeouts must be > 0");
    }
    if (upstreams.unsplash.timeout == 0) {
        result.add_error("upstreams.unsplash timeout must be > 0");
    }
    if (upstreams.giphy.timeout == 0) {
        result.add_error("upstreams.giphy timeout must be > 0");
    }

    if (upstreams.unsplash.insecure_skip_verify) {
        result.add_warning(
            "upstreams.unsplash.insecure_skip_verify is on: TLS certificates are not verified");
    }

    // Static files
    if (config.static_files.root.empty()) {
        result.add_error("static.root cannot be empty");
    }

    // Logging
    std::string level = core::to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warning" && level != "warn" &&
        level != "error") {
        result.add_error("Unknown logging level '" + config.logging.level + "'");
    }
    if (config.logging.format != "text" && config.logging.format != "json") {
        result.add_error("Unknown logging format '" + config.logging.format + "'");
    }

    // Secrets (missing ones only disable the routes that need them)
    if (config.secrets.gemini_api_key.empty()) {
        result.add_warning(std::string(kGeminiApiKeyEnv) +
                           " is not set: generate and describe-image routes answer 500");
    }
    if (config.secrets.unsplash_access_key.empty()) {
        result.add_warning(std::string(kUnsplashAccessKeyEnv) +
                           " is not set: unsplash route answers 500");
    }
    if (config.secrets.giphy_api_key.empty()) {
        result.add_warning(std::string(kGiphyApiKeyEnv) + " is not set: giphy route answers 500");
    }

    return result;
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);
    } catch (const nlohmann::json::exception&) {
        return "";
    }
}

void ConfigLoader::apply_environment(Config& config) {
    auto read = [](const char* name) -> std::string {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string();
    };

    config.secrets.gemini_api_key = read(kGeminiApiKeyEnv);
    config.secrets.unsplash_access_key = read(kUnsplashAccessKeyEnv);
    config.secrets.giphy_api_key = read(kGiphyApiKeyEnv);
}

}  // namespace easel::control
