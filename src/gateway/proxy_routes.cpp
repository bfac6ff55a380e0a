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

// Easel Proxy Routes - Implementation

#include "proxy_routes.hpp"

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <algorithm>

#include "../http/url.hpp"

namespace easel::gateway {

namespace {

constexpr std::string_view kLegacyPrefix = "/api/gemini";

// Key order of the client's JSON is kept when re-serializing
using OrderedJson = nlohmann::ordered_json;

std::optional<OrderedJson> parse_json_object(const http::Request& request) {
    try {
        auto j = OrderedJson::parse(request.body_view());
        if (!j.is_object()) {
            return std::nullopt;
        }
        return j;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

http::Response bad_request(Envelope envelope, std::string_view message) {
    return make_json_error(envelope, http::StatusCode::BadRequest, message);
}

http::Response missing_secret(Envelope envelope, std::string_view what) {
    return make_json_error(envelope, http::StatusCode::InternalServerError,
                           fmt::format("Server misconfigured: missing {}", what));
}

ProxyTarget make_json_post(std::string upstream, std::string url, std::string body,
                           std::chrono::seconds timeout) {
    ProxyTarget target;
    target.upstream = std::move(upstream);
    target.url = std::move(url);
    target.method = http::Method::POST;
    target.headers.emplace_back("Content-Type", "application/json");
    target.body = std::move(body);
    target.timeout = timeout;
    return target;
}

ProxyTarget make_json_get(std::string upstream, std::string url, std::chrono::seconds timeout,
                          bool verify_tls) {
    ProxyTarget target;
    target.upstream = std::move(upstream);
    target.url = std::move(url);
    target.method = http::Method::GET;
    target.headers.emplace_back("Accept", "application/json");
    target.timeout = timeout;
    target.verify_tls = verify_tls;
    return target;
}

}  // namespace

std::optional<DataUrl> parse_data_url(std::string_view value) noexcept {
    constexpr std::string_view kScheme = "data:";
    constexpr std::string_view kMarker = ";base64,";

    if (!value.starts_with(kScheme)) {
        return std::nullopt;
    }

    std::string_view rest = value.substr(kScheme.size());
    size_t semicolon = rest.find(';');
    if (semicolon == std::string_view::npos || semicolon == 0) {
        return std::nullopt;
    }

    std::string_view mime = rest.substr(0, semicolon);
    std::string_view tail = rest.substr(semicolon);
    if (!tail.starts_with(kMarker)) {
        return std::nullopt;
    }

    std::string_view data = tail.substr(kMarker.size());
    // Payload must be a single non-empty line
    if (data.empty() || data.find_first_of("\r\n") != std::string_view::npos) {
        return std::nullopt;
    }

    return DataUrl{mime, data};
}

ProxyRoutes::ProxyRoutes(control::Config config)
    : config_(std::move(config)), allowed_(config_.models.allowed) {}

BuildResult ProxyRoutes::build_generate(const http::Request& request) const {
    const auto& gemini = config_.upstreams.gemini;
    const auto& key = config_.secrets.gemini_api_key;
    if (key.empty()) {
        return BuildResult::reject(missing_secret(Envelope::Nested, "API key"));
    }

    auto body = parse_json_object(request);
    if (!body.has_value()) {
        return BuildResult::reject(bad_request(Envelope::Nested, "Invalid JSON body"));
    }

    if (!body->contains("contents") || !body->contains("generationConfig")) {
        return BuildResult::reject(bad_request(Envelope::Nested, "Missing required fields"));
    }

    std::string model = config_.models.default_model;
    auto model_it = body->find("model");
    if (model_it != body->end()) {
        bool is_string = model_it->is_string();
        model = is_string ? model_it->get<std::string>()
                          : model_it->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        body->erase(model_it);
        if (!is_string) {
            return BuildResult::reject(
                bad_request(Envelope::Nested, fmt::format("Model not allowed: {}", model)));
        }
    }

    if (!allowed_.contains(model)) {
        return BuildResult::reject(
            bad_request(Envelope::Nested, fmt::format("Model not allowed: {}", model)));
    }

    std::string url = fmt::format("{}/models/{}:generateContent?key={}", gemini.base_url, model,
                                  http::url::encode(key));

    return BuildResult::accept(make_json_post("gemini", std::move(url), body->dump(),
                                              std::chrono::seconds(gemini.generate_timeout)));
}

BuildResult ProxyRoutes::build_describe(const http::Request& request) const {
    const auto& gemini = config_.upstreams.gemini;
    const auto& key = config_.secrets.gemini_api_key;
    if (key.empty()) {
        return BuildResult::reject(missing_secret(Envelope::Nested, "API key"));
    }

    auto body = parse_json_object(request);
    if (!body.has_value()) {
        return BuildResult::reject(bad_request(Envelope::Nested, "Invalid JSON body"));
    }

    auto image_it = body->find("imageData");
    if (image_it == body->end() || !image_it->is_string() ||
        image_it->get_ref<const std::string&>().empty()) {
        return BuildResult::reject(bad_request(Envelope::Nested, "Missing imageData"));
    }

    const auto& image_data = image_it->get_ref<const std::string&>();
    auto data_url = parse_data_url(image_data);
    if (!data_url.has_value()) {
        return BuildResult::reject(bad_request(Envelope::Nested, "Invalid image data URL"));
    }

    OrderedJson text_part = {{"text", std::string(kDescribePrompt)}};
    OrderedJson image_part;
    image_part["inlineData"]["mimeType"] = std::string(data_url->mime_type);
    image_part["inlineData"]["data"] = std::string(data_url->data);

    OrderedJson content;
    content["parts"] = OrderedJson::array({text_part, image_part});

    OrderedJson payload;
    payload["contents"] = OrderedJson::array({content});
    payload["generationConfig"]["temperature"] = 0.2;
    payload["generationConfig"]["maxOutputTokens"] = 50;

    std::string url = fmt::format("{}/models/{}:generateContent?key={}", gemini.base_url,
                                  config_.models.describe, http::url::encode(key));

    return BuildResult::accept(make_json_post("gemini", std::move(url), payload.dump(),
                                              std::chrono::seconds(gemini.describe_timeout)));
}

BuildResult ProxyRoutes::build_legacy(const http::Request& request) const {
    const auto& gemini = config_.upstreams.gemini;

    std::string url = gemini.legacy_host;
    url += request.path.substr(std::min(kLegacyPrefix.size(), request.path.size()));
    if (!request.query.empty()) {
        url += '?';
        url += request.query;
    }

    return BuildResult::accept(make_json_post("gemini", std::move(url),
                                              std::string(request.body_view()),
                                              std::chrono::seconds(gemini.generate_timeout)));
}

BuildResult ProxyRoutes::build_image_search(const http::Request& request) const {
    const auto& unsplash = config_.upstreams.unsplash;
    const auto& key = config_.secrets.unsplash_access_key;
    if (key.empty()) {
        return BuildResult::reject(missing_secret(Envelope::Flat, control::kUnsplashAccessKeyEnv));
    }

    auto params = http::parse_query(request.query);
    std::string query = http::query_value(params, "query");
    std::string page = http::url::encode(http::query_value(params, "page", "1"));
    std::string per_page = http::url::encode(http::query_value(params, "per_page", "30"));

    std::string url;
    if (query.empty()) {
        url = fmt::format("{}/photos?page={}&per_page={}&order_by=popular&client_id={}",
                          unsplash.base_url, page, per_page, http::url::encode(key));
    } else {
        url = fmt::format("{}/search/photos?query={}&page={}&per_page={}&client_id={}",
                          unsplash.base_url, http::url::encode(query), page, per_page,
                          http::url::encode(key));
    }

    return BuildResult::accept(make_json_get("unsplash", std::move(url),
                                             std::chrono::seconds(unsplash.timeout),
                                             !unsplash.insecure_skip_verify));
}

BuildResult ProxyRoutes::build_gif_search(const http::Request& request) const {
    const auto& giphy = config_.upstreams.giphy;
    const auto& key = config_.secrets.giphy_api_key;
    if (key.empty()) {
        return BuildResult::reject(missing_secret(Envelope::Flat, control::kGiphyApiKeyEnv));
    }

    auto params = http::parse_query(request.query);
    std::string query = http::query_value(params, "query");
    std::string offset = http::url::encode(http::query_value(params, "offset", "0"));
    std::string limit = http::url::encode(http::query_value(params, "limit", "30"));

    std::string url;
    if (query.empty()) {
        url = fmt::format("{}/trending?offset={}&limit={}&api_key={}", giphy.base_url, offset,
                          limit, http::url::encode(key));
    } else {
        url = fmt::format("{}/search?q={}&offset={}&limit={}&api_key={}", giphy.base_url,
                          http::url::encode(query), offset, limit, http::url::encode(key));
    }

    return BuildResult::accept(
        make_json_get("giphy", std::move(url), std::chrono::seconds(giphy.timeout), true));
}

}  // namespace easel::gateway
