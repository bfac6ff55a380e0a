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

// Easel Proxy Routes - Header
// Per-route validation and outbound request construction

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "../control/config.hpp"
#include "../http/http.hpp"
#include "relay.hpp"
#include "upstream.hpp"

namespace easel::gateway {

/// Prompt sent with every describe-image request
inline constexpr std::string_view kDescribePrompt =
    "Describe this image in 3-5 short English keywords suitable for searching similar images. "
    "Return ONLY the keywords separated by commas, nothing else.";

/// Immutable whitelist of generation models
class AllowedModelSet {
public:
    explicit AllowedModelSet(const std::vector<std::string>& models)
        : models_(models.begin(), models.end()) {}

    [[nodiscard]] bool contains(std::string_view model) const {
        return models_.find(std::string(model)) != models_.end();
    }

    [[nodiscard]] size_t size() const noexcept { return models_.size(); }

private:
    std::unordered_set<std::string> models_;
};

/// Outbound request, or the local response that replaces it
struct BuildResult {
    std::optional<ProxyTarget> target;
    http::Response rejection;

    [[nodiscard]] bool ok() const noexcept { return target.has_value(); }

    static BuildResult accept(ProxyTarget t) {
        BuildResult r;
        r.target = std::move(t);
        return r;
    }

    static BuildResult reject(http::Response response) {
        BuildResult r;
        r.rejection = std::move(response);
        return r;
    }
};

/// Parsed "data:<mime>;base64,<payload>" URL
struct DataUrl {
    std::string_view mime_type;
    std::string_view data;
};

/// Split a base64 data URL; nullopt when it does not have that shape
[[nodiscard]] std::optional<DataUrl> parse_data_url(std::string_view value) noexcept;

/// Builds ProxyTargets for every proxied route. Immutable after construction.
class ProxyRoutes {
public:
    explicit ProxyRoutes(control::Config config);

    /// POST /api/generate
    [[nodiscard]] BuildResult build_generate(const http::Request& request) const;

    /// POST /api/describe-image
    [[nodiscard]] BuildResult build_describe(const http::Request& request) const;

    /// POST /api/gemini/<suffix>
    [[nodiscard]] BuildResult build_legacy(const http::Request& request) const;

    /// GET /api/unsplash
    [[nodiscard]] BuildResult build_image_search(const http::Request& request) const;

    /// GET /api/giphy
    [[nodiscard]] BuildResult build_gif_search(const http::Request& request) const;

    [[nodiscard]] const AllowedModelSet& allowed_models() const noexcept { return allowed_; }

private:
    control::Config config_;
    AllowedModelSet allowed_;
};

}  // namespace easel::gateway
