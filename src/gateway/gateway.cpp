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

// Easel Gateway - Implementation

#include "gateway.hpp"

#include <fmt/format.h>

#include <chrono>
#include <utility>

#include "../core/logging.hpp"
#include "../http/url.hpp"

namespace easel::gateway {

bool is_api_path(std::string_view path) noexcept {
    return path == "/api" || path.starts_with("/api/");
}

Gateway::Gateway(std::unique_ptr<Router> router, ProxyRoutes routes,
                 StaticFileHandler static_files, std::shared_ptr<UpstreamClient> upstream_client)
    : router_(std::move(router)),
      routes_(std::move(routes)),
      static_files_(std::move(static_files)),
      upstream_client_(std::move(upstream_client)) {}

http::Response Gateway::handle(RequestContext& ctx) const {
    const http::Request& request = *ctx.request;
    auto match = router_->match(request.method, request.path);
    ctx.handler = match.handler_id;

    http::Response response;
    switch (match.handler_id) {
        case HandlerId::Generate:
            response = forward(routes_.build_generate(request), Envelope::Nested, ctx);
            break;
        case HandlerId::DescribeImage:
            response = forward(routes_.build_describe(request), Envelope::Nested, ctx);
            break;
        case HandlerId::GeminiLegacy:
            response = forward(routes_.build_legacy(request), Envelope::Nested, ctx);
            break;
        case HandlerId::ImageSearch:
            response = forward(routes_.build_image_search(request), Envelope::Flat, ctx);
            break;
        case HandlerId::GifSearch:
            response = forward(routes_.build_gif_search(request), Envelope::Flat, ctx);
            break;
        case HandlerId::CorsPreflight:
            response = make_preflight_response();
            break;
        case HandlerId::StaticFile:
            response = static_files_.serve(request);
            break;
        case HandlerId::NotFound:
            response = http::make_error_page(http::StatusCode::NotFound, "Not Found");
            break;
        case HandlerId::NotImplemented:
        case HandlerId::None:
            response = http::make_error_page(
                http::StatusCode::NotImplemented,
                fmt::format("Unsupported method ('{}')", http::to_string(request.method)));
            break;
    }

    if (is_api_path(request.path)) {
        add_cors_headers(response);
    }
    return response;
}

http::Response Gateway::forward(BuildResult plan, Envelope envelope,
                                const RequestContext& ctx) const {
    auto* logger = logging::get_current_logger();

    if (!plan.ok()) {
        LOG_INFO(logger, "Request rejected locally: handler={}, status={}, correlation_id={}",
                 to_string(ctx.handler), plan.rejection.status_code(), ctx.correlation_id);
        return std::move(plan.rejection);
    }

    const ProxyTarget& target = *plan.target;
    std::string redacted = http::redact_url(target.url);

    auto start = std::chrono::steady_clock::now();
    UpstreamResult result = upstream_client_->send(target);
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - start)
                          .count();

    if (result.ok) {
        LOG_UPSTREAM(logger, "response", target.upstream, redacted, result.status,
                     ctx.correlation_id);
        LOG_DEBUG(logger, "Upstream latency: upstream={}, elapsed_ms={}, correlation_id={}",
                  target.upstream, elapsed_ms, ctx.correlation_id);
    } else {
        LOG_ERROR_CTX(logger, "Upstream request failed", ctx.correlation_id, 502,
                      fmt::format("upstream={}, url={}, elapsed_ms={}, cause={}", target.upstream,
                                  redacted, elapsed_ms, result.error));
    }

    return relay_upstream(std::move(result), envelope);
}

}  // namespace easel::gateway
