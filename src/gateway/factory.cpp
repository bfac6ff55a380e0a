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

// Gateway Component Factory - Implementation

#include "factory.hpp"

namespace easel::gateway {

std::unique_ptr<Router> build_router() {
    auto router = std::make_unique<Router>();

    // Proxied API routes
    router->add_route(RouteBuilder("/api/generate")
                          .method(http::Method::POST)
                          .exact()
                          .handler(HandlerId::Generate)
                          .build());
    router->add_route(RouteBuilder("/api/describe-image")
                          .method(http::Method::POST)
                          .exact()
                          .handler(HandlerId::DescribeImage)
                          .build());
    router->add_route(RouteBuilder("/api/gemini/")
                          .method(http::Method::POST)
                          .prefix()
                          .handler(HandlerId::GeminiLegacy)
                          .build());
    router->add_route(RouteBuilder("/api/unsplash")
                          .method(http::Method::GET)
                          .prefix()
                          .handler(HandlerId::ImageSearch)
                          .build());
    router->add_route(RouteBuilder("/api/giphy")
                          .method(http::Method::GET)
                          .prefix()
                          .handler(HandlerId::GifSearch)
                          .build());
    router->add_route(RouteBuilder("/api/")
                          .method(http::Method::OPTIONS)
                          .prefix()
                          .handler(HandlerId::CorsPreflight)
                          .build());

    // Fallbacks
    router->add_route(
        RouteBuilder("").method(http::Method::GET).any_path().handler(HandlerId::StaticFile).build());
    router->add_route(RouteBuilder("")
                          .method(http::Method::HEAD)
                          .any_path()
                          .handler(HandlerId::StaticFile)
                          .build());
    router->add_route(
        RouteBuilder("").method(http::Method::POST).any_path().handler(HandlerId::NotFound).build());
    router->add_route(RouteBuilder("")
                          .method(http::Method::OPTIONS)
                          .any_path()
                          .handler(HandlerId::NotFound)
                          .build());
    router->add_route(RouteBuilder("").any_path().handler(HandlerId::NotImplemented).build());

    return router;
}

std::shared_ptr<UpstreamClient> build_upstream_client() {
    return std::make_shared<HttpUpstreamClient>();
}

std::unique_ptr<Gateway> build_gateway(const control::Config& config,
                                       std::shared_ptr<UpstreamClient> upstream_client) {
    if (!upstream_client) {
        upstream_client = build_upstream_client();
    }

    return std::make_unique<Gateway>(build_router(), ProxyRoutes(config),
                                     StaticFileHandler(config.static_files),
                                     std::move(upstream_client));
}

}  // namespace easel::gateway
