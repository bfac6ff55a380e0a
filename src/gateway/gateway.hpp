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

// Easel Gateway - Header
// Request dispatch: route match -> validate/transform -> upstream -> relay

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "../http/http.hpp"
#include "proxy_routes.hpp"
#include "relay.hpp"
#include "router.hpp"
#include "static_files.hpp"
#include "upstream.hpp"

namespace easel::gateway {

/// Per-request data carried through dispatch and into logs
struct RequestContext {
    const http::Request* request = nullptr;
    std::string client_ip;
    std::string correlation_id;
    HandlerId handler = HandlerId::None;
};

/// Immutable after construction; shared by every connection thread
class Gateway {
public:
    Gateway(std::unique_ptr<Router> router, ProxyRoutes routes, StaticFileHandler static_files,
            std::shared_ptr<UpstreamClient> upstream_client);

    // Non-copyable, non-movable
    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    /// Produce the response for one request. Never throws for bad client input.
    [[nodiscard]] http::Response handle(RequestContext& ctx) const;

    [[nodiscard]] const Router& router() const noexcept { return *router_; }

private:
    [[nodiscard]] http::Response forward(BuildResult plan, Envelope envelope,
                                         const RequestContext& ctx) const;

    std::unique_ptr<Router> router_;
    ProxyRoutes routes_;
    StaticFileHandler static_files_;
    std::shared_ptr<UpstreamClient> upstream_client_;
};

/// True for paths under /api (these responses always carry CORS headers)
[[nodiscard]] bool is_api_path(std::string_view path) noexcept;

}  // namespace easel::gateway
