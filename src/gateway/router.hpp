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

// Easel Router - Header
// Ordered routing table: first matching (method, path) entry wins

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "../http/http.hpp"

namespace easel::gateway {

/// How a route's path is compared against the request path
enum class MatchKind : uint8_t {
    Exact,   // path == route.path
    Prefix,  // path starts with route.path
    Any      // every path (fallback rows)
};

/// Handlers the dispatcher knows about
enum class HandlerId : uint8_t {
    None,
    Generate,
    DescribeImage,
    GeminiLegacy,
    ImageSearch,
    GifSearch,
    CorsPreflight,
    StaticFile,
    NotFound,
    NotImplemented
};

/// Match result from router
struct RouteMatch {
    HandlerId handler_id = HandlerId::None;
    std::string_view remainder;  // Part of the path after a prefix route

    [[nodiscard]] bool matched() const noexcept { return handler_id != HandlerId::None; }
};

/// Route definition
struct Route {
    std::string path;
    http::Method method = http::Method::UNKNOWN;  // UNKNOWN = any method
    MatchKind kind = MatchKind::Exact;
    HandlerId handler_id = HandlerId::None;
};

/// Router over an ordered route table
class Router {
public:
    Router() = default;

    // Non-copyable, movable
    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;
    Router(Router&&) noexcept = default;
    Router& operator=(Router&&) noexcept = default;

    /// Append a route (checked after every route added before it)
    void add_route(Route route);

    /// Find the first route matching method and path (query string excluded)
    [[nodiscard]] RouteMatch match(http::Method method, std::string_view path) const;

    /// Get all registered routes
    [[nodiscard]] const std::vector<Route>& routes() const noexcept { return routes_; }

    /// Clear all routes
    void clear();

private:
    std::vector<Route> routes_;
};

/// Route builder (fluent API)
class RouteBuilder {
public:
    explicit RouteBuilder(std::string path) {
        route_.path = std::move(path);
        route_.method = http::Method::UNKNOWN;
    }

    RouteBuilder& method(http::Method m) {
        route_.method = m;
        return *this;
    }

    RouteBuilder& exact() {
        route_.kind = MatchKind::Exact;
        return *this;
    }

    RouteBuilder& prefix() {
        route_.kind = MatchKind::Prefix;
        return *this;
    }

    RouteBuilder& any_path() {
        route_.kind = MatchKind::Any;
        return *this;
    }

    RouteBuilder& handler(HandlerId id) {
        route_.handler_id = id;
        return *this;
    }

    Route build() { return std::move(route_); }

private:
    Route route_;
};

/// Handler name for logs
[[nodiscard]] std::string_view to_string(HandlerId id) noexcept;

}  // namespace easel::gateway
