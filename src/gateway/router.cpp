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

// Easel Router - Implementation

#include "router.hpp"

namespace easel::gateway {

void Router::add_route(Route route) {
    routes_.push_back(std::move(route));
}

RouteMatch Router::match(http::Method method, std::string_view path) const {
    for (const auto& route : routes_) {
        if (route.method != http::Method::UNKNOWN && route.method != method) {
            continue;
        }

        switch (route.kind) {
            case MatchKind::Exact:
                if (path == route.path) {
                    return RouteMatch{route.handler_id, {}};
                }
                break;
            case MatchKind::Prefix:
                if (path.starts_with(route.path)) {
                    return RouteMatch{route.handler_id, path.substr(route.path.size())};
                }
                break;
            case MatchKind::Any:
                return RouteMatch{route.handler_id, path};
        }
    }

    return RouteMatch{};
}

void Router::clear() {
    routes_.clear();
}

std::string_view to_string(HandlerId id) noexcept {
    switch (id) {
        case HandlerId::None:
            return "none";
        case HandlerId::Generate:
            return "generate";
        case HandlerId::DescribeImage:
            return "describe-image";
        case HandlerId::GeminiLegacy:
            return "gemini-legacy";
        case HandlerId::ImageSearch:
            return "image-search";
        case HandlerId::GifSearch:
            return "gif-search";
        case HandlerId::CorsPreflight:
            return "cors-preflight";
        case HandlerId::StaticFile:
            return "static";
        case HandlerId::NotFound:
            return "not-found";
        case HandlerId::NotImplemented:
            return "not-implemented";
    }
    return "none";
}

}  // namespace easel::gateway
