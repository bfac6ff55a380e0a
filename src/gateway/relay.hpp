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

// Easel Response Relay - Header

#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

#include "../http/http.hpp"
#include "upstream.hpp"

namespace easel::gateway {

/// Shape of locally generated JSON errors
enum class Envelope : uint8_t {
    Nested,  // {"error":{"message":"..."}}  (generate, describe-image, gemini)
    Flat     // {"error":"..."}              (unsplash, giphy)
};

/// Local JSON error response in the given envelope
[[nodiscard]] http::Response make_json_error(Envelope envelope, http::StatusCode status,
                                             std::string_view message);

/// Turn an upstream outcome into the client response.
/// Upstream statuses (errors included) and bodies pass through unchanged;
/// transport failures become 502 in the route's envelope.
[[nodiscard]] http::Response relay_upstream(UpstreamResult result, Envelope envelope);

/// Access-Control-Allow-Origin: * (every /api response)
void add_cors_headers(http::Response& response);

/// 200 answer to OPTIONS /api/*
[[nodiscard]] http::Response make_preflight_response();

/// Serialize and send the response. Disconnect-class errors are returned, not thrown.
[[nodiscard]] std::error_code write_response(int fd, const http::Response& response);

}  // namespace easel::gateway
