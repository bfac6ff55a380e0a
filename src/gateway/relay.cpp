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

// Easel Response Relay - Implementation

#include "relay.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

#include "../core/socket.hpp"

namespace easel::gateway {

http::Response make_json_error(Envelope envelope, http::StatusCode status,
                               std::string_view message) {
    nlohmann::json body;
    if (envelope == Envelope::Nested) {
        body["error"]["message"] = std::string(message);
    } else {
        body["error"] = std::string(message);
    }

    http::Response response;
    response.status = status;
    response.set_content_type("application/json");
    // Replace rather than throw on invalid UTF-8 echoed from the client
    response.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    add_cors_headers(response);
    return response;
}

http::Response relay_upstream(UpstreamResult result, Envelope envelope) {
    if (!result.ok) {
        return make_json_error(envelope, http::StatusCode::BadGateway, result.error);
    }

    http::Response response;
    response.status = static_cast<http::StatusCode>(result.status);
    response.set_content_type(result.content_type.empty() ? std::string_view("application/json")
                                                          : std::string_view(result.content_type));
    response.body = std::move(result.body);
    add_cors_headers(response);
    return response;
}

void add_cors_headers(http::Response& response) {
    response.set_header("Access-Control-Allow-Origin", "*");
}

http::Response make_preflight_response() {
    http::Response response;
    response.status = http::StatusCode::OK;
    add_cors_headers(response);
    response.add_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    response.add_header("Access-Control-Allow-Headers", "Content-Type");
    response.add_header("Access-Control-Max-Age", "86400");
    return response;
}

std::error_code write_response(int fd, const http::Response& response) {
    std::string wire = http::serialize_response(response);
    return core::send_all(fd, std::span<const char>(wire.data(), wire.size()));
}

}  // namespace easel::gateway
