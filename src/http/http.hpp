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

// Easel HTTP Protocol - Header
// Request views into the connection buffer, owned responses

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace easel::http {

enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

enum class Version : uint8_t { HTTP_1_0, HTTP_1_1, UNKNOWN };

/// Status codes the server produces itself. Relayed upstream statuses
/// travel through the same type with values outside the enumerators.
enum class StatusCode : uint16_t {
    OK = 200,
    MovedPermanently = 301,

    BadRequest = 400,
    NotFound = 404,
    PayloadTooLarge = 413,
    RequestHeaderFieldsTooLarge = 431,

    InternalServerError = 500,
    NotImplemented = 501,
    BadGateway = 502,
    ServiceUnavailable = 503,
};

/// Views into the request buffer
struct Header {
    std::string_view name;
    std::string_view value;
};

/// HTTP request (views into the connection's receive buffer)
struct Request {
    Method method = Method::UNKNOWN;
    Version version = Version::HTTP_1_1;

    std::string_view uri;
    std::string_view path;   // URI without query string
    std::string_view query;  // Query string (if present)

    std::vector<Header> headers;

    // Body view. Points into the receive buffer for Content-Length bodies,
    // into body_storage when a chunked body arrived in several pieces.
    std::span<const uint8_t> body;
    std::vector<uint8_t> body_storage;

    /// First header with this name, compared case-insensitively
    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    /// 0 when absent or not a number
    [[nodiscard]] size_t content_length() const noexcept;

    [[nodiscard]] std::string_view body_view() const noexcept {
        return {reinterpret_cast<const char*>(body.data()), body.size()};
    }
};

/// HTTP response (owns everything it sends)
struct Response {
    Version version = Version::HTTP_1_1;
    StatusCode status = StatusCode::OK;

    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    // HEAD responses keep Content-Length of the body but do not send it
    bool omit_body = false;

    /// Empty when absent
    [[nodiscard]] std::string_view get_header(std::string_view name) const noexcept;

    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    /// Appends; duplicates are kept
    void add_header(std::string_view name, std::string_view value);

    void set_header(std::string_view name, std::string_view value);

    /// True when at least one header was removed
    bool remove_header(std::string_view name);

    void set_content_type(std::string_view content_type);

    [[nodiscard]] uint16_t status_code() const noexcept { return static_cast<uint16_t>(status); }
};

// Conversion functions

[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Exact, case-sensitive match on the method token
[[nodiscard]] Method parse_method(std::string_view str) noexcept;

[[nodiscard]] std::string_view to_string(Version version) noexcept;

/// Codes without a known phrase get a generic one for their class
[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

/// Serialize status line, headers (Content-Length and Connection: close added)
/// and body into wire format
[[nodiscard]] std::string serialize_response(const Response& response);

/// Build the server's default error page (used for 404/501 etc.)
[[nodiscard]] Response make_error_page(StatusCode status, std::string_view message);

}  // namespace easel::http
