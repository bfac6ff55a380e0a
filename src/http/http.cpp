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

// Easel HTTP Protocol - Implementation

#include "http.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <string>

namespace easel::http {

// Request helper methods

const Header* Request::find_header(std::string_view name) const noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.name, name)) {
            return &header;
        }
    }
    return nullptr;
}

std::string_view Request::get_header(std::string_view name,
                                     std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? header->value : default_value;
}

bool Request::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

size_t Request::content_length() const noexcept {
    auto value = get_header("Content-Length", "0");
    size_t length = 0;
    std::from_chars(value.data(), value.data() + value.size(), length);
    return length;
}

// Response helper methods

std::string_view Response::get_header(std::string_view name) const noexcept {
    for (const auto& [hdr_name, hdr_value] : headers) {
        if (header_name_equals(hdr_name, name)) {
            return hdr_value;
        }
    }
    return {};
}

bool Response::has_header(std::string_view name) const noexcept {
    return std::any_of(headers.begin(), headers.end(), [name](const auto& pair) {
        return header_name_equals(pair.first, name);
    });
}

void Response::add_header(std::string_view name, std::string_view value) {
    headers.emplace_back(std::string(name), std::string(value));
}

void Response::set_header(std::string_view name, std::string_view value) {
    for (auto& [hdr_name, hdr_value] : headers) {
        if (header_name_equals(hdr_name, name)) {
            hdr_value = std::string(value);
            return;
        }
    }
    add_header(name, value);
}

bool Response::remove_header(std::string_view name) {
    auto it = std::remove_if(headers.begin(), headers.end(), [name](const auto& pair) {
        return header_name_equals(pair.first, name);
    });
    if (it == headers.end()) {
        return false;
    }
    headers.erase(it, headers.end());
    return true;
}

void Response::set_content_type(std::string_view content_type) {
    set_header("Content-Type", content_type);
}

// Conversion functions

namespace {

constexpr std::array<std::pair<Method, std::string_view>, 9> kMethodNames = {{
    {Method::GET, "GET"},
    {Method::POST, "POST"},
    {Method::PUT, "PUT"},
    {Method::DELETE, "DELETE"},
    {Method::HEAD, "HEAD"},
    {Method::OPTIONS, "OPTIONS"},
    {Method::PATCH, "PATCH"},
    {Method::CONNECT, "CONNECT"},
    {Method::TRACE, "TRACE"},
}};

// Own statuses plus the upstream ones clients are likely to see relayed
constexpr std::array<std::pair<uint16_t, std::string_view>, 15> kReasonPhrases = {{
    {100, "Continue"},
    {200, "OK"},
    {301, "Moved Permanently"},
    {400, "Bad Request"},
    {401, "Unauthorized"},
    {403, "Forbidden"},
    {404, "Not Found"},
    {413, "Payload Too Large"},
    {429, "Too Many Requests"},
    {431, "Request Header Fields Too Large"},
    {500, "Internal Server Error"},
    {501, "Not Implemented"},
    {502, "Bad Gateway"},
    {503, "Service Unavailable"},
    {504, "Gateway Timeout"},
}};

}  // namespace

std::string_view to_string(Method method) noexcept {
    for (const auto& [value, name] : kMethodNames) {
        if (value == method) return name;
    }
    return "UNKNOWN";
}

Method parse_method(std::string_view str) noexcept {
    for (const auto& [value, name] : kMethodNames) {
        if (name == str) return value;
    }
    return Method::UNKNOWN;
}

std::string_view to_string(Version version) noexcept {
    return version == Version::HTTP_1_0 ? "HTTP/1.0" : "HTTP/1.1";
}

std::string_view to_reason_phrase(StatusCode code) noexcept {
    auto value = static_cast<uint16_t>(code);
    for (const auto& [status, phrase] : kReasonPhrases) {
        if (status == value) return phrase;
    }

    if (value < 300) return "OK";
    if (value < 400) return "Redirection";
    if (value < 500) return "Client Error";
    return "Server Error";
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char c1, char c2) {
        return std::tolower(static_cast<unsigned char>(c1)) ==
               std::tolower(static_cast<unsigned char>(c2));
    });
}

std::string serialize_response(const Response& response) {
    std::string out;
    out.reserve(256 + (response.omit_body ? 0 : response.body.size()));

    out += fmt::format("{} {} {}\r\n", to_string(response.version), response.status_code(),
                       to_reason_phrase(response.status));

    for (const auto& [name, value] : response.headers) {
        // Framing headers are owned by the serializer
        if (header_name_equals(name, "Content-Length") || header_name_equals(name, "Connection") ||
            header_name_equals(name, "Transfer-Encoding")) {
            continue;
        }
        out += name;
        out += ": ";
        out += value;
        out += "\r\n";
    }

    out += fmt::format("Content-Length: {}\r\n", response.body.size());
    out += "Connection: close\r\n\r\n";

    if (!response.omit_body) {
        out += response.body;
    }
    return out;
}

Response make_error_page(StatusCode status, std::string_view message) {
    Response response;
    response.status = status;
    response.set_content_type("text/html;charset=utf-8");
    response.body = fmt::format(
        "<!DOCTYPE HTML>\n"
        "<html lang=\"en\">\n"
        "    <head>\n"
        "        <meta charset=\"utf-8\">\n"
        "        <title>Error response</title>\n"
        "    </head>\n"
        "    <body>\n"
        "        <h1>Error response</h1>\n"
        "        <p>Error code: {}</p>\n"
        "        <p>Message: {}.</p>\n"
        "    </body>\n"
        "</html>\n",
        static_cast<uint16_t>(status), message);
    return response;
}

}  // namespace easel::http
