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

// Easel HTTP Parser - Implementation

#include "parser.hpp"

#include <algorithm>

namespace easel::http {

namespace {

Method method_from_llhttp(uint8_t method) noexcept {
    switch (method) {
        case HTTP_GET: return Method::GET;
        case HTTP_HEAD: return Method::HEAD;
        case HTTP_POST: return Method::POST;
        case HTTP_OPTIONS: return Method::OPTIONS;
        case HTTP_PUT: return Method::PUT;
        case HTTP_DELETE: return Method::DELETE;
        case HTTP_PATCH: return Method::PATCH;
        case HTTP_CONNECT: return Method::CONNECT;
        case HTTP_TRACE: return Method::TRACE;
        default: return Method::UNKNOWN;
    }
}

Version version_from_llhttp(uint8_t major, uint8_t minor) noexcept {
    if (major != 1) return Version::UNKNOWN;
    if (minor == 0) return Version::HTTP_1_0;
    if (minor == 1) return Version::HTTP_1_1;
    return Version::UNKNOWN;
}

// "/path?query#fragment" -> path, query. curl sends fragments verbatim.
void split_target(std::string_view target, Request& request) {
    target = target.substr(0, target.find('#'));

    size_t query_pos = target.find('?');
    if (query_pos == std::string_view::npos) {
        request.path = target;
        request.query = {};
        return;
    }
    request.path = target.substr(0, query_pos);
    request.query = target.substr(query_pos + 1);
}

size_t offset_of(const char* pos, std::span<const uint8_t> data) noexcept {
    if (pos == nullptr) return data.size();
    return static_cast<size_t>(reinterpret_cast<const uint8_t*>(pos) - data.data());
}

}  // namespace

Parser::Parser() {
    llhttp_settings_init(&settings_);
    settings_.on_url = on_url;
    settings_.on_header_field = on_header_field;
    settings_.on_header_value = on_header_value;
    settings_.on_headers_complete = on_headers_complete;
    settings_.on_body = on_body;
    settings_.on_message_complete = on_message_complete;

    llhttp_init(&parser_, HTTP_REQUEST, &settings_);
    parser_.data = this;
}

std::pair<ParseResult, size_t> Parser::parse_request(std::span<const uint8_t> data,
                                                     Request& request) {
    request_ = &request;

    llhttp_errno_t err =
        llhttp_execute(&parser_, reinterpret_cast<const char*>(data.data()), data.size());

    // on_message_complete pauses, leaving any bytes after the request unread
    if (err == HPE_PAUSED) {
        return {ParseResult::Complete, offset_of(llhttp_get_error_pos(&parser_), data)};
    }
    if (err != HPE_OK) {
        error_ = err;
        return {ParseResult::Error, offset_of(llhttp_get_error_pos(&parser_), data)};
    }
    return {complete_ ? ParseResult::Complete : ParseResult::Incomplete, data.size()};
}

std::string_view Parser::error_message() const noexcept {
    if (error_ == HPE_OK) {
        return {};
    }
    return llhttp_errno_name(error_);
}

// Callbacks

int Parser::on_url(llhttp_t* parser, const char* at, size_t length) {
    Request& request = *self(parser).request_;
    request.uri = std::string_view(at, length);
    split_target(request.uri, request);
    return 0;
}

int Parser::on_header_field(llhttp_t* parser, const char* at, size_t length) {
    Parser& p = self(parser);
    if (p.request_->headers.size() >= kMaxHeaderCount) {
        llhttp_set_error_reason(parser, "too many headers");
        return HPE_USER;
    }
    p.pending_field_ = std::string_view(at, length);
    return 0;
}

int Parser::on_header_value(llhttp_t* parser, const char* at, size_t length) {
    Parser& p = self(parser);
    p.request_->headers.push_back({p.pending_field_, std::string_view(at, length)});
    return 0;
}

int Parser::on_headers_complete(llhttp_t* parser) {
    Request& request = *self(parser).request_;
    request.method = method_from_llhttp(llhttp_get_method(parser));
    request.version = version_from_llhttp(parser->http_major, parser->http_minor);
    return 0;
}

int Parser::on_body(llhttp_t* parser, const char* at, size_t length) {
    Request& request = *self(parser).request_;
    const auto* piece = reinterpret_cast<const uint8_t*>(at);

    // A Content-Length body is one contiguous piece of the input
    if (request.body.empty() && request.body_storage.empty()) {
        request.body = std::span<const uint8_t>(piece, length);
        return 0;
    }

    // Chunked: the pieces are separated by framing, so gather them
    if (request.body_storage.empty()) {
        request.body_storage.assign(request.body.begin(), request.body.end());
    }
    request.body_storage.insert(request.body_storage.end(), piece, piece + length);
    request.body = std::span<const uint8_t>(request.body_storage);
    return 0;
}

int Parser::on_message_complete(llhttp_t* parser) {
    self(parser).complete_ = true;
    return HPE_PAUSED;
}

std::optional<size_t> find_header_end(std::span<const uint8_t> data) noexcept {
    static constexpr uint8_t kTerminator[] = {'\r', '\n', '\r', '\n'};
    auto it = std::search(data.begin(), data.end(), std::begin(kTerminator), std::end(kTerminator));
    if (it == data.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - data.begin()) + sizeof(kTerminator);
}

std::optional<Request> parse_http_request(std::span<const uint8_t> data) {
    Parser parser;
    Request request;
    auto [result, consumed] = parser.parse_request(data, request);
    if (result != ParseResult::Complete) {
        return std::nullopt;
    }
    return request;
}

} // namespace easel::http
