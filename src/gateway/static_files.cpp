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

// Easel Static Files - Implementation

#include "static_files.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#include "../core/string_utils.hpp"
#include "../http/url.hpp"

namespace easel::gateway {

std::string_view mime_type_for(std::string_view filename) {
    size_t dot_pos = filename.rfind('.');
    if (dot_pos == std::string_view::npos) {
        return "application/octet-stream";
    }

    std::string ext = core::to_lower(filename.substr(dot_pos));
    auto is = [&ext](std::string_view candidate) { return ext == candidate; };

    if (is(".html") || is(".htm")) return "text/html";
    if (is(".css")) return "text/css";
    if (is(".js") || is(".mjs")) return "text/javascript";
    if (is(".json") || is(".map")) return "application/json";
    if (is(".svg")) return "image/svg+xml";
    if (is(".png")) return "image/png";
    if (is(".jpg") || is(".jpeg")) return "image/jpeg";
    if (is(".gif")) return "image/gif";
    if (is(".webp")) return "image/webp";
    if (is(".ico")) return "image/x-icon";
    if (is(".woff")) return "font/woff";
    if (is(".woff2")) return "font/woff2";
    if (is(".ttf")) return "font/ttf";
    if (is(".txt")) return "text/plain";
    if (is(".wasm")) return "application/wasm";
    return "application/octet-stream";
}

StaticFileHandler::StaticFileHandler(control::StaticConfig config)
    : index_(std::move(config.index)),
      no_cache_extensions_(std::move(config.no_cache_extensions)) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(config.root, ec);
    root_ = ec ? std::filesystem::path(config.root) : absolute.lexically_normal();
}

std::optional<std::filesystem::path> StaticFileHandler::resolve(std::string_view url_path) const {
    auto decoded = http::url::decode(url_path, false);
    if (!decoded.has_value() || decoded->find('\0') != std::string::npos) {
        return std::nullopt;
    }

    // Normalize segment by segment; ".." may not climb above the root
    std::vector<std::string_view> segments;
    std::string_view rest = *decoded;
    while (!rest.empty()) {
        size_t slash = rest.find('/');
        std::string_view segment = rest.substr(0, slash);
        rest = (slash == std::string_view::npos) ? std::string_view{} : rest.substr(slash + 1);

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (segments.empty()) {
                return std::nullopt;
            }
            segments.pop_back();
            continue;
        }
        if (segment.find('\\') != std::string_view::npos) {
            return std::nullopt;
        }
        segments.push_back(segment);
    }

    std::filesystem::path resolved = root_;
    for (auto segment : segments) {
        resolved /= std::string(segment);
    }
    return resolved;
}

bool StaticFileHandler::is_no_cache(const std::filesystem::path& file) const {
    std::string name = file.filename().string();
    for (const auto& ext : no_cache_extensions_) {
        if (core::iends_with(name, ext)) {
            return true;
        }
    }
    return false;
}

http::Response StaticFileHandler::serve(const http::Request& request) const {
    auto not_found = [&request]() {
        http::Response response = http::make_error_page(http::StatusCode::NotFound, "File not found");
        response.omit_body = request.method == http::Method::HEAD;
        return response;
    };

    auto resolved = resolve(request.path);
    if (!resolved.has_value()) {
        return not_found();
    }

    std::filesystem::path file = *resolved;
    std::error_code ec;
    if (std::filesystem::is_directory(file, ec)) {
        if (!request.path.ends_with('/')) {
            http::Response redirect;
            redirect.status = http::StatusCode::MovedPermanently;
            std::string location = std::string(request.path) + "/";
            if (!request.query.empty()) {
                location += "?";
                location += request.query;
            }
            redirect.set_header("Location", location);
            redirect.omit_body = request.method == http::Method::HEAD;
            return redirect;
        }
        file /= index_;
    }

    if (!std::filesystem::is_regular_file(file, ec)) {
        return not_found();
    }

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return not_found();
    }

    http::Response response;
    response.status = http::StatusCode::OK;
    response.body.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return not_found();
    }

    response.set_content_type(mime_type_for(file.filename().string()));
    if (is_no_cache(file)) {
        response.set_header("Cache-Control", "no-cache");
    }
    response.omit_body = request.method == http::Method::HEAD;
    return response;
}

}  // namespace easel::gateway
