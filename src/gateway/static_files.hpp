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

// Easel Static Files - Header
// Document-root file serving for GET/HEAD requests outside /api

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../control/config.hpp"
#include "../http/http.hpp"

namespace easel::gateway {

/// Content type for a file name, application/octet-stream when unknown
[[nodiscard]] std::string_view mime_type_for(std::string_view filename);

class StaticFileHandler {
public:
    explicit StaticFileHandler(control::StaticConfig config);

    /// Serve a GET or HEAD request (HEAD gets headers only)
    [[nodiscard]] http::Response serve(const http::Request& request) const;

    /// Map a URL path to a file system path under the root.
    /// nullopt for bad percent-encoding or paths that climb above the root.
    [[nodiscard]] std::optional<std::filesystem::path> resolve(std::string_view url_path) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    [[nodiscard]] bool is_no_cache(const std::filesystem::path& file) const;

    std::filesystem::path root_;
    std::string index_;
    std::vector<std::string> no_cache_extensions_;
};

}  // namespace easel::gateway
