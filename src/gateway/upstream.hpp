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

// Easel Upstream - Header
// One outbound HTTP request per proxied call (no pooling, no retries)

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../http/http.hpp"

namespace easel::gateway {

/// Fully resolved outbound request
struct ProxyTarget {
    std::string upstream;  // Upstream name for logs ("gemini", "unsplash", "giphy")
    std::string url;       // Absolute URL, credentials already injected
    http::Method method = http::Method::GET;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::seconds timeout{15};
    bool verify_tls = true;

    /// Value of an outbound header (case-insensitive), empty if absent
    [[nodiscard]] std::string_view header(std::string_view name) const noexcept;
};

/// Outcome of one upstream call
/// ok == false means a transport failure (DNS, connect, TLS, timeout); error holds the cause.
/// ok == true carries whatever status the upstream answered, errors included.
struct UpstreamResult {
    bool ok = false;
    uint16_t status = 0;
    std::string content_type = "application/json";
    std::string body;
    std::string error;
};

/// Outbound HTTP seam (replaced by a recording fake in tests)
class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;

    /// Perform the request, blocking up to target.timeout
    [[nodiscard]] virtual UpstreamResult send(const ProxyTarget& target) = 0;
};

/// UpstreamClient backed by cpp-httplib (HTTPS through OpenSSL)
class HttpUpstreamClient : public UpstreamClient {
public:
    HttpUpstreamClient() = default;

    [[nodiscard]] UpstreamResult send(const ProxyTarget& target) override;
};

}  // namespace easel::gateway
