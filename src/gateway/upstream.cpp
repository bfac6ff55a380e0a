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

// Easel Upstream - Implementation

#include "upstream.hpp"

#include <httplib.h>

#include <chrono>
#include <exception>

#include "../core/logging.hpp"
#include "../http/url.hpp"

namespace easel::gateway {

std::string_view ProxyTarget::header(std::string_view name) const noexcept {
    for (const auto& [hdr_name, hdr_value] : headers) {
        if (http::header_name_equals(hdr_name, name)) {
            return hdr_value;
        }
    }
    return {};
}

UpstreamResult HttpUpstreamClient::send(const ProxyTarget& target) {
    UpstreamResult result;

    auto split = http::split_url(target.url);
    if (!split.has_value()) {
        result.error = "Upstream request failed: invalid upstream URL";
        return result;
    }

    try {
        httplib::Client client(split->origin);
        auto timeout_s = static_cast<time_t>(target.timeout.count());
        client.set_connection_timeout(timeout_s, 0);
        client.set_read_timeout(timeout_s, 0);
        client.set_write_timeout(timeout_s, 0);
        // Paths and queries are already percent-encoded
        client.set_url_encode(false);
        client.enable_server_certificate_verification(target.verify_tls);

        httplib::Headers headers;
        std::string content_type = "application/json";
        for (const auto& [name, value] : target.headers) {
            if (http::header_name_equals(name, "Content-Type")) {
                content_type = value;
                continue;
            }
            headers.emplace(name, value);
        }

        auto* logger = logging::get_current_logger();
        LOG_DEBUG(logger, "Upstream request: upstream={}, method={}, url={}", target.upstream,
                  http::to_string(target.method), http::redact_url(target.url));

        httplib::Result res = (target.method == http::Method::POST)
                                  ? client.Post(split->path_and_query, headers, target.body,
                                                content_type)
                                  : client.Get(split->path_and_query, headers);

        if (!res) {
            result.error = "Upstream request failed: " + httplib::to_string(res.error());
            return result;
        }

        result.ok = true;
        result.status = static_cast<uint16_t>(res->status);
        result.body = std::move(res->body);
        if (res->has_header("Content-Type")) {
            result.content_type = res->get_header_value("Content-Type");
        }
        return result;
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = std::string("Upstream request failed: ") + e.what();
        return result;
    }
}

}  // namespace easel::gateway
