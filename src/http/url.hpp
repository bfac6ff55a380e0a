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

// Easel URL Utilities - Header
// Percent-encoding, query strings and upstream URL handling

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace easel::http {

namespace url {

/// Percent-encode a query component
/// Leaves A-Z a-z 0-9 - _ . ! ~ * ' ( ) untouched, like a browser's encodeURIComponent
[[nodiscard]] std::string encode(std::string_view str);

/// Percent-decode a string
/// When plus_as_space is set, '+' decodes to ' ' (form/query encoding)
/// Returns nullopt if invalid encoding (e.g., incomplete % sequence)
[[nodiscard]] std::optional<std::string> decode(std::string_view str, bool plus_as_space = true);

}  // namespace url

/// Decoded query parameters. Duplicate keys: the last value wins.
using QueryParams = std::unordered_map<std::string, std::string>;

/// Parse a raw query string ("a=1&b=2") into decoded parameters
/// Pairs whose encoding is invalid keep their raw text
[[nodiscard]] QueryParams parse_query(std::string_view query);

/// Lookup with default, treating an absent key and a missing value alike
[[nodiscard]] std::string query_value(const QueryParams& params, const std::string& key,
                                      std::string_view default_value = {});

/// Absolute URL split for an HTTP client: "https://host:port" + "/path?query"
struct SplitUrl {
    std::string origin;
    std::string path_and_query;
};

/// Split an absolute http(s) URL; nullopt when the scheme or host is missing
[[nodiscard]] std::optional<SplitUrl> split_url(std::string_view url);

/// Copy of url with the values of credential-bearing query parameters
/// (key, client_id, api_key) replaced by "REDACTED"
[[nodiscard]] std::string redact_url(std::string_view url);

}  // namespace easel::http
