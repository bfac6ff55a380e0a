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

// Easel URL Utilities - Implementation

#include "url.hpp"

#include <array>

namespace easel::http {

namespace url {

std::string encode(std::string_view str) {
    std::string encoded;
    encoded.reserve(str.size() * 3);

    for (unsigned char c : str) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '!' || c == '~' || c == '*' || c == '\'' ||
            c == '(' || c == ')') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += "0123456789ABCDEF"[c >> 4];
            encoded += "0123456789ABCDEF"[c & 0x0F];
        }
    }

    return encoded;
}

static int hex_digit_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

std::optional<std::string> decode(std::string_view str, bool plus_as_space) {
    std::string decoded;
    decoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%') {
            if (i + 2 >= str.size()) {
                return std::nullopt;  // Incomplete percent sequence
            }

            int high = hex_digit_value(str[i + 1]);
            int low = hex_digit_value(str[i + 2]);
            if (high < 0 || low < 0) {
                return std::nullopt;
            }

            decoded += static_cast<char>((high << 4) | low);
            i += 2;
        } else if (str[i] == '+' && plus_as_space) {
            decoded += ' ';
        } else {
            decoded += str[i];
        }
    }

    return decoded;
}

}  // namespace url

QueryParams parse_query(std::string_view query) {
    QueryParams params;

    size_t start = 0;
    while (start < query.size()) {
        size_t amp_pos = query.find('&', start);
        std::string_view pair = (amp_pos == std::string_view::npos)
                                    ? query.substr(start)
                                    : query.substr(start, amp_pos - start);

        if (!pair.empty()) {
            size_t eq_pos = pair.find('=');
            std::string_view raw_key = pair.substr(0, eq_pos);
            std::string_view raw_value =
                (eq_pos == std::string_view::npos) ? std::string_view{} : pair.substr(eq_pos + 1);

            auto key = url::decode(raw_key);
            auto value = url::decode(raw_value);
            params.insert_or_assign(key.value_or(std::string(raw_key)),
                                    value.value_or(std::string(raw_value)));
        }

        if (amp_pos == std::string_view::npos) {
            break;
        }
        start = amp_pos + 1;
    }

    return params;
}

std::string query_value(const QueryParams& params, const std::string& key,
                        std::string_view default_value) {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) {
        return std::string(default_value);
    }
    return it->second;
}

std::optional<SplitUrl> split_url(std::string_view url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::nullopt;
    }

    std::string_view scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        return std::nullopt;
    }

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?", host_start);
    std::string_view authority = (path_start == std::string_view::npos)
                                     ? url.substr(host_start)
                                     : url.substr(host_start, path_start - host_start);
    if (authority.empty()) {
        return std::nullopt;
    }

    SplitUrl result;
    result.origin = std::string(url.substr(0, host_start + authority.size()));
    if (path_start == std::string_view::npos) {
        result.path_and_query = "/";
    } else if (url[path_start] == '?') {
        result.path_and_query = "/" + std::string(url.substr(path_start));
    } else {
        result.path_and_query = std::string(url.substr(path_start));
    }
    return result;
}

std::string redact_url(std::string_view url) {
    static constexpr std::array<std::string_view, 3> kSecretParams = {"key", "client_id",
                                                                      "api_key"};

    size_t query_pos = url.find('?');
    if (query_pos == std::string_view::npos) {
        return std::string(url);
    }

    std::string out(url.substr(0, query_pos + 1));
    std::string_view query = url.substr(query_pos + 1);

    size_t start = 0;
    bool first = true;
    while (start <= query.size()) {
        size_t amp_pos = query.find('&', start);
        std::string_view pair = (amp_pos == std::string_view::npos)
                                    ? query.substr(start)
                                    : query.substr(start, amp_pos - start);

        if (!first) {
            out += '&';
        }
        first = false;

        size_t eq_pos = pair.find('=');
        std::string_view name = pair.substr(0, eq_pos);
        bool secret = false;
        for (auto candidate : kSecretParams) {
            if (name == candidate) {
                secret = true;
                break;
            }
        }

        if (secret && eq_pos != std::string_view::npos) {
            out += name;
            out += "=REDACTED";
        } else {
            out += pair;
        }

        if (amp_pos == std::string_view::npos) {
            break;
        }
        start = amp_pos + 1;
    }

    return out;
}

}  // namespace easel::http
