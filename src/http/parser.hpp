// Easel HTTP Parser - Header
// One-shot request parser on top of llhttp

#pragma once

#include "http.hpp"

#include <llhttp.h>

#include <cstddef>
#include <optional>
#include <span>
#include <utility>

namespace easel::http {

/// Headers accepted per request before the parser gives up
inline constexpr size_t kMaxHeaderCount = 100;

enum class ParseResult : uint8_t {
    Complete,      // Request fully parsed
    Incomplete,    // Need more data
    Error          // Parse error
};

/// Parses a single HTTP/1.x request out of a contiguous buffer.
/// The views stored in the Request point into that buffer, so it has to
/// outlive the Request. Feed the whole buffer each time: a parser is used
/// for one attempt and then discarded.
class Parser {
public:
    Parser();

    // llhttp keeps a pointer back into this object
    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    /// Returns the result and the number of bytes belonging to the request
    [[nodiscard]] std::pair<ParseResult, size_t> parse_request(std::span<const uint8_t> data,
                                                               Request& request);

    /// llhttp's name for the failure, empty when nothing failed
    [[nodiscard]] std::string_view error_message() const noexcept;

    [[nodiscard]] llhttp_errno_t error_code() const noexcept { return error_; }

private:
    static int on_url(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value(llhttp_t* parser, const char* at, size_t length);
    static int on_headers_complete(llhttp_t* parser);
    static int on_body(llhttp_t* parser, const char* at, size_t length);
    static int on_message_complete(llhttp_t* parser);

    static Parser& self(llhttp_t* parser) { return *static_cast<Parser*>(parser->data); }

    llhttp_t parser_;
    llhttp_settings_t settings_;

    Request* request_ = nullptr;
    std::string_view pending_field_;
    bool complete_ = false;
    llhttp_errno_t error_ = HPE_OK;
};

/// Offset just past the "\r\n\r\n" ending the header block, if it has arrived
[[nodiscard]] std::optional<size_t> find_header_end(std::span<const uint8_t> data) noexcept;

/// Parse a complete request in one call; std::nullopt on error or short input
[[nodiscard]] std::optional<Request> parse_http_request(std::span<const uint8_t> data);

} // namespace easel::http
