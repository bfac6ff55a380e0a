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

// Easel Server - Implementation

#include "server.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <exception>
#include <optional>
#include <string_view>
#include <thread>

#include "../gateway/gateway.hpp"
#include "../gateway/relay.hpp"
#include "../http/parser.hpp"
#include "logging.hpp"
#include "socket.hpp"

namespace easel::core {

namespace {

constexpr size_t kReadChunkSize = 16384;
constexpr int kAcceptPollMs = 200;
constexpr auto kDrainPollInterval = std::chrono::milliseconds(50);
constexpr std::string_view kContinueResponse = "HTTP/1.1 100 Continue\r\n\r\n";

/// Releases the connection slot and the socket on every exit path
class ConnectionGuard {
public:
    ConnectionGuard(std::shared_ptr<ServerShared> shared, int fd)
        : shared_(std::move(shared)), fd_(fd) {}

    ~ConnectionGuard() {
        // Half-close first so the peer sees the full response before FIN
        ::shutdown(fd_, SHUT_WR);
        close_fd(fd_);
        shared_->in_flight.fetch_sub(1, std::memory_order_acq_rel);
    }

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

private:
    std::shared_ptr<ServerShared> shared_;
    int fd_;
};

ReadStatus classify_read_error(const std::error_code& ec) {
    if (is_timeout_error(ec)) return ReadStatus::Timeout;
    if (is_disconnect_error(ec)) return ReadStatus::Disconnected;
    return ReadStatus::IoError;
}

/// Append one recv() worth of bytes to buffer
ReadStatus read_more(int fd, std::vector<uint8_t>& buffer) {
    size_t old_size = buffer.size();
    buffer.resize(old_size + kReadChunkSize);

    std::error_code ec;
    size_t n = recv_some(
        fd, std::span<char>(reinterpret_cast<char*>(buffer.data() + old_size), kReadChunkSize),
        ec);
    buffer.resize(old_size + n);

    if (ec) return classify_read_error(ec);
    if (n == 0) return ReadStatus::Closed;
    return ReadStatus::Complete;
}

bool is_chunked(const http::Request& request) {
    std::string_view te = request.get_header("Transfer-Encoding");
    return !te.empty() && te.find("chunked") != std::string_view::npos;
}

bool expects_continue(const http::Request& request) {
    return http::header_name_equals(request.get_header("Expect"), "100-continue");
}

std::string_view status_reason(ReadStatus status) {
    switch (status) {
        case ReadStatus::Malformed: return "Bad request syntax";
        case ReadStatus::HeaderTooLarge: return "Request header fields too large";
        case ReadStatus::BodyTooLarge: return "Request entity too large";
        default: return "";
    }
}

http::StatusCode status_for(ReadStatus status) {
    switch (status) {
        case ReadStatus::Malformed: return http::StatusCode::BadRequest;
        case ReadStatus::HeaderTooLarge: return http::StatusCode::RequestHeaderFieldsTooLarge;
        case ReadStatus::BodyTooLarge: return http::StatusCode::PayloadTooLarge;
        default: return http::StatusCode::InternalServerError;
    }
}

/// Path of the request line in a rejected request; empty when unreadable
std::string_view sniff_request_path(const std::vector<uint8_t>& buffer) {
    std::string_view raw(reinterpret_cast<const char*>(buffer.data()), buffer.size());
    raw = raw.substr(0, raw.find("\r\n"));

    size_t start = raw.find(' ');
    if (start == std::string_view::npos) {
        return {};
    }
    std::string_view target = raw.substr(start + 1);
    target = target.substr(0, target.find(' '));
    return target.substr(0, target.find_first_of("?#"));
}

/// Error page for a request the gateway never saw. API callers still get
/// CORS so the browser exposes the status; when the path is unknown (the
/// request was never read) the header is always added.
http::Response make_early_response(http::StatusCode status, std::string_view message,
                                   std::optional<std::string_view> path) {
    http::Response response = http::make_error_page(status, message);
    if (!path || gateway::is_api_path(*path)) {
        gateway::add_cors_headers(response);
    }
    return response;
}

/// Best-effort write of a response produced before a request was parsed
void send_early_response(int fd, const http::Response& response) {
    auto ec = gateway::write_response(fd, response);
    if (ec) {
        LOG_DEBUG(logging::get_current_logger(), "Early response not delivered: fd={}, error={}",
                  fd, ec.message());
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// Request reading
// ---------------------------------------------------------------------------

ReadStatus read_request(int fd, const control::ServerConfig& config, std::vector<uint8_t>& buffer,
                        http::Request& request) {
    buffer.clear();

    // Header block
    std::optional<size_t> header_end;
    while (!(header_end = http::find_header_end(buffer))) {
        if (buffer.size() > config.max_header_size) {
            return ReadStatus::HeaderTooLarge;
        }
        ReadStatus status = read_more(fd, buffer);
        if (status != ReadStatus::Complete) {
            return status;
        }
    }
    if (*header_end > config.max_header_size) {
        return ReadStatus::HeaderTooLarge;
    }

    // Look at the headers alone to size the body
    http::Request head;
    {
        http::Parser parser;
        auto [result, consumed] = parser.parse_request(
            std::span<const uint8_t>(buffer.data(), *header_end), head);
        if (result == http::ParseResult::Error) {
            return ReadStatus::Malformed;
        }
    }

    bool chunked = is_chunked(head);
    size_t content_length = chunked ? 0 : head.content_length();
    if (content_length > config.max_request_size) {
        return ReadStatus::BodyTooLarge;
    }

    if (expects_continue(head) && (chunked || content_length > 0)) {
        if (auto ec = send_all(fd, std::span<const char>(kContinueResponse.data(),
                                                         kContinueResponse.size()));
            ec) {
            return is_disconnect_error(ec) ? ReadStatus::Disconnected : ReadStatus::IoError;
        }
    }

    if (!chunked) {
        size_t total = *header_end + content_length;
        buffer.reserve(total);
        while (buffer.size() < total) {
            ReadStatus status = read_more(fd, buffer);
            if (status != ReadStatus::Complete) {
                return status;
            }
        }
    }

    // Parse the complete message; chunked bodies are re-parsed until the
    // terminating chunk has arrived
    while (true) {
        request = http::Request{};
        http::Parser parser;
        auto [result, consumed] =
            parser.parse_request(std::span<const uint8_t>(buffer.data(), buffer.size()), request);

        if (result == http::ParseResult::Complete) {
            return ReadStatus::Complete;
        }
        if (result == http::ParseResult::Error) {
            return ReadStatus::Malformed;
        }
        if (buffer.size() - *header_end > config.max_request_size) {
            return ReadStatus::BodyTooLarge;
        }

        ReadStatus status = read_more(fd, buffer);
        if (status != ReadStatus::Complete) {
            return status;
        }
    }
}

// ---------------------------------------------------------------------------
// Connection handling
// ---------------------------------------------------------------------------

void handle_connection(std::shared_ptr<ServerShared> shared, int client_fd, bool over_limit) {
    ConnectionGuard guard(shared, client_fd);
    auto* logger = logging::get_current_logger();

    try {
        // Bounds reads and writes alike: a client that stops reading must not
        // hold the thread past the idle timeout
        if (auto ec = set_io_timeout(
                client_fd, std::chrono::milliseconds(shared->config.idle_timeout));
            ec) {
            LOG_WARNING(logger, "Failed to set socket timeouts: fd={}, error={}", client_fd,
                        ec.message());
        }

        if (over_limit) {
            LOG_WARNING(logger, "Connection limit reached: max_connections={}",
                        shared->config.max_connections);
            send_early_response(client_fd,
                                make_early_response(http::StatusCode::ServiceUnavailable,
                                                    "Server busy, try again later", std::nullopt));
            return;
        }

        std::string client_ip = peer_address(client_fd);
        auto start = std::chrono::steady_clock::now();

        std::vector<uint8_t> buffer;
        http::Request request;
        ReadStatus status = read_request(client_fd, shared->config, buffer, request);

        switch (status) {
            case ReadStatus::Complete:
                break;
            case ReadStatus::Closed:
                LOG_DEBUG(logger, "Client closed before sending a request: client_ip={}",
                          client_ip);
                return;
            case ReadStatus::Timeout:
                LOG_DEBUG(logger, "Idle timeout: client_ip={}, timeout_ms={}", client_ip,
                          shared->config.idle_timeout);
                return;
            case ReadStatus::Disconnected:
                LOG_INFO(logger, "Client disconnected while sending request: client_ip={}",
                         client_ip);
                return;
            case ReadStatus::IoError:
                LOG_WARNING(logger, "Read error: client_ip={}", client_ip);
                return;
            case ReadStatus::Malformed:
            case ReadStatus::HeaderTooLarge:
            case ReadStatus::BodyTooLarge:
                LOG_INFO(logger, "Rejected request: client_ip={}, status={}", client_ip,
                         static_cast<int>(status_for(status)));
                send_early_response(client_fd,
                                    make_early_response(status_for(status), status_reason(status),
                                                        sniff_request_path(buffer)));
                return;
        }

        gateway::RequestContext ctx;
        ctx.request = &request;
        ctx.client_ip = client_ip;
        ctx.correlation_id = logging::generate_correlation_id();

        http::Response response = shared->gateway->handle(ctx);

        if (auto ec = gateway::write_response(client_fd, response); ec) {
            if (is_disconnect_error(ec)) {
                LOG_INFO(logger,
                         "Client disconnected before response was written: path={}, "
                         "correlation_id={}",
                         request.path, ctx.correlation_id);
            } else if (is_timeout_error(ec)) {
                LOG_INFO(logger,
                         "Client stopped reading the response: path={}, timeout_ms={}, "
                         "correlation_id={}",
                         request.path, shared->config.idle_timeout, ctx.correlation_id);
            } else {
                LOG_WARNING(logger, "Failed to write response: path={}, error={}, correlation_id={}",
                            request.path, ec.message(), ctx.correlation_id);
            }
        }

        auto duration_us = std::chrono::duration_cast<std::chrono::microseconds>(
                               std::chrono::steady_clock::now() - start)
                               .count();
        LOG_REQUEST(logger, http::to_string(request.method), request.path,
                    response.status_code(), duration_us, client_ip, ctx.correlation_id);
    } catch (const std::exception& e) {
        LOG_ERROR(logger, "Unhandled error while serving connection: fd={}, error={}", client_fd,
                  e.what());
    }
}

// ---------------------------------------------------------------------------
// Server
// ---------------------------------------------------------------------------

Server::Server(control::ServerConfig config, std::shared_ptr<const gateway::Gateway> gateway)
    : shared_(std::make_shared<ServerShared>()) {
    shared_->config = std::move(config);
    shared_->gateway = std::move(gateway);
}

Server::~Server() {
    close_listener();
}

std::error_code Server::start() {
    const auto& config = shared_->config;
    listen_fd_ = create_listening_socket(config.listen_address, config.listen_port,
                                         static_cast<int>(config.backlog));
    if (listen_fd_ < 0) {
        return {errno, std::system_category()};
    }

    port_ = bound_port(listen_fd_);
    running_.store(true, std::memory_order_release);

    LOG_INFO(logging::get_current_logger(), "Listening on {}:{}", config.listen_address, port_);
    return {};
}

void Server::run(const std::atomic<bool>& keep_running) {
    auto* logger = logging::get_current_logger();
    const uint32_t max_connections = shared_->config.max_connections;

    while (running_.load(std::memory_order_acquire) && keep_running.load()) {
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, kAcceptPollMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR(logger, "poll() on listener failed: errno={}", errno);
            break;
        }
        if (ready == 0) continue;

        int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK ||
                errno == ECONNABORTED) {
                continue;
            }
            LOG_WARNING(logger, "accept() failed: errno={}", errno);
            continue;
        }

        uint32_t previous = shared_->in_flight.fetch_add(1, std::memory_order_acq_rel);
        bool over_limit = max_connections != 0 && previous >= max_connections;

        try {
            std::thread(handle_connection, shared_, client_fd, over_limit).detach();
        } catch (const std::system_error& e) {
            LOG_ERROR(logger, "Failed to spawn connection thread: error={}", e.what());
            send_early_response(client_fd,
                                make_early_response(http::StatusCode::ServiceUnavailable,
                                                    "Server busy, try again later", std::nullopt));
            close_fd(client_fd);
            shared_->in_flight.fetch_sub(1, std::memory_order_acq_rel);
        }
    }

    running_.store(false, std::memory_order_release);
    close_listener();
    LOG_INFO(logger, "Stopped accepting connections");
}

void Server::stop() noexcept {
    running_.store(false, std::memory_order_release);
}

bool Server::drain(std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (active_connections() > 0) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kDrainPollInterval);
    }
    return true;
}

void Server::close_listener() noexcept {
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

}  // namespace easel::core
