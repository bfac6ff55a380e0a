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

// Easel Server - Header
// Blocking accept loop with one detached worker thread per connection

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "../control/config.hpp"
#include "../gateway/gateway.hpp"
#include "../http/http.hpp"

namespace easel::core {

/// Outcome of reading one request from a client socket
enum class ReadStatus : uint8_t {
    Complete,       // Request parsed
    Closed,         // Peer closed before sending a full request
    Timeout,        // Idle timeout expired
    Disconnected,   // EPIPE/ECONNRESET/... while reading
    Malformed,      // 400
    HeaderTooLarge, // 431
    BodyTooLarge,   // 413
    IoError         // Any other socket error
};

/// State shared by the acceptor and every connection thread.
/// Held by shared_ptr so detached threads never outlive it.
struct ServerShared {
    control::ServerConfig config;
    std::shared_ptr<const gateway::Gateway> gateway;
    std::atomic<uint32_t> in_flight{0};
};

/// HTTP/1.1 server: one request per connection, always Connection: close
class Server {
public:
    Server(control::ServerConfig config, std::shared_ptr<const gateway::Gateway> gateway);
    ~Server();

    // Non-copyable, non-movable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Bind and listen
    [[nodiscard]] std::error_code start();

    /// Accept until stop() is called or keep_running turns false (blocking)
    void run(const std::atomic<bool>& keep_running);

    /// Stop accepting (async-signal-safe: only flips a flag)
    void stop() noexcept;

    /// Wait for in-flight connections to finish.
    /// Returns true if all finished before the timeout.
    [[nodiscard]] bool drain(std::chrono::milliseconds timeout) const;

    /// Bound port (resolves port 0 after start())
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    /// Connections currently being served
    [[nodiscard]] uint32_t active_connections() const noexcept {
        return shared_->in_flight.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

private:
    void close_listener() noexcept;

    std::shared_ptr<ServerShared> shared_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
};

/// Read and parse one request from fd (respecting header/body limits and the
/// socket's receive timeout). buffer owns the bytes the request views point to.
[[nodiscard]] ReadStatus read_request(int fd, const control::ServerConfig& config,
                                      std::vector<uint8_t>& buffer, http::Request& request);

/// Serve one accepted connection to completion and close it
void handle_connection(std::shared_ptr<ServerShared> shared, int client_fd, bool over_limit);

}  // namespace easel::core
