// Easel Socket Utilities - Header

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace easel::core {

/// Create blocking listening socket (port 0 picks an ephemeral port)
/// Returns -1 on failure with errno set
[[nodiscard]] int create_listening_socket(
    std::string_view address,
    uint16_t port,
    int backlog = 128);

/// Port the socket is bound to (resolves port 0)
[[nodiscard]] uint16_t bound_port(int fd) noexcept;

[[nodiscard]] std::error_code set_reuseaddr(int fd);

/// Bound each blocking recv() and send() (SO_RCVTIMEO + SO_SNDTIMEO).
/// A timed-out call fails with EAGAIN/EWOULDBLOCK.
[[nodiscard]] std::error_code set_io_timeout(int fd, std::chrono::milliseconds timeout);

/// Write the whole buffer (MSG_NOSIGNAL), retrying on EINTR and short writes
[[nodiscard]] std::error_code send_all(int fd, std::span<const char> data);

/// Read whatever is available into buf. Returns bytes read, 0 on orderly close.
/// On failure returns 0 and sets ec.
[[nodiscard]] size_t recv_some(int fd, std::span<char> buf, std::error_code& ec);

/// Peer address as dotted quad ("unknown" if unavailable)
[[nodiscard]] std::string peer_address(int fd);

/// Errors that mean the client went away (EPIPE, ECONNRESET, ECONNABORTED, ENOTCONN)
[[nodiscard]] bool is_disconnect_error(const std::error_code& ec) noexcept;

/// Errors produced by an expired SO_RCVTIMEO or SO_SNDTIMEO
[[nodiscard]] bool is_timeout_error(const std::error_code& ec) noexcept;

void close_fd(int fd);

} // namespace easel::core
