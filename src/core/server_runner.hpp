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

// Easel Server Runner - Header

#pragma once

#include "../control/config.hpp"

#include <chrono>
#include <system_error>

namespace easel::core {

class Server;

/// Wait for in-flight connections. std::errc::timed_out when some are still
/// running after the timeout; their threads may keep logging.
[[nodiscard]] std::error_code drain_connections(const Server& server,
                                                std::chrono::milliseconds timeout);

/// Build the gateway, serve until g_server_running turns false, then drain
/// in-flight connections for at most server.shutdown_timeout.
/// Returns std::errc::timed_out when the drain did not finish.
[[nodiscard]] std::error_code run_server(const control::Config& config);

} // namespace easel::core
