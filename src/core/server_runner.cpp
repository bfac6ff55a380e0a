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

// Easel Server Runner - Implementation

#include "server_runner.hpp"

#include <atomic>
#include <chrono>
#include <memory>

#include "../gateway/factory.hpp"
#include "logging.hpp"
#include "server.hpp"

namespace easel::core {

extern std::atomic<bool> g_server_running;

std::error_code drain_connections(const Server& server, std::chrono::milliseconds timeout) {
    auto* logger = logging::get_current_logger();

    uint32_t active = server.active_connections();
    if (active == 0) {
        return {};
    }

    LOG_INFO(logger, "Draining {} active connections (timeout: {}ms)...", active,
             timeout.count());
    if (server.drain(timeout)) {
        LOG_INFO(logger, "All connections drained successfully");
        return {};
    }

    LOG_WARNING(logger, "Shutdown timeout reached, {} connections still active",
                server.active_connections());
    return std::make_error_code(std::errc::timed_out);
}

std::error_code run_server(const control::Config& config) {
    auto* logger = logging::get_current_logger();

    std::shared_ptr<const gateway::Gateway> gateway = gateway::build_gateway(config);
    LOG_INFO(logger, "Gateway ready: routes={}, allowed_models={}, static_root={}",
             gateway->router().routes().size(), config.models.allowed.size(),
             config.static_files.root);

    Server server(config.server, gateway);
    if (auto ec = server.start(); ec) {
        LOG_ERROR(logger, "Failed to listen on {}:{}: {}", config.server.listen_address,
                  config.server.listen_port, ec.message());
        return ec;
    }

    server.run(g_server_running);

    return drain_connections(server, std::chrono::milliseconds(config.server.shutdown_timeout));
}

} // namespace easel::core
