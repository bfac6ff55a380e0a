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

// Gateway Component Factory - Header
// Factory functions for building gateway components (Router, UpstreamClient, Gateway)

#pragma once

#include <memory>

#include "../control/config.hpp"
#include "gateway.hpp"
#include "router.hpp"
#include "upstream.hpp"

namespace easel::gateway {

/// Build the fixed routing table
[[nodiscard]] std::unique_ptr<Router> build_router();

/// Build the outbound HTTP client
[[nodiscard]] std::shared_ptr<UpstreamClient> build_upstream_client();

/// Build the dispatcher from configuration.
/// A null upstream_client means the real HTTP client.
[[nodiscard]] std::unique_ptr<Gateway> build_gateway(
    const control::Config& config, std::shared_ptr<UpstreamClient> upstream_client = nullptr);

}  // namespace easel::gateway
