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

// Easel Proxy Server - Main Entry Point
#include <atomic>
#include <charconv>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "core/server_runner.hpp"

namespace easel::core {
std::atomic<bool> g_server_running{true};
}  // namespace easel::core

namespace {

struct CommandLine {
    std::optional<std::string> config_path;
    std::optional<uint16_t> port;
    std::optional<std::string> root;
};

void print_usage(const char* program) {
    fprintf(stderr, "Usage: %s [--config <config.json>] [--port <port>] [--root <dir>]\n",
            program);
}

std::optional<uint16_t> parse_port(std::string_view text) {
    uint16_t port = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return port;
}

std::optional<CommandLine> parse_command_line(int argc, char* argv[]) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (i + 1 >= argc) {
            fprintf(stderr, "Missing value for %s\n", argv[i]);
            return std::nullopt;
        }
        std::string_view value = argv[++i];

        if (arg == "--config") {
            cli.config_path = std::string(value);
        } else if (arg == "--port") {
            cli.port = parse_port(value);
            if (!cli.port) {
                fprintf(stderr, "Invalid port: %s\n", argv[i]);
                return std::nullopt;
            }
        } else if (arg == "--root") {
            cli.root = std::string(value);
        } else {
            fprintf(stderr, "Unknown option: %s\n", argv[i - 1]);
            return std::nullopt;
        }
    }
    return cli;
}

}  // namespace

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        easel::core::g_server_running = false;
    }
}

int main(int argc, char* argv[]) {
    printf("Easel Proxy Server v0.1.0\n\n");

    auto cli = parse_command_line(argc, argv);
    if (!cli) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    easel::control::Config config;
    if (cli->config_path) {
        printf("Loading configuration from %s...\n", cli->config_path->c_str());
        auto loaded = easel::control::ConfigLoader::load_from_file(*cli->config_path);
        if (!loaded) {
            fprintf(stderr, "Failed to load configuration\n");
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    }

    if (cli->port) {
        config.server.listen_port = *cli->port;
    }
    if (cli->root) {
        config.static_files.root = *cli->root;
    }

    easel::control::ConfigLoader::apply_environment(config);

    auto validation = easel::control::ConfigLoader::validate(config);
    if (validation.has_errors()) {
        fprintf(stderr, "Configuration validation errors:\n");
        for (const auto& error : validation.errors) {
            fprintf(stderr, "  - %s\n", error.c_str());
        }
        return EXIT_FAILURE;
    }

    easel::logging::init_logging_system();
    auto* logger = easel::logging::init_server_logger(config.logging);

    for (const auto& warning : validation.warnings) {
        LOG_WARNING(logger, "Config: {}", warning);
    }
    if (config.upstreams.unsplash.insecure_skip_verify) {
        LOG_WARNING(logger, "TLS certificate verification is DISABLED for the image search upstream");
    }

    // Install signal handlers for graceful shutdown
    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Kill signal
    std::signal(SIGPIPE, SIG_IGN);         // Disconnects surface as EPIPE

    LOG_INFO(logger, "Starting Easel on {}:{} (static root: {})", config.server.listen_address,
             config.server.listen_port, config.static_files.root);

    auto ec = easel::core::run_server(config);

    if (ec == std::errc::timed_out) {
        // Detached workers may still log: flush, but leave the backend running
        logger->flush_log();
        std::_Exit(EXIT_FAILURE);
    }
    if (ec) {
        fprintf(stderr, "Server error: %s\n", ec.message().c_str());
        easel::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    LOG_INFO(logger, "Easel stopped");
    easel::logging::shutdown_logging();
    return EXIT_SUCCESS;
}
