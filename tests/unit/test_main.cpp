// Easel Unit Tests - Main Entry Point
#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>

#include <atomic>

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

namespace easel::core {
// Normally defined by the server executable
std::atomic<bool> g_server_running{true};
}  // namespace easel::core

// Global test fixture - runs once before all tests
struct GlobalSetup {
    GlobalSetup() {
        // Initialize logging system for tests
        easel::logging::init_logging_system();

        easel::control::LogConfig log_config;
        log_config.output = "/tmp/easel_tests/easel.log";
        log_config.level = "debug";
        easel::logging::init_server_logger(log_config);
    }

    ~GlobalSetup() {
        // Cleanup logging system
        easel::logging::shutdown_logging();
    }
};

// Create global instance to run setup/teardown
static GlobalSetup g_setup;

TEST_CASE("Basic sanity test", "[smoke]") {
    REQUIRE(1 + 1 == 2);
}
