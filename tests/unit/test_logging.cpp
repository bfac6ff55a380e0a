// Easel Logging Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <string>
#include <thread>

#include "../../src/core/logging.hpp"

using namespace easel::logging;

TEST_CASE("Correlation ID generation", "[logging][correlation_id]") {
    SECTION("generates valid UUID format") {
        std::string correlation_id = generate_correlation_id();

        size_t hash_count = std::count(correlation_id.begin(), correlation_id.end(), '#');
        REQUIRE(hash_count == 1);
        REQUIRE(is_valid_uuid(correlation_id));

        std::string uuid_part = correlation_id.substr(0, correlation_id.find('#'));
        REQUIRE(uuid_part.length() == 36);
        REQUIRE(uuid_part[14] == '4');
    }

    SECTION("same thread shares the base and increments the counter") {
        std::string id1 = generate_correlation_id();
        std::string id2 = generate_correlation_id();

        REQUIRE(id1 != id2);

        size_t hash_pos1 = id1.find('#');
        size_t hash_pos2 = id2.find('#');
        REQUIRE(id1.substr(0, hash_pos1) == id2.substr(0, hash_pos2));

        auto counter1 = std::stoull(id1.substr(hash_pos1 + 1));
        auto counter2 = std::stoull(id2.substr(hash_pos2 + 1));
        REQUIRE(counter2 == counter1 + 1);
    }

    SECTION("connection threads get their own base") {
        std::string main_id = generate_correlation_id();
        std::string worker_id;
        std::thread worker([&worker_id] { worker_id = generate_correlation_id(); });
        worker.join();

        REQUIRE(is_valid_uuid(worker_id));
        REQUIRE(main_id.substr(0, 36) != worker_id.substr(0, 36));
        // Fresh thread starts counting at zero
        REQUIRE(worker_id.substr(37) == "0");
    }
}

TEST_CASE("UUID validation", "[logging][validation]") {
    SECTION("accepts valid correlation IDs") {
        REQUIRE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#0"));
        REQUIRE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#999999"));
        REQUIRE(is_valid_uuid("ABCDEF12-3456-4789-ABCD-EF0123456789#42"));
    }

    SECTION("rejects invalid formats") {
        REQUIRE_FALSE(is_valid_uuid(""));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#12a"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-44665544000#0"));
        REQUIRE_FALSE(is_valid_uuid("550e8400e29b41d4a716446655440000#0"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-31d4-a716-446655440000#0"));  // version 3
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-c716-446655440000#0"));  // variant c
        REQUIRE_FALSE(is_valid_uuid("550g8400-e29b-41d4-a716-446655440000#0"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#42#56"));
    }

    SECTION("validates generated correlation IDs") {
        for (int i = 0; i < 100; ++i) {
            REQUIRE(is_valid_uuid(generate_correlation_id()));
        }
    }
}

TEST_CASE("Log level names", "[logging][config]") {
    REQUIRE(parse_log_level("debug") == quill::LogLevel::Debug);
    REQUIRE(parse_log_level("INFO") == quill::LogLevel::Info);
    REQUIRE(parse_log_level("warn") == quill::LogLevel::Warning);
    REQUIRE(parse_log_level("warning") == quill::LogLevel::Warning);
    REQUIRE(parse_log_level("error") == quill::LogLevel::Error);
    REQUIRE(parse_log_level("anything-else") == quill::LogLevel::Info);
}

TEST_CASE("Process logger", "[logging][logger]") {
    auto* logger = get_current_logger();
    REQUIRE(logger != nullptr);
    REQUIRE(get_current_logger() == logger);

    // File output creates its directory
    REQUIRE(std::filesystem::is_directory("/tmp/easel_tests"));

    // Structured macros format and enqueue without throwing
    LOG_REQUEST(logger, "GET", "/index.html", 200, 1234, "127.0.0.1", "test#1");
    LOG_UPSTREAM(logger, "response", "gemini", "https://example/x?key=REDACTED", 200, "test#2");
    LOG_ERROR_CTX(logger, "Upstream request failed", "test#3", 502, "cause=timeout");
    logger->flush_log();
}
