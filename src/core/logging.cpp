#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <random>

#include "../control/config.hpp"
#include "string_utils.hpp"

namespace easel::logging {

// Shared by every connection thread
static std::atomic<quill::Logger*> g_logger{nullptr};

void init_logging_system() {
  quill::Backend::start();
}

quill::LogLevel parse_log_level(std::string_view level) {
  std::string level_lower = core::to_lower(level);

  if (level_lower == "debug") {
    return quill::LogLevel::Debug;
  }
  if (level_lower == "warning" || level_lower == "warn") {
    return quill::LogLevel::Warning;
  }
  if (level_lower == "error") {
    return quill::LogLevel::Error;
  }
  return quill::LogLevel::Info;
}

quill::Logger* init_server_logger(const control::LogConfig& log_config) {
  quill::Logger* logger = nullptr;

  if (log_config.output.empty()) {
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("easel_console");
    logger = quill::Frontend::create_or_get_logger("easel", std::move(console_sink));
  } else {
    std::filesystem::path log_path(log_config.output);
    if (log_path.has_parent_path()) {
      std::filesystem::create_directories(log_path.parent_path());
    }

    quill::RotatingFileSinkConfig config;
    config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
    config.set_max_backup_files(log_config.rotation.max_files);
    config.set_open_mode('a');

    if (log_config.format == "json") {
      auto json_sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(
          log_path.string(), config);
      logger = quill::Frontend::create_or_get_logger("easel_json", std::move(json_sink));
    } else {
      auto file_sink = quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(
          log_path.string(), config);
      logger = quill::Frontend::create_or_get_logger("easel_file", std::move(file_sink));
    }
  }

  logger->set_log_level(parse_log_level(log_config.level));

  g_logger.store(logger, std::memory_order_release);
  return logger;
}

void shutdown_logging() {
  if (auto* logger = g_logger.load(std::memory_order_acquire)) {
    logger->flush_log();
  }
  quill::Backend::stop();
}

quill::Logger* get_current_logger() {
  quill::Logger* logger = g_logger.load(std::memory_order_acquire);
  if (logger) {
    return logger;
  }

  auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("easel_console");
  logger = quill::Frontend::create_or_get_logger("easel", std::move(console_sink));

  quill::Logger* expected = nullptr;
  g_logger.compare_exchange_strong(expected, logger, std::memory_order_acq_rel);
  return g_logger.load(std::memory_order_acquire);
}

namespace {

// 'x' is any hex digit, 'y' the RFC 4122 variant nibble
constexpr std::string_view kUuidTemplate = "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx";

bool is_hex_digit(char c) noexcept {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// Random UUID v4, drawn once per connection thread
std::string generate_base_uuid() {
  std::mt19937_64 rng(std::random_device{}() ^
                      static_cast<uint64_t>(
                          std::chrono::steady_clock::now().time_since_epoch().count()));

  uint64_t high = rng();
  uint64_t low = rng();
  high = (high & ~0xF000ULL) | 0x4000ULL;                    // version 4
  low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // variant 10xx

  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", high >> 32, (high >> 16) & 0xFFFF,
                     high & 0xFFFF, low >> 48, low & 0xFFFFFFFFFFFFULL);
}

}  // namespace

std::string generate_correlation_id() {
  static thread_local std::string base_uuid = generate_base_uuid();
  static thread_local uint64_t counter = 0;

  return fmt::format("{}#{}", base_uuid, counter++);
}

bool is_valid_uuid(std::string_view uuid) {
  // {uuid}#{decimal counter}
  size_t hash_pos = uuid.find('#');
  if (hash_pos != kUuidTemplate.size()) {
    return false;
  }

  for (size_t i = 0; i < kUuidTemplate.size(); ++i) {
    char c = uuid[i];
    switch (kUuidTemplate[i]) {
      case 'x':
        if (!is_hex_digit(c)) return false;
        break;
      case 'y':
        if (std::string_view("89abAB").find(c) == std::string_view::npos) return false;
        break;
      default:
        if (c != kUuidTemplate[i]) return false;
        break;
    }
  }

  std::string_view counter = uuid.substr(hash_pos + 1);
  return !counter.empty() &&
         std::all_of(counter.begin(), counter.end(), [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace easel::logging
