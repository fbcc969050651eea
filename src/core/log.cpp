#include "spillway/core/log.hpp"
#include "spillway/core/platform_utils.hpp"

#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace spillway::core {

namespace {

std::mutex& sink_mutex() {
  static std::mutex m;
  return m;
}

log_sink& current_sink() {
  static log_sink s;
  return s;
}

std::optional<log_level> parse_level(const std::optional<std::string>& v) {
  if (!v) return std::nullopt;
  if (*v == "debug") return log_level::debug;
  if (*v == "info") return log_level::info;
  if (*v == "warn") return log_level::warn;
  if (*v == "error") return log_level::error;
  return std::nullopt;
}

std::atomic<int>& threshold_storage() {
  static std::atomic<int> t{[]{
    auto lvl = parse_level(safe_getenv("SPILLWAY_LOG_LEVEL"));
    return static_cast<int>(lvl.value_or(log_level::warn));
  }()};
  return t;
}

void stderr_sink(log_level level, std::string_view component, std::string_view message) {
  std::cerr << "[spillway][" << to_string(level) << "][" << component << "] " << message << std::endl;
}

} // namespace

auto to_string(log_level level) noexcept -> const char* {
  switch (level) {
    case log_level::debug: return "debug";
    case log_level::info: return "info";
    case log_level::warn: return "warn";
    case log_level::error: return "error";
  }
  return "unknown";
}

auto set_log_sink(log_sink sink) -> log_sink {
  std::lock_guard<std::mutex> lk(sink_mutex());
  log_sink prev = std::move(current_sink());
  current_sink() = std::move(sink);
  return prev;
}

void set_log_threshold(log_level level) noexcept {
  threshold_storage().store(static_cast<int>(level), std::memory_order_relaxed);
}

auto log_threshold() noexcept -> log_level {
  return static_cast<log_level>(threshold_storage().load(std::memory_order_relaxed));
}

void log(log_level level, std::string_view component, std::string_view message) noexcept {
  if (static_cast<int>(level) < static_cast<int>(log_threshold())) return;
  try {
    std::lock_guard<std::mutex> lk(sink_mutex());
    if (current_sink()) {
      current_sink()(level, component, message);
    } else {
      stderr_sink(level, component, message);
    }
  } catch (const std::exception& e) {
    // A failing sink must not take the caller down; report on stderr instead.
    std::cerr << "[spillway][error][core.log] log sink failed: " << e.what() << std::endl;
  }
}

} // namespace spillway::core
