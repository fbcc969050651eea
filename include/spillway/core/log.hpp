#pragma once

/** \file log.hpp
 *  \brief Minimal leveled logging with a replaceable sink.
 *
 * The default sink writes one line per event to std::cerr:
 *   [spillway][<level>][<component>] <message>
 * Threshold defaults to warn; SPILLWAY_LOG_LEVEL (debug|info|warn|error) overrides it
 * the first time a message is logged.
 * Thread-safety: sink replacement and emission are serialized by an internal mutex.
 */

#include <cstdint>
#include <functional>
#include <string_view>

namespace spillway::core {

enum class log_level : std::uint8_t { debug = 0, info = 1, warn = 2, error = 3 };

using log_sink = std::function<void(log_level, std::string_view component, std::string_view message)>;

auto to_string(log_level level) noexcept -> const char*;

/** Installs a sink and returns the previous one. An empty function restores the stderr sink. */
auto set_log_sink(log_sink sink) -> log_sink;

void set_log_threshold(log_level level) noexcept;
auto log_threshold() noexcept -> log_level;

/** Emits an event if level >= threshold. Never throws. */
void log(log_level level, std::string_view component, std::string_view message) noexcept;

} // namespace spillway::core
