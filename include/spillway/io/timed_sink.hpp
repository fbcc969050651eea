#pragma once

/** \file timed_sink.hpp
 *  \brief Instrumented sink: forwards writes unchanged and accumulates time spent in them.
 *
 * Only write() calls are timed; flush() and close() pass through untimed.
 * time_writing() may be read at any time but is stable only once the sink is closed.
 * Not thread-safe.
 */

#include <chrono>
#include <memory>

#include "spillway/io/byte_sink.hpp"

namespace spillway::io {

class timed_sink final : public byte_sink {
public:
  explicit timed_sink(std::unique_ptr<byte_sink> inner) : inner_(std::move(inner)) {}

  auto write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> override;
  auto flush() -> std::expected<void, core::error> override;
  auto close() -> std::expected<void, core::error> override;

  std::chrono::nanoseconds time_writing() const noexcept { return time_writing_; }
  std::uint64_t write_calls() const noexcept { return write_calls_; }

private:
  std::unique_ptr<byte_sink> inner_;
  std::chrono::nanoseconds time_writing_{0};
  std::uint64_t write_calls_{0};
};

} // namespace spillway::io
