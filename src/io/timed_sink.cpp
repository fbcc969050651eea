#include "spillway/io/timed_sink.hpp"

namespace spillway::io {

auto timed_sink::write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> {
  const auto start = std::chrono::steady_clock::now();
  auto r = inner_->write(bytes);
  time_writing_ += std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);
  ++write_calls_;
  return r;
}

auto timed_sink::flush() -> std::expected<void, core::error> { return inner_->flush(); }

auto timed_sink::close() -> std::expected<void, core::error> { return inner_->close(); }

} // namespace spillway::io
