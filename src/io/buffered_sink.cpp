#include "spillway/io/buffered_sink.hpp"

#include <algorithm>
#include <cstring>

namespace spillway::io {

buffered_sink::buffered_sink(std::unique_ptr<byte_sink> inner, std::size_t capacity)
  : inner_(std::move(inner)), buf_(std::max<std::size_t>(capacity, 1)) {}

auto buffered_sink::drain() -> std::expected<void, core::error> {
  if (used_ == 0) return {};
  auto r = inner_->write({buf_.data(), used_});
  // Drop the bytes either way: a failed segment is reverted by truncation, not retried.
  used_ = 0;
  return r;
}

auto buffered_sink::write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> {
  if (closed_) return std::unexpected(core::error{core::error_code::io_failed, "write on closed buffer", "io.buffer"});
  if (bytes.size() > buf_.size() - used_) {
    if (auto r = drain(); !r) return r;
  }
  if (bytes.size() >= buf_.size()) {
    return inner_->write(bytes);
  }
  std::memcpy(buf_.data() + used_, bytes.data(), bytes.size());
  used_ += bytes.size();
  return {};
}

auto buffered_sink::flush() -> std::expected<void, core::error> {
  if (closed_) return std::unexpected(core::error{core::error_code::io_failed, "flush on closed buffer", "io.buffer"});
  if (auto r = drain(); !r) return r;
  return inner_->flush();
}

auto buffered_sink::close() -> std::expected<void, core::error> {
  if (closed_) return {};
  closed_ = true;
  auto drained = drain();
  auto closed = inner_->close();
  if (!drained) return drained;
  return closed;
}

} // namespace spillway::io
