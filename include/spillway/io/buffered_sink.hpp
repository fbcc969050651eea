#pragma once

/** \file buffered_sink.hpp
 *  \brief Fixed-capacity output buffer in front of another sink.
 *
 * Writes are copied into the buffer; when a write does not fit, the buffer is drained first,
 * and writes at least as large as the capacity go straight to the inner sink.
 * flush() drains and flushes the inner sink; close() drains and closes it. The inner sink is
 * closed even when draining fails, and the drain error is returned.
 */

#include <cstddef>
#include <memory>
#include <vector>

#include "spillway/io/byte_sink.hpp"

namespace spillway::io {

inline constexpr std::size_t DEFAULT_BUFFER_SIZE = 32 * 1024;

class buffered_sink final : public byte_sink {
public:
  /** capacity 0 is treated as 1. */
  buffered_sink(std::unique_ptr<byte_sink> inner, std::size_t capacity = DEFAULT_BUFFER_SIZE);

  auto write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> override;
  auto flush() -> std::expected<void, core::error> override;
  auto close() -> std::expected<void, core::error> override;

  std::size_t capacity() const noexcept { return buf_.size(); }
  std::size_t pending() const noexcept { return used_; }

private:
  auto drain() -> std::expected<void, core::error>;

  std::unique_ptr<byte_sink> inner_;
  std::vector<std::uint8_t> buf_;
  std::size_t used_{0};
  bool closed_{false};
};

} // namespace spillway::io
