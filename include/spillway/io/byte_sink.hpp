#pragma once

/** \file byte_sink.hpp
 *  \brief Byte output interface shared by every layer of the append pipeline.
 *
 * Layers own the sink below them (std::unique_ptr) and forward flush/close downwards.
 * close() is idempotent; write()/flush() after close() return io_failed.
 * Not thread-safe.
 */

#include <cstdint>
#include <expected>
#include <span>

#include "spillway/error.hpp"

namespace spillway::io {

class byte_sink {
public:
  virtual ~byte_sink() = default;

  virtual auto write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> = 0;

  /** Pushes every byte accepted so far to the layer below, then flushes it. */
  virtual auto flush() -> std::expected<void, core::error> = 0;

  /** Flushes pending bytes and releases the sink chain. */
  virtual auto close() -> std::expected<void, core::error> = 0;
};

} // namespace spillway::io
