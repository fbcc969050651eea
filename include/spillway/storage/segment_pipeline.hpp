#pragma once

/** \file segment_pipeline.hpp
 *  \brief The byte layers below a segment writer's serialization stream.
 *
 * Stack (top to bottom): compression transform -> buffered_sink -> timed_sink -> file_sink.
 * close() is idempotent and always releases the descriptor; when sync is enabled the file is
 * fsynced after the upper layers have drained into it and before the descriptor is closed.
 * Timings stay readable after close.
 */

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>

#include "spillway/error.hpp"
#include "spillway/io/byte_sink.hpp"
#include "spillway/io/compression.hpp"

namespace spillway::io {
class file_sink;
class timed_sink;
}

namespace spillway::storage {

class segment_pipeline {
public:
  segment_pipeline(segment_pipeline&&) noexcept;
  segment_pipeline& operator=(segment_pipeline&&) noexcept;
  segment_pipeline(const segment_pipeline&) = delete;
  segment_pipeline& operator=(const segment_pipeline&) = delete;
  ~segment_pipeline();

  static auto open(const std::filesystem::path& path, std::size_t buffer_size, bool sync_on_close,
                   const io::compression_transform& compress)
      -> std::expected<segment_pipeline, core::error>;

  /** Sink the serialization stream writes into. Valid until close(). */
  io::byte_sink& sink() noexcept { return *top_; }

  auto flush() -> std::expected<void, core::error>;
  auto close() -> std::expected<void, core::error>;

  bool closed() const noexcept { return closed_; }

  /** Time spent inside forwarded write calls at the descriptor. */
  std::chrono::nanoseconds write_time() const noexcept;
  /** Time spent in fsync. */
  std::chrono::nanoseconds sync_time() const noexcept;
  std::uint64_t syncs() const noexcept;

private:
  segment_pipeline() = default;

  std::unique_ptr<io::byte_sink> top_;
  io::timed_sink* timed_{nullptr};  // owned through top_
  io::file_sink* file_{nullptr};    // owned through top_
  bool closed_{false};
};

} // namespace spillway::storage
