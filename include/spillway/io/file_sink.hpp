#pragma once

/** \file file_sink.hpp
 *  \brief Append-mode file descriptor sink (bottom of the append pipeline).
 *
 * Notes
 * - Opens with O_WRONLY|O_APPEND|O_CREAT; every write lands at the current end of file.
 * - Partial writes and EINTR are retried until all bytes are written or an error occurs.
 * - sync() issues fsync and accumulates its duration in sync_time().
 * - With sync_on_close set, close() syncs before releasing the descriptor, so bytes that
 *   upper layers emit while closing (compression trailers, buffered tails) are covered.
 */

#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>

#include "spillway/io/byte_sink.hpp"

namespace spillway::io {

class file_sink final : public byte_sink {
public:
  ~file_sink() override;
  file_sink(const file_sink&) = delete;
  file_sink& operator=(const file_sink&) = delete;

  static auto open_append(const std::filesystem::path& path)
      -> std::expected<std::unique_ptr<file_sink>, core::error>;

  auto write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> override;
  auto flush() -> std::expected<void, core::error> override;
  auto close() -> std::expected<void, core::error> override;

  /** Forces written data to stable storage. */
  auto sync() -> std::expected<void, core::error>;

  void set_sync_on_close(bool on) noexcept { sync_on_close_ = on; }

  std::chrono::nanoseconds sync_time() const noexcept { return sync_time_; }
  std::uint64_t syncs() const noexcept { return syncs_; }
  const std::filesystem::path& path() const noexcept { return path_; }
  bool is_open() const noexcept { return fd_ >= 0; }

private:
  file_sink(std::filesystem::path path, int fd) : path_(std::move(path)), fd_(fd) {}

  std::filesystem::path path_;
  int fd_{-1};
  bool sync_on_close_{false};
  std::chrono::nanoseconds sync_time_{0};
  std::uint64_t syncs_{0};
};

} // namespace spillway::io
