#include "spillway/io/file_sink.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace spillway::io {

namespace {
auto errno_error(const char* what) -> core::error {
  return core::error{core::error_code::io_failed, std::string(what) + ": " + std::strerror(errno), "io.file"};
}
}

file_sink::~file_sink() {
  if (fd_ >= 0) (void)::close(fd_);
}

auto file_sink::open_append(const std::filesystem::path& path)
    -> std::expected<std::unique_ptr<file_sink>, core::error> {
  int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return std::unexpected(errno_error("open failed"));
  return std::unique_ptr<file_sink>(new file_sink(path, fd));
}

auto file_sink::write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> {
  if (fd_ < 0) return std::unexpected(core::error{core::error_code::io_failed, "write on closed file", "io.file"});
  const std::uint8_t* p = bytes.data();
  std::size_t left = bytes.size();
  while (left > 0) {
    ssize_t n = ::write(fd_, p, left);
    if (n < 0) {
      if (errno == EINTR) continue;
      return std::unexpected(errno_error("write failed"));
    }
    p += n;
    left -= static_cast<std::size_t>(n);
  }
  return {};
}

// Descriptor writes are unbuffered; nothing to push.
auto file_sink::flush() -> std::expected<void, core::error> {
  if (fd_ < 0) return std::unexpected(core::error{core::error_code::io_failed, "flush on closed file", "io.file"});
  return {};
}

auto file_sink::sync() -> std::expected<void, core::error> {
  if (fd_ < 0) return std::unexpected(core::error{core::error_code::io_failed, "sync on closed file", "io.file"});
  const auto start = std::chrono::steady_clock::now();
  int rc = ::fsync(fd_);
  sync_time_ += std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);
  ++syncs_;
  if (rc != 0) return std::unexpected(errno_error("fsync failed"));
  return {};
}

auto file_sink::close() -> std::expected<void, core::error> {
  if (fd_ < 0) return {};
  std::expected<void, core::error> synced{};
  if (sync_on_close_) synced = sync();
  int fd = fd_;
  fd_ = -1;
  // The descriptor is released even when the sync failed; the sync error wins.
  if (::close(fd) != 0 && errno != EINTR) {
    if (!synced) return synced;
    return std::unexpected(errno_error("close failed"));
  }
  return synced;
}

} // namespace spillway::io
