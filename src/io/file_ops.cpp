#include "spillway/io/file_ops.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace spillway::io {

namespace {
auto errno_error(const char* what, const std::filesystem::path& p) -> core::error {
  return core::error{core::error_code::io_failed,
                     std::string(what) + " '" + p.string() + "': " + std::strerror(errno), "io.file"};
}
}

auto file_length(const std::filesystem::path& p) -> std::expected<std::uint64_t, core::error> {
  struct stat st{};
  if (::stat(p.c_str(), &st) != 0) {
    if (errno == ENOENT) return std::uint64_t{0};
    return std::unexpected(errno_error("stat failed", p));
  }
  return static_cast<std::uint64_t>(st.st_size);
}

auto truncate_file(const std::filesystem::path& p, std::uint64_t length) -> std::expected<void, core::error> {
  int fd = ::open(p.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return std::unexpected(errno_error("truncate open failed", p));
  int rc;
  do {
    rc = ::ftruncate(fd, static_cast<off_t>(length));
  } while (rc != 0 && errno == EINTR);
  if (rc != 0) {
    auto err = errno_error("ftruncate failed", p);
    (void)::close(fd);
    return std::unexpected(std::move(err));
  }
  if (::close(fd) != 0 && errno != EINTR) return std::unexpected(errno_error("truncate close failed", p));
  return {};
}

auto fsync_path(const std::filesystem::path& p) -> std::expected<void, core::error> {
  int fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) return std::unexpected(errno_error("fsync open failed", p));
  int rc = ::fsync(fd);
  (void)::close(fd);
  if (rc != 0) return std::unexpected(errno_error("fsync failed", p));
  return {};
}

auto read_range(const std::filesystem::path& p, std::uint64_t offset, std::uint64_t length)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  int fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    if (errno == ENOENT) return std::unexpected(core::error{core::error_code::not_found, "no such file: " + p.string(), "io.file"});
    return std::unexpected(errno_error("open failed", p));
  }
  struct stat st{};
  if (::fstat(fd, &st) != 0) {
    auto err = errno_error("fstat failed", p);
    (void)::close(fd);
    return std::unexpected(std::move(err));
  }
  const auto size = static_cast<std::uint64_t>(st.st_size);
  if (offset > size || length > size - offset) {
    (void)::close(fd);
    return std::unexpected(core::error{core::error_code::out_of_range, "range beyond end of file", "io.file"});
  }
  std::vector<std::uint8_t> out(static_cast<std::size_t>(length));
  std::size_t got = 0;
  while (got < out.size()) {
    ssize_t n = ::pread(fd, out.data() + got, out.size() - got, static_cast<off_t>(offset + got));
    if (n < 0) {
      if (errno == EINTR) continue;
      auto err = errno_error("pread failed", p);
      (void)::close(fd);
      return std::unexpected(std::move(err));
    }
    if (n == 0) {
      (void)::close(fd);
      return std::unexpected(core::error{core::error_code::io_eof, "file shrank while reading", "io.file"});
    }
    got += static_cast<std::size_t>(n);
  }
  (void)::close(fd);
  return out;
}

} // namespace spillway::io
