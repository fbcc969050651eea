#include "spillway/storage/writer_options.hpp"
#include "spillway/core/platform_utils.hpp"

#include <charconv>
#include <string>

namespace spillway::storage {

namespace {
auto invalid(std::string msg) -> core::error {
  return core::error{core::error_code::config_invalid, std::move(msg), "storage.config"};
}

template <typename Int>
auto parse_int(const std::string& s) -> std::optional<Int> {
  Int v{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}
}

bool writer_options::effective_sync() const noexcept {
  if (durability_profile.has_value()) {
    switch (*durability_profile) {
      case DurabilityProfile::None: return false;
      case DurabilityProfile::Commit: return true;
    }
  }
  return sync_writes;
}

auto validate(const writer_options& opts) -> std::expected<void, core::error> {
  if (opts.buffer_size == 0) return std::unexpected(invalid("buffer_size must be > 0"));
  if (opts.compression == io::compression_kind::zstd && (opts.zstd_level < 1 || opts.zstd_level > 19)) {
    return std::unexpected(invalid("zstd_level must be in 1..19"));
  }
  return {};
}

auto options_from_env(const writer_options& base) -> std::expected<writer_options, core::error> {
  writer_options o = base;
  if (auto v = core::safe_getenv("SPILLWAY_SYNC_WRITES"); v) {
    auto flag = core::parse_env_flag(v);
    if (!flag) return std::unexpected(invalid("SPILLWAY_SYNC_WRITES: expected a boolean, got '" + *v + "'"));
    o.sync_writes = *flag;
    o.durability_profile.reset();
  }
  if (auto v = core::safe_getenv("SPILLWAY_BUFFER_SIZE"); v) {
    auto n = parse_int<std::size_t>(*v);
    if (!n || *n == 0) return std::unexpected(invalid("SPILLWAY_BUFFER_SIZE: expected a positive integer, got '" + *v + "'"));
    o.buffer_size = *n;
  }
  if (auto v = core::safe_getenv("SPILLWAY_COMPRESSION"); v) {
    if (*v == "none") o.compression = io::compression_kind::none;
    else if (*v == "zstd") o.compression = io::compression_kind::zstd;
    else return std::unexpected(invalid("SPILLWAY_COMPRESSION: expected none|zstd, got '" + *v + "'"));
  }
  if (auto v = core::safe_getenv("SPILLWAY_ZSTD_LEVEL"); v) {
    auto n = parse_int<int>(*v);
    if (!n) return std::unexpected(invalid("SPILLWAY_ZSTD_LEVEL: expected an integer, got '" + *v + "'"));
    o.zstd_level = *n;
  }
  if (auto r = validate(o); !r) return std::unexpected(r.error());
  return o;
}

} // namespace spillway::storage
