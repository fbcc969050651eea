#include "spillway/io/compression.hpp"

#ifdef SPILLWAY_HAS_ZSTD
#include "spillway/io/zstd_sink.hpp"
#endif

namespace spillway::io {

auto to_string(compression_kind kind) noexcept -> std::string_view {
  switch (kind) {
    case compression_kind::none: return "none";
    case compression_kind::zstd: return "zstd";
  }
  return "unknown";
}

bool zstd_available() noexcept {
#ifdef SPILLWAY_HAS_ZSTD
  return true;
#else
  return false;
#endif
}

auto identity_compression() -> compression_transform {
  return [](std::unique_ptr<byte_sink> sink) -> std::expected<std::unique_ptr<byte_sink>, core::error> {
    return sink;
  };
}

auto zstd_compression(int level) -> std::expected<compression_transform, core::error> {
#ifdef SPILLWAY_HAS_ZSTD
  return compression_transform(
    [level](std::unique_ptr<byte_sink> sink) -> std::expected<std::unique_ptr<byte_sink>, core::error> {
      auto z = zstd_sink::create(std::move(sink), level);
      if (!z) return std::unexpected(z.error());
      return std::unique_ptr<byte_sink>(std::move(*z));
    });
#else
  (void)level;
  return std::unexpected(core::error{core::error_code::unsupported, "built without zstd", "io.compression"});
#endif
}

auto make_compression(compression_kind kind, int level) -> std::expected<compression_transform, core::error> {
  switch (kind) {
    case compression_kind::none: return identity_compression();
    case compression_kind::zstd: return zstd_compression(level);
  }
  return std::unexpected(core::error{core::error_code::invalid_argument, "unknown compression kind", "io.compression"});
}

auto decompress(compression_kind kind, std::span<const std::uint8_t> input, bool* truncated)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  if (truncated) *truncated = false;
  switch (kind) {
    case compression_kind::none:
      return std::vector<std::uint8_t>(input.begin(), input.end());
    case compression_kind::zstd: {
#ifdef SPILLWAY_HAS_ZSTD
      auto d = zstd_decompress(input);
      if (!d) return std::unexpected(d.error());
      if (truncated) *truncated = d->truncated;
      return std::move(d->bytes);
#else
      return std::unexpected(core::error{core::error_code::unsupported, "built without zstd", "io.compression"});
#endif
    }
  }
  return std::unexpected(core::error{core::error_code::invalid_argument, "unknown compression kind", "io.compression"});
}

} // namespace spillway::io
