#pragma once

/** \file zstd_sink.hpp
 *  \brief Streaming zstd compressor layer and whole-buffer stream decompressor.
 *
 * Available when the library is built with libzstd (SPILLWAY_HAS_ZSTD).
 * - write(): feeds bytes to the compressor (ZSTD_e_continue); compressed output goes to the inner sink.
 * - flush(): ZSTD_e_flush, so every byte written so far is decodable from the inner sink, then flushes it.
 * - close(): ZSTD_e_end terminates the frame, then closes the inner sink (always, even on error).
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <vector>

#include "spillway/io/byte_sink.hpp"

struct ZSTD_CCtx_s;

namespace spillway::io {

class zstd_sink final : public byte_sink {
public:
  ~zstd_sink() override;
  zstd_sink(const zstd_sink&) = delete;
  zstd_sink& operator=(const zstd_sink&) = delete;

  static auto create(std::unique_ptr<byte_sink> inner, int level)
      -> std::expected<std::unique_ptr<zstd_sink>, core::error>;

  auto write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> override;
  auto flush() -> std::expected<void, core::error> override;
  auto close() -> std::expected<void, core::error> override;

private:
  zstd_sink(std::unique_ptr<byte_sink> inner, ZSTD_CCtx_s* cctx);
  auto pump(std::span<const std::uint8_t> bytes, int directive) -> std::expected<void, core::error>;

  std::unique_ptr<byte_sink> inner_;
  ZSTD_CCtx_s* cctx_{nullptr};
  std::vector<std::uint8_t> out_;
  bool closed_{false};
};

struct decompressed_bytes {
  std::vector<std::uint8_t> bytes;
  bool truncated{false};   /**< input ended inside a frame; bytes holds everything decodable */
};

/** Decompresses a concatenation of zstd frames (flush blocks allowed). Corrupt input is data_integrity. */
auto zstd_decompress(std::span<const std::uint8_t> input)
    -> std::expected<decompressed_bytes, core::error>;

} // namespace spillway::io
