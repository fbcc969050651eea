#include "spillway/io/zstd_sink.hpp"

#include <string>

#include <zstd.h>

namespace spillway::io {

namespace {
auto zstd_error(const char* what, std::size_t code) -> core::error {
  return core::error{core::error_code::io_failed, std::string(what) + ": " + ZSTD_getErrorName(code), "io.zstd"};
}
}

zstd_sink::zstd_sink(std::unique_ptr<byte_sink> inner, ZSTD_CCtx_s* cctx)
  : inner_(std::move(inner)), cctx_(cctx), out_(ZSTD_CStreamOutSize()) {}

zstd_sink::~zstd_sink() {
  if (cctx_) ZSTD_freeCCtx(cctx_);
}

auto zstd_sink::create(std::unique_ptr<byte_sink> inner, int level)
    -> std::expected<std::unique_ptr<zstd_sink>, core::error> {
  if (level < 1 || level > ZSTD_maxCLevel()) {
    return std::unexpected(core::error{core::error_code::invalid_argument, "zstd level out of range", "io.zstd"});
  }
  ZSTD_CCtx* cctx = ZSTD_createCCtx();
  if (!cctx) return std::unexpected(core::error{core::error_code::internal, "ZSTD_createCCtx failed", "io.zstd"});
  const std::size_t rc = ZSTD_CCtx_setParameter(cctx, ZSTD_c_compressionLevel, level);
  if (ZSTD_isError(rc)) {
    ZSTD_freeCCtx(cctx);
    return std::unexpected(zstd_error("set level failed", rc));
  }
  // Segments are read back by offset/length; the checksum lets readers reject torn frames.
  (void)ZSTD_CCtx_setParameter(cctx, ZSTD_c_checksumFlag, 1);
  return std::unique_ptr<zstd_sink>(new zstd_sink(std::move(inner), cctx));
}

auto zstd_sink::pump(std::span<const std::uint8_t> bytes, int directive) -> std::expected<void, core::error> {
  const auto mode = static_cast<ZSTD_EndDirective>(directive);
  ZSTD_inBuffer in{bytes.data(), bytes.size(), 0};
  while (true) {
    ZSTD_outBuffer out{out_.data(), out_.size(), 0};
    const std::size_t remaining = ZSTD_compressStream2(cctx_, &out, &in, mode);
    if (ZSTD_isError(remaining)) return std::unexpected(zstd_error("compress failed", remaining));
    if (out.pos > 0) {
      if (auto r = inner_->write({out_.data(), out.pos}); !r) return r;
    }
    const bool done = (mode == ZSTD_e_continue) ? (in.pos == in.size) : (remaining == 0);
    if (done) return {};
  }
}

auto zstd_sink::write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> {
  if (closed_) return std::unexpected(core::error{core::error_code::io_failed, "write on closed compressor", "io.zstd"});
  if (bytes.empty()) return {};
  return pump(bytes, ZSTD_e_continue);
}

auto zstd_sink::flush() -> std::expected<void, core::error> {
  if (closed_) return std::unexpected(core::error{core::error_code::io_failed, "flush on closed compressor", "io.zstd"});
  if (auto r = pump({}, ZSTD_e_flush); !r) return r;
  return inner_->flush();
}

auto zstd_sink::close() -> std::expected<void, core::error> {
  if (closed_) return {};
  closed_ = true;
  auto ended = pump({}, ZSTD_e_end);
  auto closed = inner_->close();
  if (!ended) return ended;
  return closed;
}

auto zstd_decompress(std::span<const std::uint8_t> input)
    -> std::expected<decompressed_bytes, core::error> {
  decompressed_bytes result;
  if (input.empty()) return result;
  ZSTD_DCtx* dctx = ZSTD_createDCtx();
  if (!dctx) return std::unexpected(core::error{core::error_code::internal, "ZSTD_createDCtx failed", "io.zstd"});
  std::vector<std::uint8_t> chunk(ZSTD_DStreamOutSize());
  ZSTD_inBuffer in{input.data(), input.size(), 0};
  std::size_t last = 0;
  while (in.pos < in.size) {
    ZSTD_outBuffer out{chunk.data(), chunk.size(), 0};
    last = ZSTD_decompressStream(dctx, &out, &in);
    if (ZSTD_isError(last)) {
      ZSTD_freeDCtx(dctx);
      return std::unexpected(core::error{core::error_code::data_integrity,
                                         std::string("decompress failed: ") + ZSTD_getErrorName(last), "io.zstd"});
    }
    result.bytes.insert(result.bytes.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(out.pos));
  }
  // Drain output still held by the decoder after the input is consumed.
  while (last != 0) {
    ZSTD_outBuffer out{chunk.data(), chunk.size(), 0};
    last = ZSTD_decompressStream(dctx, &out, &in);
    if (ZSTD_isError(last)) {
      ZSTD_freeDCtx(dctx);
      return std::unexpected(core::error{core::error_code::data_integrity,
                                         std::string("decompress failed: ") + ZSTD_getErrorName(last), "io.zstd"});
    }
    result.bytes.insert(result.bytes.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(out.pos));
    if (out.pos == 0) break;
  }
  result.truncated = (last != 0);
  ZSTD_freeDCtx(dctx);
  return result;
}

} // namespace spillway::io
