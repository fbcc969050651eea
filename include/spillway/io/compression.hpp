#pragma once

/** \file compression.hpp
 *  \brief Compression transforms: functions from an output sink to an output sink.
 *
 * A transform is applied once when a pipeline opens. It takes ownership of the sink below it
 * and returns the sink callers write into. identity_compression() returns its argument.
 */

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "spillway/error.hpp"
#include "spillway/io/byte_sink.hpp"

namespace spillway::io {

using compression_transform =
    std::function<std::expected<std::unique_ptr<byte_sink>, core::error>(std::unique_ptr<byte_sink>)>;

enum class compression_kind : std::uint8_t { none, zstd };

auto to_string(compression_kind kind) noexcept -> std::string_view;

/** Whether this build links libzstd. */
bool zstd_available() noexcept;

auto identity_compression() -> compression_transform;

/** Streaming zstd at the given level; unsupported when built without libzstd. */
auto zstd_compression(int level) -> std::expected<compression_transform, core::error>;

/** Transform for a kind; level is ignored for none. */
auto make_compression(compression_kind kind, int level) -> std::expected<compression_transform, core::error>;

/** Inverse of make_compression over a whole byte range. truncated is set when the range ends mid-stream. */
auto decompress(compression_kind kind, std::span<const std::uint8_t> input, bool* truncated)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

} // namespace spillway::io
