#pragma once

/** \file writer_options.hpp
 *  \brief Segment writer configuration and its environment overlay.
 *
 * Environment variables (read through core::safe_getenv):
 * - SPILLWAY_SYNC_WRITES   1|0|true|false|on|off|yes|no
 * - SPILLWAY_BUFFER_SIZE   bytes, > 0
 * - SPILLWAY_COMPRESSION   none|zstd
 * - SPILLWAY_ZSTD_LEVEL    1..19
 * Malformed values are config_invalid rather than silently ignored.
 */

#include <cstddef>
#include <expected>
#include <optional>

#include "spillway/error.hpp"
#include "spillway/io/buffered_sink.hpp"
#include "spillway/io/compression.hpp"

namespace spillway::storage {

/** Durability profiles map onto sync_writes. */
enum class DurabilityProfile { None, Commit };

struct writer_options {
  std::size_t buffer_size{io::DEFAULT_BUFFER_SIZE}; /**< output buffer below the compression layer */
  bool sync_writes{false};                          /**< fsync the file when the pipeline closes */
  io::compression_kind compression{io::compression_kind::none};
  int zstd_level{3};
  std::optional<DurabilityProfile> durability_profile; /**< optional alias; overrides sync_writes when set */

  /** Effective sync setting after applying durability_profile. */
  bool effective_sync() const noexcept;
};

/** config_invalid for a zero buffer or a zstd level outside 1..19. */
auto validate(const writer_options& opts) -> std::expected<void, core::error>;

/** Returns base with any SPILLWAY_* environment overrides applied, validated. */
auto options_from_env(const writer_options& base = {}) -> std::expected<writer_options, core::error>;

} // namespace spillway::storage
