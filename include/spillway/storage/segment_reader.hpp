#pragma once

/** \file segment_reader.hpp
 *  \brief Read back the records of a committed file_segment.
 *
 * Reads exactly [offset, offset+length) of the file, undoes the compression the segment was
 * written with, and delivers each frame in order. A torn or corrupt tail stops the scan without
 * error and sets torn_tail. A range beyond the end of the file is out_of_range.
 */

#include <cstdint>
#include <expected>
#include <functional>
#include <vector>

#include "spillway/error.hpp"
#include "spillway/io/compression.hpp"
#include "spillway/storage/file_segment.hpp"
#include "spillway/storage/frame.hpp"

namespace spillway::storage {

struct segment_scan_options {
  io::compression_kind compression{io::compression_kind::none};
};

struct segment_scan_stats {
  std::size_t records{};        /**< delivered frames */
  std::size_t bytes{};          /**< full frame bytes delivered, after decompression */
  bool torn_tail{false};        /**< trailing bytes did not form a valid frame */
};

[[nodiscard]] auto scan_segment(const file_segment& segment, const segment_scan_options& opts,
                                const std::function<void(const record_frame&)>& on_record)
    -> std::expected<segment_scan_stats, core::error>;

/** Collects record payloads. */
[[nodiscard]] auto read_segment(const file_segment& segment, const segment_scan_options& opts = {})
    -> std::expected<std::vector<std::vector<std::uint8_t>>, core::error>;

} // namespace spillway::storage
