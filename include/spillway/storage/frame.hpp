#pragma once

/** \file frame.hpp
 *  \brief Record frame encode/decode and CRC32C verification (pure, in-memory).
 *
 * Layout (little-endian on all platforms):
 *   u32 magic | u32 len | u16 type | u16 reserved=0 | u64 seq | payload | u32 crc32c
 * len counts header + payload + CRC; the CRC covers [magic..payload].
 * Thread-safety: functions are stateless and thread-safe.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "spillway/error.hpp"

namespace spillway::storage {

constexpr std::uint32_t FRAME_MAGIC = 0x53504C57u; // "SPLW"
constexpr std::size_t FRAME_HEADER_SIZE = 4 + 4 + 2 + 2 + 8; // 20 bytes
constexpr std::size_t FRAME_OVERHEAD = FRAME_HEADER_SIZE + 4;
constexpr std::uint16_t FRAME_TYPE_RECORD = 1;

struct record_frame {
  std::uint32_t len;       // total length including header+payload+CRC
  std::uint16_t type;
  std::uint64_t seq;       // position of the record within its stream
  std::span<const std::uint8_t> payload; // does not own memory
  std::uint32_t crc32c;
};

// CRC32C (Castagnoli) over the given bytes
auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t;

// Verify CRC32C of a full frame buffer (includes CRC at the end)
auto verify_crc32c(std::span<const std::uint8_t> full_frame) -> bool;

// Append one encoded frame to out; invalid_argument if the payload overflows the 32-bit length
auto encode_frame_into(std::vector<std::uint8_t>& out, std::uint64_t seq, std::uint16_t type,
                       std::span<const std::uint8_t> payload) -> std::expected<void, core::error>;

auto encode_frame(std::uint64_t seq, std::uint16_t type, std::span<const std::uint8_t> payload)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

// Decode exactly one frame occupying all of bytes (no allocations for payload)
auto decode_frame(std::span<const std::uint8_t> bytes) -> std::expected<record_frame, core::error>;

// Length field of the frame starting at bytes, or 0 when the header is short, the magic is wrong
// or the length is below the minimum frame size
auto peek_frame_len(std::span<const std::uint8_t> bytes) noexcept -> std::uint32_t;

} // namespace spillway::storage
