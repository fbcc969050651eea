#pragma once

/** \file frame_serializer.hpp
 *  \brief Default serializer: one CRC-checked frame per byte record (see frame.hpp).
 *
 * Streams batch encoded frames in memory and push them to the sink on flush(), close(),
 * or when the batch reaches batch_bytes. Frame sequence numbers restart at 0 for every stream.
 */

#include <cstddef>
#include <cstdint>
#include <span>

#include "spillway/storage/serializer.hpp"

namespace spillway::storage {

using record_view = std::span<const std::uint8_t>;

class frame_serializer final : public serializer<record_view> {
public:
  explicit frame_serializer(std::size_t batch_bytes = 64 * 1024) : batch_bytes_(batch_bytes) {}

  auto serialize_stream(io::byte_sink& sink) const -> std::unique_ptr<serialization_stream<record_view>> override;

private:
  std::size_t batch_bytes_;
};

} // namespace spillway::storage
