#pragma once

/** \file serializer.hpp
 *  \brief Serialization transform consumed by segment writers.
 *
 * A serializer opens streams over a byte sink it does not own. A stream may buffer
 * internally and is only required to hand its bytes to the sink on flush() or close();
 * writers therefore flush the stream explicitly before flushing the sink.
 * close() must not close the sink and must be idempotent.
 */

#include <expected>
#include <memory>

#include "spillway/error.hpp"
#include "spillway/io/byte_sink.hpp"

namespace spillway::storage {

template <typename T>
class serialization_stream {
public:
  virtual ~serialization_stream() = default;

  virtual auto write_object(const T& value) -> std::expected<void, core::error> = 0;
  virtual auto flush() -> std::expected<void, core::error> = 0;
  virtual auto close() -> std::expected<void, core::error> = 0;
};

template <typename T>
class serializer {
public:
  using value_type = T;

  virtual ~serializer() = default;

  /** Opens a fresh stream writing into sink; sink must outlive the stream. */
  virtual auto serialize_stream(io::byte_sink& sink) const -> std::unique_ptr<serialization_stream<T>> = 0;
};

} // namespace spillway::storage
