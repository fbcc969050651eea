#pragma once

/** \file file_segment.hpp
 *  \brief Location of the bytes produced by one committed segment.
 */

#include <cstdint>
#include <filesystem>
#include <iosfwd>

namespace spillway::storage {

struct file_segment {
  std::filesystem::path file;
  std::uint64_t offset{};   /**< absolute byte offset of the first committed byte */
  std::uint64_t length{};   /**< number of committed bytes */

  std::uint64_t end() const noexcept { return offset + length; }

  friend bool operator==(const file_segment&, const file_segment&) = default;
};

std::ostream& operator<<(std::ostream& out, const file_segment& s);

} // namespace spillway::storage
