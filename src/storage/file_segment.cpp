#include "spillway/storage/file_segment.hpp"

#include <ostream>

namespace spillway::storage {

std::ostream& operator<<(std::ostream& out, const file_segment& s) {
  return out << "file_segment{" << s.file.string() << ", offset=" << s.offset << ", length=" << s.length << "}";
}

} // namespace spillway::storage
