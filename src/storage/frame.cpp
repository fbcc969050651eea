#include "spillway/storage/frame.hpp"

#include <array>
#include <cstring>
#include <limits>

namespace spillway::storage {

// Reflected CRC-32C (Castagnoli) table using reversed polynomial 0x82F63B78
static constexpr std::array<std::uint32_t, 256> CRC32C_TABLE = []{
  std::array<std::uint32_t, 256> t{};
  const std::uint32_t poly = 0x82F63B78u;
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t c = i;
    for (int k = 0; k < 8; ++k) {
      c = (c & 1u) ? (poly ^ (c >> 1)) : (c >> 1);
    }
    t[i] = c;
  }
  return t;
}();

auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t {
  std::uint32_t c = ~0u;
  for (auto b : bytes) {
    c = CRC32C_TABLE[(c ^ b) & 0xFFu] ^ (c >> 8);
  }
  return ~c;
}

static auto load_le32(const std::uint8_t* p) -> std::uint32_t {
  std::uint32_t v;
  std::memcpy(&v, p, 4);
  return v;
}
static auto load_le16(const std::uint8_t* p) -> std::uint16_t {
  std::uint16_t v;
  std::memcpy(&v, p, 2);
  return v;
}
static auto load_le64(const std::uint8_t* p) -> std::uint64_t {
  std::uint64_t v;
  std::memcpy(&v, p, 8);
  return v;
}

auto verify_crc32c(std::span<const std::uint8_t> full_frame) -> bool {
  if (full_frame.size() < FRAME_OVERHEAD) return false;
  const std::size_t n = full_frame.size();
  const std::uint32_t expect = load_le32(full_frame.data() + n - 4);
  return expect == crc32c(full_frame.first(n - 4));
}

auto encode_frame_into(std::vector<std::uint8_t>& out, std::uint64_t seq, std::uint16_t type,
                       std::span<const std::uint8_t> payload) -> std::expected<void, core::error> {
  const std::size_t max_payload = std::numeric_limits<std::uint32_t>::max() - FRAME_OVERHEAD;
  if (payload.size() > max_payload) {
    return std::unexpected(core::error{core::error_code::invalid_argument, "payload too large", "storage.frame"});
  }
  const std::uint32_t len = static_cast<std::uint32_t>(FRAME_OVERHEAD + payload.size());
  const std::size_t base = out.size();
  out.resize(base + len);
  std::uint8_t* p = out.data() + base;
  auto store_le32 = [&](std::uint32_t v){ std::memcpy(p, &v, 4); p += 4; };
  auto store_le16 = [&](std::uint16_t v){ std::memcpy(p, &v, 2); p += 2; };
  auto store_le64 = [&](std::uint64_t v){ std::memcpy(p, &v, 8); p += 8; };

  store_le32(FRAME_MAGIC);
  store_le32(len);
  store_le16(type);
  store_le16(0);
  store_le64(seq);
  if (!payload.empty()) { std::memcpy(p, payload.data(), payload.size()); p += payload.size(); }
  const std::uint32_t c = crc32c({out.data() + base, len - 4u});
  store_le32(c);
  return {};
}

auto encode_frame(std::uint64_t seq, std::uint16_t type, std::span<const std::uint8_t> payload)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  std::vector<std::uint8_t> out;
  if (auto r = encode_frame_into(out, seq, type, payload); !r) return std::unexpected(r.error());
  return out;
}

auto peek_frame_len(std::span<const std::uint8_t> bytes) noexcept -> std::uint32_t {
  if (bytes.size() < FRAME_HEADER_SIZE) return 0;
  if (load_le32(bytes.data()) != FRAME_MAGIC) return 0;
  const std::uint32_t len = load_le32(bytes.data() + 4);
  return len < FRAME_OVERHEAD ? 0 : len;
}

auto decode_frame(std::span<const std::uint8_t> bytes) -> std::expected<record_frame, core::error> {
  using core::error; using core::error_code;
  if (bytes.size() < FRAME_OVERHEAD) {
    return std::unexpected(error{error_code::data_integrity, "frame too short", "storage.frame"});
  }
  const std::uint8_t* p = bytes.data();
  const std::uint32_t magic = load_le32(p); p += 4;
  const std::uint32_t len = load_le32(p); p += 4;
  const std::uint16_t type = load_le16(p); p += 2;
  const std::uint16_t reserved = load_le16(p); p += 2;
  const std::uint64_t seq = load_le64(p);

  if (magic != FRAME_MAGIC) {
    return std::unexpected(error{error_code::data_integrity, "bad magic", "storage.frame"});
  }
  if (len != bytes.size()) {
    return std::unexpected(error{error_code::data_integrity, "len mismatch", "storage.frame"});
  }
  if (reserved != 0) {
    return std::unexpected(error{error_code::data_integrity, "reserved != 0", "storage.frame"});
  }
  if (!verify_crc32c(bytes)) {
    return std::unexpected(error{error_code::data_integrity, "crc mismatch", "storage.frame"});
  }
  std::span<const std::uint8_t> payload{bytes.data() + FRAME_HEADER_SIZE, len - FRAME_OVERHEAD};
  return record_frame{len, type, seq, payload, load_le32(bytes.data() + len - 4)};
}

} // namespace spillway::storage
