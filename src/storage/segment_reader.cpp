#include "spillway/storage/segment_reader.hpp"

#include "spillway/io/file_ops.hpp"

namespace spillway::storage {

auto scan_segment(const file_segment& segment, const segment_scan_options& opts,
                  const std::function<void(const record_frame&)>& on_record)
    -> std::expected<segment_scan_stats, core::error> {
  segment_scan_stats stats{};
  auto raw = io::read_range(segment.file, segment.offset, segment.length);
  if (!raw) return std::unexpected(raw.error());

  bool truncated = false;
  auto plain = io::decompress(opts.compression, *raw, &truncated);
  if (!plain) return std::unexpected(plain.error());
  stats.torn_tail = truncated;

  std::span<const std::uint8_t> rest{*plain};
  while (!rest.empty()) {
    const std::uint32_t len = peek_frame_len(rest);
    if (len == 0 || len > rest.size()) { stats.torn_tail = true; break; }
    auto f = decode_frame(rest.first(len));
    if (!f) { stats.torn_tail = true; break; }
    stats.records += 1;
    stats.bytes += len;
    if (on_record) on_record(*f);
    rest = rest.subspan(len);
  }
  return stats;
}

auto read_segment(const file_segment& segment, const segment_scan_options& opts)
    -> std::expected<std::vector<std::vector<std::uint8_t>>, core::error> {
  std::vector<std::vector<std::uint8_t>> out;
  auto s = scan_segment(segment, opts, [&](const record_frame& f){
    out.emplace_back(f.payload.begin(), f.payload.end());
  });
  if (!s) return std::unexpected(s.error());
  return out;
}

} // namespace spillway::storage
