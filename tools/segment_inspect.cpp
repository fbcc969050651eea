#include <spillway/error.hpp>
#include <spillway/io/file_ops.hpp>
#include <spillway/io/compression.hpp>
#include <spillway/storage/file_segment.hpp>
#include <spillway/storage/frame.hpp>

#include <charconv>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using namespace spillway;

static std::optional<std::uint64_t> parse_u64(std::string_view s) {
    std::uint64_t v{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

static int usage() {
    std::cerr << "usage: spillway_segment_inspect <file> <offset> <length> [--zstd]\n";
    return 2;
}

static int fail(const core::error& e) {
    std::cerr << "[spillway_segment_inspect] " << core::to_string(e.code) << " (" << e.component << "): "
              << e.message << "\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc != 4 && argc != 5) return usage();
    auto offset = parse_u64(argv[2]);
    auto length = parse_u64(argv[3]);
    if (!offset || !length) return usage();
    auto kind = io::compression_kind::none;
    if (argc == 5) {
        if (std::string_view(argv[4]) != "--zstd") return usage();
        kind = io::compression_kind::zstd;
    }

    const storage::file_segment seg{argv[1], *offset, *length};
    std::cout << "segment " << seg << "\n";

    // Frames are printed individually, including the first bad one, so the raw scan is done here
    // instead of through scan_segment.
    auto raw = io::read_range(seg.file, seg.offset, seg.length);
    if (!raw) return fail(raw.error());
    bool truncated = false;
    auto plain = io::decompress(kind, *raw, &truncated);
    if (!plain) return fail(plain.error());

    std::span<const std::uint8_t> rest{*plain};
    std::uint64_t pos = 0;
    std::size_t good = 0;
    while (!rest.empty()) {
        const std::uint32_t len = storage::peek_frame_len(rest);
        if (len == 0 || len > rest.size()) {
            std::cout << "@" << pos << " torn tail: " << rest.size() << " trailing bytes\n";
            break;
        }
        auto f = storage::decode_frame(rest.first(len));
        if (!f) {
            std::cout << "@" << pos << " bad frame len=" << len << ": " << f.error().message << "\n";
            break;
        }
        std::cout << "@" << pos << " seq=" << f->seq << " type=" << f->type << " payload=" << f->payload.size()
                  << " crc=0x" << std::hex << std::setw(8) << std::setfill('0') << f->crc32c << std::dec
                  << std::setfill(' ') << " ok\n";
        ++good;
        pos += len;
        rest = rest.subspan(len);
    }
    if (truncated) std::cout << "compressed stream ends mid-frame\n";
    std::cout << good << " frame(s), " << plain->size() << " byte(s)"
              << (kind == io::compression_kind::zstd ? " decompressed" : "") << "\n";
    return 0;
}
