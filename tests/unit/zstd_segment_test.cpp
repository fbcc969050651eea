#include <catch2/catch_all.hpp>
#include <spillway/io/compression.hpp>
#include <spillway/io/zstd_sink.hpp>
#include <spillway/storage/block_object_writer.hpp>
#include <spillway/storage/frame_serializer.hpp>
#include <spillway/storage/segment_reader.hpp>

#include <tests/support/memory_segment_writer.hpp>
#include <tests/support/temp_path.hpp>

#include <string>

using namespace spillway;

namespace {
auto bytes_of(const std::string& s) -> std::vector<std::uint8_t> { return {s.begin(), s.end()}; }
}

TEST_CASE("zstd flush makes everything written so far decodable", "[zstd][flush]") {
  std::vector<std::uint8_t> out;
  auto z = io::zstd_sink::create(std::make_unique<test_support::memory_sink>(out), 3);
  REQUIRE(z.has_value());
  auto payload = bytes_of(std::string(2000, 'q'));
  REQUIRE((*z)->write(payload).has_value());
  REQUIRE((*z)->flush().has_value());
  REQUIRE_FALSE(out.empty());

  auto partial = io::zstd_decompress(out);
  REQUIRE(partial.has_value());
  REQUIRE(partial->bytes == payload);
  REQUIRE(partial->truncated);

  REQUIRE((*z)->close().has_value());
  auto full = io::zstd_decompress(out);
  REQUIRE(full.has_value());
  REQUIRE(full->bytes == payload);
  REQUIRE_FALSE(full->truncated);
}

TEST_CASE("zstd level is range-checked", "[zstd][errors]") {
  std::vector<std::uint8_t> out;
  auto z = io::zstd_sink::create(std::make_unique<test_support::memory_sink>(out), 99);
  REQUIRE_FALSE(z.has_value());
  REQUIRE(z.error().code == core::error_code::invalid_argument);
}

TEST_CASE("garbage is not a zstd stream", "[zstd][errors]") {
  std::vector<std::uint8_t> junk(64, 0x42);
  auto r = io::zstd_decompress(junk);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::data_integrity);
}

TEST_CASE("compressed segments commit and read back", "[zstd][segment][commit]") {
  test_support::temp_path tmp("zstd_commit");
  tmp.fill(100);
  const storage::writer_options opts{.compression = io::compression_kind::zstd};
  auto w = storage::disk_block_object_writer<storage::record_view>::create("z0", tmp.path(),
      std::make_shared<storage::frame_serializer>(), opts);
  REQUIRE(w.has_value());
  std::vector<std::vector<std::uint8_t>> records{bytes_of("alpha"), bytes_of(std::string(5000, 'b')), bytes_of("gamma")};
  for (const auto& r : records) REQUIRE(w->write(r).has_value());
  REQUIRE(w->commit_and_close().has_value());

  auto seg = w->file_segment();
  REQUIRE(seg.has_value());
  REQUIRE(seg->offset == 100);
  REQUIRE(seg->end() == tmp.size());

  auto back = storage::read_segment(*seg, {.compression = io::compression_kind::zstd});
  REQUIRE(back.has_value());
  REQUIRE(*back == records);
}

TEST_CASE("reverting a compressed segment restores the length", "[zstd][segment][revert]") {
  test_support::temp_path tmp("zstd_revert");
  tmp.fill(100);
  auto w = storage::disk_block_object_writer<storage::record_view>::create("z1", tmp.path(),
      std::make_shared<storage::frame_serializer>(),
      storage::writer_options{.compression = io::compression_kind::zstd});
  REQUIRE(w.has_value());
  REQUIRE(w->write(bytes_of("doomed")).has_value());
  auto out = w->revert_partial_writes_and_close();
  REQUIRE(out.truncated);
  REQUIRE(tmp.size() == 100);
}
