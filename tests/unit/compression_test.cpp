#include <catch2/catch_all.hpp>
#include <spillway/io/compression.hpp>

#include <tests/support/memory_segment_writer.hpp>

using namespace spillway;

TEST_CASE("identity compression hands back the sink it was given", "[compression]") {
  std::vector<std::uint8_t> out;
  auto inner = std::make_unique<test_support::memory_sink>(out);
  auto* raw = inner.get();
  auto t = io::make_compression(io::compression_kind::none, 0);
  REQUIRE(t.has_value());
  auto top = (*t)(std::move(inner));
  REQUIRE(top.has_value());
  REQUIRE(top->get() == raw);

  bool truncated = true;
  std::vector<std::uint8_t> bytes{1, 2, 3};
  auto plain = io::decompress(io::compression_kind::none, bytes, &truncated);
  REQUIRE(plain.has_value());
  REQUIRE(*plain == bytes);
  REQUIRE_FALSE(truncated);
}

TEST_CASE("zstd availability matches the build", "[compression][zstd]") {
  REQUIRE(io::to_string(io::compression_kind::zstd) == "zstd");
  auto t = io::zstd_compression(3);
  if (io::zstd_available()) {
    REQUIRE(t.has_value());
  } else {
    REQUIRE_FALSE(t.has_value());
    REQUIRE(t.error().code == core::error_code::unsupported);
  }
}
