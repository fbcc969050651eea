#include <catch2/catch_all.hpp>
#include <spillway/io/buffered_sink.hpp>
#include <spillway/storage/frame.hpp>
#include <spillway/storage/frame_serializer.hpp>

#include <tests/support/memory_segment_writer.hpp>

using namespace spillway;

TEST_CASE("frame stream holds frames until flush", "[serializer][frame]") {
  std::vector<std::uint8_t> file;
  test_support::memory_sink sink(file);
  storage::frame_serializer ser(1024);
  auto s = ser.serialize_stream(sink);

  std::vector<std::uint8_t> p{1, 2, 3};
  REQUIRE(s->write_object(p).has_value());
  REQUIRE(s->write_object(p).has_value());
  REQUIRE(file.empty());
  REQUIRE(s->flush().has_value());
  REQUIRE(file.size() == 2 * (storage::FRAME_OVERHEAD + 3));

  auto second = storage::decode_frame({file.data() + storage::FRAME_OVERHEAD + 3, storage::FRAME_OVERHEAD + 3});
  REQUIRE(second.has_value());
  REQUIRE(second->seq == 1);
}

TEST_CASE("frame stream pushes once the batch is full and rejects writes after close", "[serializer][frame]") {
  std::vector<std::uint8_t> file;
  test_support::memory_sink sink(file);
  storage::frame_serializer ser(32);
  auto s = ser.serialize_stream(sink);

  std::vector<std::uint8_t> p(16, 0x11);
  REQUIRE(s->write_object(p).has_value());
  REQUIRE(file.size() == storage::FRAME_OVERHEAD + 16);
  REQUIRE(s->close().has_value());
  REQUIRE(s->close().has_value());
  auto w = s->write_object(p);
  REQUIRE_FALSE(w.has_value());
  REQUIRE(w.error().code == core::error_code::precondition_failed);
}

TEST_CASE("flushing the sink alone loses frames held by the stream", "[serializer][frame][flush]") {
  std::vector<std::uint8_t> file;
  io::buffered_sink bs(std::make_unique<test_support::memory_sink>(file), 8);
  storage::frame_serializer ser;
  auto s = ser.serialize_stream(bs);
  std::vector<std::uint8_t> p{4, 2};
  REQUIRE(s->write_object(p).has_value());
  REQUIRE(bs.flush().has_value());
  REQUIRE(file.empty());
  REQUIRE(s->flush().has_value());
  REQUIRE(bs.flush().has_value());
  REQUIRE(file.size() == storage::FRAME_OVERHEAD + 2);
}
