#include <catch2/catch_all.hpp>
#include <spillway/io/file_ops.hpp>
#include <spillway/io/file_sink.hpp>

#include <tests/support/temp_path.hpp>

using namespace spillway;

TEST_CASE("file_length reports zero for a missing file", "[io][file]") {
  test_support::temp_path tmp("ops_missing");
  auto n = io::file_length(tmp.path());
  REQUIRE(n.has_value());
  REQUIRE(*n == 0);
}

TEST_CASE("truncate_file shrinks to the requested length", "[io][file]") {
  test_support::temp_path tmp("ops_truncate");
  tmp.fill(100);
  REQUIRE(io::truncate_file(tmp.path(), 40).has_value());
  REQUIRE(*io::file_length(tmp.path()) == 40);
  REQUIRE(io::truncate_file(tmp.path(), 40).has_value());
  REQUIRE(tmp.size() == 40);
}

TEST_CASE("read_range returns exact bytes and rejects ranges past the end", "[io][file]") {
  test_support::temp_path tmp("ops_read");
  {
    auto fs = io::file_sink::open_append(tmp.path());
    REQUIRE(fs.has_value());
    std::vector<std::uint8_t> data{0, 1, 2, 3, 4, 5, 6, 7};
    REQUIRE((*fs)->write(data).has_value());
    REQUIRE((*fs)->close().has_value());
  }
  auto mid = io::read_range(tmp.path(), 2, 3);
  REQUIRE(mid.has_value());
  REQUIRE(*mid == std::vector<std::uint8_t>{2, 3, 4});
  REQUIRE(io::read_range(tmp.path(), 8, 0).has_value());

  auto past = io::read_range(tmp.path(), 6, 3);
  REQUIRE_FALSE(past.has_value());
  REQUIRE(past.error().code == core::error_code::out_of_range);

  test_support::temp_path missing("ops_read_missing");
  auto nf = io::read_range(missing.path(), 0, 1);
  REQUIRE_FALSE(nf.has_value());
  REQUIRE(nf.error().code == core::error_code::not_found);
}

TEST_CASE("file_sink appends at end of file and syncs on close when asked", "[io][file][sync]") {
  test_support::temp_path tmp("ops_sink");
  tmp.fill(5);
  auto fs = io::file_sink::open_append(tmp.path());
  REQUIRE(fs.has_value());
  (*fs)->set_sync_on_close(true);
  std::vector<std::uint8_t> data{9, 9, 9};
  REQUIRE((*fs)->write(data).has_value());
  REQUIRE((*fs)->close().has_value());
  REQUIRE((*fs)->syncs() == 1);
  REQUIRE_FALSE((*fs)->is_open());
  REQUIRE((*fs)->close().has_value());
  REQUIRE_FALSE((*fs)->write(data).has_value());
  REQUIRE(tmp.size() == 8);
  REQUIRE(io::fsync_path(tmp.path()).has_value());
}

TEST_CASE("file_sink reports open failures as io_failed", "[io][file][errors]") {
  auto fs = io::file_sink::open_append("/nonexistent-dir-for-spillway/segment.bin");
  REQUIRE_FALSE(fs.has_value());
  REQUIRE(fs.error().code == core::error_code::io_failed);
  REQUIRE(fs.error().component == "io.file");
}
