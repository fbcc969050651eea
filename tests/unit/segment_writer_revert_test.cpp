#include <catch2/catch_all.hpp>
#include <spillway/storage/block_object_writer.hpp>
#include <spillway/storage/frame_serializer.hpp>

#include <tests/support/failing_sink.hpp>
#include <tests/support/log_capture.hpp>
#include <tests/support/string_serializer.hpp>
#include <tests/support/temp_path.hpp>

using namespace spillway;

namespace {
auto make_writer(const test_support::temp_path& tmp, storage::writer_options opts = {}) {
  auto w = storage::disk_block_object_writer<std::string>::create("rv", tmp.path(),
      std::make_shared<test_support::string_serializer>(), opts);
  REQUIRE(w.has_value());
  return std::move(*w);
}
}

TEST_CASE("revert after two writes restores the original length", "[segment][revert]") {
  test_support::temp_path tmp("revert_ab");
  tmp.fill(100);
  auto before = tmp.bytes();

  auto w = make_writer(tmp);
  REQUIRE(w.write(std::string("record-A")).has_value());
  REQUIRE(w.write(std::string("record-B")).has_value());
  test_support::log_capture logs;
  auto rv = w.revert_partial_writes_and_close();
  REQUIRE(rv.truncated);
  REQUIRE_FALSE(rv.diagnostic.has_value());
  REQUIRE(logs.count(core::log_level::error) == 0);

  REQUIRE(tmp.size() == 100);
  REQUIRE(tmp.bytes() == before);
  REQUIRE_FALSE(w.is_open());
}

TEST_CASE("revert discards bytes that already reached the file", "[segment][revert]") {
  test_support::temp_path tmp("revert_flushed");
  tmp.fill(10);
  // A one-byte buffer pushes every serialized byte to the descriptor immediately.
  auto w = storage::disk_block_object_writer<storage::record_view>::create("rv", tmp.path(),
      std::make_shared<storage::frame_serializer>(16), storage::writer_options{.buffer_size = 1});
  REQUIRE(w.has_value());
  std::vector<std::uint8_t> payload(256, 0xEE);
  for (int i = 0; i < 8; ++i) REQUIRE(w->write(payload).has_value());
  REQUIRE(tmp.size() > 10);
  (void)w->revert_partial_writes_and_close();
  REQUIRE(tmp.size() == 10);
}

TEST_CASE("revert without writes is a harmless no-op", "[segment][revert][edge]") {
  test_support::temp_path tmp("revert_empty");
  tmp.fill(7);
  auto w = make_writer(tmp);
  auto rv = w.revert_partial_writes_and_close();
  REQUIRE(rv.truncated);
  REQUIRE(tmp.size() == 7);
}

TEST_CASE("double revert and double close change nothing after the first call", "[segment][revert][idempotent]") {
  test_support::temp_path tmp("revert_twice");
  tmp.fill(20);
  auto w = make_writer(tmp);
  REQUIRE(w.write(std::string("payload")).has_value());
  REQUIRE(w.close().has_value());
  REQUIRE(w.close().has_value());
  REQUIRE(tmp.size() == 31);

  (void)w.revert_partial_writes_and_close();
  REQUIRE(tmp.size() == 20);
  auto second = w.revert_partial_writes_and_close();
  REQUIRE(second.truncated);
  REQUIRE_FALSE(second.diagnostic.has_value());
  REQUIRE(tmp.size() == 20);
  REQUIRE(w.stats().reverts == 1);
}

TEST_CASE("revert swallows injected flush failures and logs once", "[segment][revert][errors]") {
  test_support::temp_path tmp("revert_flush_fail");
  tmp.fill(50);
  auto w = storage::disk_block_object_writer<std::string>::create("bad", tmp.path(),
      std::make_shared<test_support::string_serializer>(), {},
      test_support::failing_layer({.fail_flush = true, .fail_close = true}));
  REQUIRE(w.has_value());
  REQUIRE(w->write(std::string("partial")).has_value());

  test_support::log_capture logs;
  storage::revert_outcome rv;
  REQUIRE_NOTHROW(rv = w->revert_partial_writes_and_close());
  REQUIRE(rv.diagnostic.has_value());
  REQUIRE(rv.diagnostic->code == core::error_code::io_failed);
  REQUIRE(rv.truncated);
  REQUIRE(logs.count(core::log_level::error) == 1);
  REQUIRE(tmp.size() == 50);
  REQUIRE_FALSE(w->is_open());
}

TEST_CASE("revert after a failed write restores the file", "[segment][revert][errors]") {
  test_support::temp_path tmp("revert_write_fail");
  tmp.fill(30);
  auto w = storage::disk_block_object_writer<storage::record_view>::create("bad", tmp.path(),
      std::make_shared<storage::frame_serializer>(1), storage::writer_options{.buffer_size = 1},
      test_support::failing_layer({.fail_write = true, .writes_before_failure = 2}));
  REQUIRE(w.has_value());
  std::vector<std::uint8_t> p{1, 2, 3};
  REQUIRE(w->write(p).has_value());
  REQUIRE(w->write(p).has_value());
  auto third = w->write(p);
  REQUIRE_FALSE(third.has_value());
  REQUIRE(third.error().code == core::error_code::io_failed);
  REQUIRE(tmp.size() > 30);

  test_support::log_capture logs;
  auto rv = w->revert_partial_writes_and_close();
  REQUIRE(rv.truncated);
  REQUIRE(tmp.size() == 30);
}

TEST_CASE("truncation failure is logged and reported, never thrown", "[segment][revert][errors]") {
  namespace fs = std::filesystem;
  auto dir = fs::temp_directory_path() / "spillway_revert_truncate_fail";
  std::error_code ec; fs::remove_all(dir, ec); fs::create_directories(dir, ec);
  auto file = dir / "segment.bin";

  auto w = storage::disk_block_object_writer<std::string>::create("gone", file,
      std::make_shared<test_support::string_serializer>());
  REQUIRE(w.has_value());
  REQUIRE(w->write(std::string("abc")).has_value());
  REQUIRE(w->close().has_value());
  // Replace the file with a directory so the truncate handle cannot be opened.
  fs::remove(file, ec);
  fs::create_directory(file, ec);

  test_support::log_capture logs;
  storage::revert_outcome rv;
  REQUIRE_NOTHROW(rv = w->revert_partial_writes_and_close());
  REQUIRE_FALSE(rv.truncated);
  REQUIRE(rv.diagnostic.has_value());
  REQUIRE(logs.count(core::log_level::error) == 1);
  REQUIRE(logs.events().front().component == "storage.segment");
  fs::remove_all(dir, ec);
}

TEST_CASE("flush and truncation failures in one revert log a single event", "[segment][revert][errors]") {
  namespace fs = std::filesystem;
  auto dir = fs::temp_directory_path() / "spillway_revert_double_fail";
  std::error_code ec; fs::remove_all(dir, ec); fs::create_directories(dir, ec);
  auto file = dir / "segment.bin";

  auto w = storage::disk_block_object_writer<std::string>::create("both", file,
      std::make_shared<test_support::string_serializer>(), {},
      test_support::failing_layer({.fail_flush = true}));
  REQUIRE(w.has_value());
  REQUIRE(w->write(std::string("abc")).has_value());
  REQUIRE(w->is_open());
  // The open descriptor survives the unlink; only the truncate handle hits the directory.
  fs::remove(file, ec);
  fs::create_directory(file, ec);

  test_support::log_capture logs;
  storage::revert_outcome rv;
  REQUIRE_NOTHROW(rv = w->revert_partial_writes_and_close());
  REQUIRE_FALSE(rv.truncated);
  REQUIRE(rv.diagnostic.has_value());
  REQUIRE(rv.diagnostic->message == "injected flush failure");
  REQUIRE(logs.count(core::log_level::error) == 1);
  REQUIRE(logs.events().front().message.find("(flush)") != std::string::npos);
  REQUIRE(logs.events().front().message.find("not truncated") != std::string::npos);
  REQUIRE_FALSE(w->is_open());
  fs::remove_all(dir, ec);
}
