#pragma once

/** \file block_object_writer.hpp
 *  \brief Atomic segment writers: append serialized values to a file, then commit or revert.
 *
 * A writer captures the file length when it is created. Everything written afterwards either
 * becomes one committed file_segment (commit_and_close) or is discarded by truncating the file
 * back to that length (revert_partial_writes_and_close).
 *
 * Lifecycle: unopened -> open -> closed. write() opens lazily from unopened; reopening a closed
 * writer requires an explicit open(), and is refused once the writer has committed or reverted.
 * Usage errors (writing after close, committing twice, committing after revert, reading the
 * segment before commit) return precondition_failed.
 *
 * Notes
 * - Not thread-safe; one writer per file region, and nothing else may append to the file
 *   while the writer is live.
 * - Writers never revert on their own: after any failed write or commit, call
 *   revert_partial_writes_and_close().
 */

#include <chrono>
#include <cstdint>
#include <exception>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "spillway/core/log.hpp"
#include "spillway/error.hpp"
#include "spillway/io/compression.hpp"
#include "spillway/io/file_ops.hpp"
#include "spillway/storage/file_segment.hpp"
#include "spillway/storage/segment_pipeline.hpp"
#include "spillway/storage/serializer.hpp"
#include "spillway/storage/writer_options.hpp"

namespace spillway::storage {

/** \brief Result of a revert. Always a success at the type level; diagnostic carries what went wrong. */
struct revert_outcome {
  bool truncated{false};                  /**< the file was cut back to the initial position */
  std::optional<core::error> diagnostic;  /**< first error seen while closing or truncating */
};

struct segment_writer_stats {
  std::uint64_t records{};
  std::uint64_t opens{};
  std::uint64_t flushes{};
  std::uint64_t syncs{};
  std::uint64_t commits{};
  std::uint64_t reverts{};
  std::chrono::nanoseconds write_nanos{0}; /**< time inside descriptor writes */
  std::chrono::nanoseconds sync_nanos{0};  /**< time inside fsync */
};

template <typename T>
class block_object_writer {
public:
  virtual ~block_object_writer() = default;

  virtual auto open() -> std::expected<std::reference_wrapper<block_object_writer>, core::error> = 0;
  virtual auto close() -> std::expected<void, core::error> = 0;
  virtual bool is_open() const noexcept = 0;

  /** Flush the partial writes and commit them as a single atomic segment. */
  virtual auto commit_and_close() -> std::expected<void, core::error> = 0;

  /** Discards everything written since creation. Never throws, though truncation may fail. */
  virtual auto revert_partial_writes_and_close() noexcept -> revert_outcome = 0;

  virtual auto write(const T& value) -> std::expected<void, core::error> = 0;

  /** Committed range; only valid after commit_and_close(). */
  virtual auto file_segment() const -> std::expected<storage::file_segment, core::error> = 0;

  /** Cumulative time spent in blocking writes and syncs; only meaningful once closed. */
  virtual auto time_writing() const noexcept -> std::chrono::nanoseconds = 0;

  /** Number of committed bytes; only valid after commit_and_close(). */
  virtual auto bytes_written() const -> std::expected<std::uint64_t, core::error> = 0;
};

/** \brief block_object_writer appending to a file on disk. */
template <typename T>
class disk_block_object_writer final : public block_object_writer<T> {
public:
  disk_block_object_writer(disk_block_object_writer&&) noexcept = default;
  disk_block_object_writer& operator=(disk_block_object_writer&&) noexcept = default;
  disk_block_object_writer(const disk_block_object_writer&) = delete;
  disk_block_object_writer& operator=(const disk_block_object_writer&) = delete;
  ~disk_block_object_writer() override = default;

  /** Validates opts, builds the compression transform from opts and captures the file length. */
  static auto create(std::string block_id, std::filesystem::path file,
                     std::shared_ptr<const serializer<T>> ser, const writer_options& opts = {})
      -> std::expected<disk_block_object_writer, core::error> {
    auto compress = io::make_compression(opts.compression, opts.zstd_level);
    if (!compress) return std::unexpected(compress.error());
    return create(std::move(block_id), std::move(file), std::move(ser), opts, std::move(*compress));
  }

  /** As above with a caller-supplied compression transform; opts.compression is ignored. */
  static auto create(std::string block_id, std::filesystem::path file,
                     std::shared_ptr<const serializer<T>> ser, const writer_options& opts,
                     io::compression_transform compress)
      -> std::expected<disk_block_object_writer, core::error> {
    if (auto v = validate(opts); !v) return std::unexpected(v.error());
    if (!ser) {
      return std::unexpected(core::error{core::error_code::invalid_argument, "serializer is null", "storage.segment"});
    }
    auto len = io::file_length(file);
    if (!len) return std::unexpected(len.error());
    return disk_block_object_writer(std::move(block_id), std::move(file), std::move(ser), opts,
                                    std::move(compress), *len);
  }

  auto open() -> std::expected<std::reference_wrapper<block_object_writer<T>>, core::error> override {
    if (is_open()) return std::unexpected(usage("open() while already open"));
    if (final_position_) return std::unexpected(usage("open() after commit"));
    if (reverted_) return std::unexpected(usage("open() after revert"));
    auto p = segment_pipeline::open(file_, buffer_size_, sync_writes_, compress_);
    if (!p) return std::unexpected(p.error());
    auto stream = serializer_->serialize_stream(p->sink());
    if (!stream) {
      return std::unexpected(core::error{core::error_code::internal, "serializer returned no stream", "storage.segment"});
    }
    state_.template emplace<open_state>(open_state{std::move(*p), std::move(stream)});
    ++stats_.opens;
    core::log(core::log_level::debug, "storage.segment", "opened " + block_id_ + " at " + std::to_string(initial_position_));
    return std::ref(static_cast<block_object_writer<T>&>(*this));
  }

  auto close() -> std::expected<void, core::error> override { return close_pipeline(); }

  bool is_open() const noexcept override { return std::holds_alternative<open_state>(state_); }

  auto commit_and_close() -> std::expected<void, core::error> override {
    if (final_position_) return std::unexpected(usage("commit_and_close() after commit"));
    if (reverted_) return std::unexpected(usage("commit_and_close() after revert"));
    if (auto* st = std::get_if<open_state>(&state_)) {
      // The stream may hold bytes the sink has never seen, so flush it before the sink.
      if (auto r = st->stream->flush(); !r) return r;
      if (auto r = st->pipeline.flush(); !r) return r;
      ++stats_.flushes;
      if (auto r = close_pipeline(); !r) return r;
    }
    auto len = io::file_length(file_);
    if (!len) return std::unexpected(len.error());
    final_position_ = *len;
    ++stats_.commits;
    core::log(core::log_level::debug, "storage.segment",
              "committed " + block_id_ + " [" + std::to_string(initial_position_) + ", " + std::to_string(*len) + ")");
    return {};
  }

  auto revert_partial_writes_and_close() noexcept -> revert_outcome override {
    revert_outcome out;
    const char* phase = nullptr;
    if (!reverted_) ++stats_.reverts;
    reverted_ = true;
    final_position_.reset();
    try {
      if (auto* st = std::get_if<open_state>(&state_)) {
        auto flushed = st->stream->flush();
        if (flushed) flushed = st->pipeline.flush();
        auto closed = close_pipeline();
        if (!flushed) note(out, phase, flushed.error(), "flush");
        else if (!closed) note(out, phase, closed.error(), "close");
      }
    } catch (const std::exception& e) {
      state_.template emplace<closed_state>();
      note_exception(out, phase, e, "close");
    }
    try {
      if (auto t = io::truncate_file(file_, initial_position_); t) {
        out.truncated = true;
      } else {
        note(out, phase, t.error(), "truncate");
      }
    } catch (const std::exception& e) {
      note_exception(out, phase, e, "truncate");
    }
    if (out.diagnostic) report(out, phase);
    return out;
  }

  auto write(const T& value) -> std::expected<void, core::error> override {
    if (std::holds_alternative<closed_state>(state_)) return std::unexpected(usage("write() after close"));
    if (std::holds_alternative<unopened_state>(state_)) {
      if (auto r = open(); !r) return std::unexpected(r.error());
    }
    auto& st = std::get<open_state>(state_);
    if (auto r = st.stream->write_object(value); !r) return r;
    ++stats_.records;
    return {};
  }

  auto file_segment() const -> std::expected<storage::file_segment, core::error> override {
    auto n = bytes_written();
    if (!n) return std::unexpected(n.error());
    return storage::file_segment{file_, initial_position_, *n};
  }

  auto time_writing() const noexcept -> std::chrono::nanoseconds override { return time_writing_; }

  auto bytes_written() const -> std::expected<std::uint64_t, core::error> override {
    if (!final_position_) return std::unexpected(usage("bytes_written is only valid after a successful commit"));
    return *final_position_ - initial_position_;
  }

  const std::string& block_id() const noexcept { return block_id_; }
  const std::filesystem::path& path() const noexcept { return file_; }
  std::uint64_t initial_position() const noexcept { return initial_position_; }
  const segment_writer_stats& stats() const noexcept { return stats_; }

private:
  struct unopened_state {};
  struct open_state {
    segment_pipeline pipeline;
    std::unique_ptr<serialization_stream<T>> stream;
  };
  struct closed_state {};

  disk_block_object_writer(std::string block_id, std::filesystem::path file,
                           std::shared_ptr<const serializer<T>> ser, const writer_options& opts,
                           io::compression_transform compress, std::uint64_t initial_position)
    : block_id_(std::move(block_id)),
      file_(std::move(file)),
      serializer_(std::move(ser)),
      compress_(std::move(compress)),
      buffer_size_(opts.buffer_size),
      sync_writes_(opts.effective_sync()),
      initial_position_(initial_position) {}

  auto usage(const char* what) const -> core::error {
    return core::error{core::error_code::precondition_failed, std::string(what) + " (block " + block_id_ + ")",
                       "storage.segment"};
  }

  // Closes the stream, then the byte layers (syncing when configured), and releases the
  // pipeline whatever happened. The first error wins.
  auto close_pipeline() -> std::expected<void, core::error> {
    auto* st = std::get_if<open_state>(&state_);
    if (!st) return {};
    auto s = st->stream->close();
    auto p = st->pipeline.close();
    stats_.write_nanos += st->pipeline.write_time();
    stats_.sync_nanos += st->pipeline.sync_time();
    time_writing_ += st->pipeline.sync_time() + st->pipeline.write_time();
    stats_.syncs += st->pipeline.syncs();
    state_.template emplace<closed_state>();
    if (!s) return s;
    return p;
  }

  // Keeps the first failure of a revert; report() logs it once the revert is over.
  static void note(revert_outcome& out, const char*& phase, const core::error& e, const char* where) noexcept {
    if (out.diagnostic) return;
    phase = where;
    try {
      out.diagnostic = e;
    } catch (const std::bad_alloc&) {
      out.diagnostic.emplace();
      out.diagnostic->code = e.code;
    }
  }

  static void note_exception(revert_outcome& out, const char*& phase, const std::exception& ex,
                             const char* where) noexcept {
    try {
      note(out, phase, core::error{core::error_code::internal, ex.what(), "storage.segment"}, where);
    } catch (const std::bad_alloc&) {
      note(out, phase, core::error{}, where);
    }
  }

  void report(const revert_outcome& out, const char* phase) const noexcept {
    const char* where = phase ? phase : "revert";
    try {
      std::string msg = "uncaught error while reverting partial writes to " + file_.string() + " (" + where + "): " +
                        out.diagnostic->message;
      if (!out.truncated && std::string_view(where) != "truncate") msg += "; file was not truncated";
      core::log(core::log_level::error, "storage.segment", msg);
    } catch (const std::bad_alloc&) {
      core::log(core::log_level::error, "storage.segment", "uncaught error while reverting partial writes");
    }
  }

  std::string block_id_;
  std::filesystem::path file_;
  std::shared_ptr<const serializer<T>> serializer_;
  io::compression_transform compress_;
  std::size_t buffer_size_;
  bool sync_writes_;
  std::uint64_t initial_position_;
  std::optional<std::uint64_t> final_position_;
  bool reverted_{false};
  std::variant<unopened_state, open_state, closed_state> state_;
  std::chrono::nanoseconds time_writing_{0};
  segment_writer_stats stats_{};
};

} // namespace spillway::storage
