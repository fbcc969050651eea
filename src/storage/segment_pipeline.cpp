#include "spillway/storage/segment_pipeline.hpp"

#include "spillway/io/buffered_sink.hpp"
#include "spillway/io/file_sink.hpp"
#include "spillway/io/timed_sink.hpp"

namespace spillway::storage {

segment_pipeline::segment_pipeline(segment_pipeline&& o) noexcept
  : top_(std::move(o.top_)), timed_(o.timed_), file_(o.file_), closed_(o.closed_) {
  o.timed_ = nullptr;
  o.file_ = nullptr;
  o.closed_ = true;
}

segment_pipeline& segment_pipeline::operator=(segment_pipeline&& o) noexcept {
  if (this != &o) {
    top_ = std::move(o.top_);
    timed_ = o.timed_;
    file_ = o.file_;
    closed_ = o.closed_;
    o.timed_ = nullptr;
    o.file_ = nullptr;
    o.closed_ = true;
  }
  return *this;
}

// Destroying the chain releases the descriptor without flushing; writers close() explicitly.
segment_pipeline::~segment_pipeline() = default;

auto segment_pipeline::open(const std::filesystem::path& path, std::size_t buffer_size, bool sync_on_close,
                            const io::compression_transform& compress)
    -> std::expected<segment_pipeline, core::error> {
  auto fs = io::file_sink::open_append(path);
  if (!fs) return std::unexpected(fs.error());
  segment_pipeline p;
  p.file_ = fs->get();
  p.file_->set_sync_on_close(sync_on_close);
  auto timed = std::make_unique<io::timed_sink>(std::move(*fs));
  p.timed_ = timed.get();
  auto buffered = std::make_unique<io::buffered_sink>(std::move(timed), buffer_size);
  if (!compress) {
    p.top_ = std::move(buffered);
    return p;
  }
  auto top = compress(std::move(buffered));
  if (!top) return std::unexpected(top.error());
  if (!*top) {
    return std::unexpected(core::error{core::error_code::internal, "compression transform returned no sink", "storage.pipeline"});
  }
  p.top_ = std::move(*top);
  return p;
}

auto segment_pipeline::flush() -> std::expected<void, core::error> {
  if (closed_) return std::unexpected(core::error{core::error_code::io_failed, "pipeline closed", "storage.pipeline"});
  return top_->flush();
}

auto segment_pipeline::close() -> std::expected<void, core::error> {
  if (closed_) return {};
  closed_ = true;
  return top_->close();
}

std::chrono::nanoseconds segment_pipeline::write_time() const noexcept {
  return timed_ ? timed_->time_writing() : std::chrono::nanoseconds{0};
}

std::chrono::nanoseconds segment_pipeline::sync_time() const noexcept {
  return file_ ? file_->sync_time() : std::chrono::nanoseconds{0};
}

std::uint64_t segment_pipeline::syncs() const noexcept {
  return file_ ? file_->syncs() : 0;
}

} // namespace spillway::storage
