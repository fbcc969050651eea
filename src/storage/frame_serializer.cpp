#include "spillway/storage/frame_serializer.hpp"
#include "spillway/storage/frame.hpp"

#include <vector>

namespace spillway::storage {

namespace {

class frame_stream final : public serialization_stream<record_view> {
public:
  frame_stream(io::byte_sink& sink, std::size_t batch_bytes) : sink_(sink), batch_bytes_(batch_bytes) {}

  auto write_object(const record_view& value) -> std::expected<void, core::error> override {
    if (closed_) {
      return std::unexpected(core::error{core::error_code::precondition_failed, "write on closed stream", "storage.frame"});
    }
    if (auto r = encode_frame_into(batch_, seq_, FRAME_TYPE_RECORD, value); !r) return r;
    ++seq_;
    if (batch_.size() >= batch_bytes_) return push();
    return {};
  }

  // Hands batched frames to the sink; does not flush the sink itself.
  auto flush() -> std::expected<void, core::error> override {
    if (closed_) return {};
    return push();
  }

  auto close() -> std::expected<void, core::error> override {
    if (closed_) return {};
    auto r = push();
    closed_ = true;
    return r;
  }

private:
  auto push() -> std::expected<void, core::error> {
    if (batch_.empty()) return {};
    auto r = sink_.write(batch_);
    batch_.clear();
    return r;
  }

  io::byte_sink& sink_;
  std::size_t batch_bytes_;
  std::vector<std::uint8_t> batch_;
  std::uint64_t seq_{0};
  bool closed_{false};
};

} // namespace

auto frame_serializer::serialize_stream(io::byte_sink& sink) const
    -> std::unique_ptr<serialization_stream<record_view>> {
  return std::make_unique<frame_stream>(sink, batch_bytes_);
}

} // namespace spillway::storage
