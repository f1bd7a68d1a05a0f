#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>
#include <spdlog/fmt/bin_to_hex.h>
#include "common/function_code.hpp"
#include "common/log.hpp"
#include "rtu/rtu_frame.hpp"
#include "rtu/rtu_framer.hpp"

namespace asyncmb {

std::vector<uint8_t> RtuFramer::Encode(uint16_t, uint8_t unit_id, const Pdu &pdu) const {
  return RtuFrame::Encode(unit_id, pdu);
}

void RtuFramer::Expect(uint8_t, size_t response_pdu_size) {
  expecting_ = true;
  expected_frame_size_ = response_pdu_size == 0 ? 0 : response_pdu_size + RtuFrame::kEnvelopeSize;
}

void RtuFramer::ClearExpectation() {
  expecting_ = false;
  expected_frame_size_ = 0;
  if (!buffer_.empty()) {
    Logger()->debug("dropping {} bytes of an unfinished response", buffer_.size());
    buffer_.clear();
  }
}

size_t RtuFramer::RequiredFrameSize() const noexcept {
  if (buffer_.size() < 2) {
    return 0;
  }
  if ((buffer_[1] & kExceptionFunctionCodeMask) != 0) {
    return RtuFrame::kExceptionResponseFrameSize;
  }
  return expected_frame_size_;
}

bool RtuFramer::SilenceEndsFrame(TimePoint now) const noexcept {
  if (buffer_.empty() || !last_byte_at_.has_value() || now - *last_byte_at_ <= timing_.InterFrameDelay()) {
    return false;
  }
  // Poll gaps are not line silence; a frame of known size waits for its last byte or the deadline
  return expected_frame_size_ == 0 && RequiredFrameSize() == 0;
}

void RtuFramer::CloseFrame(size_t frame_size) {
  std::span<const uint8_t> frame(buffer_.data(), frame_size);
  Logger()->trace("rx {}", spdlog::to_hex(frame.begin(), frame.end()));

  auto adu = RtuFrame::Decode(frame);
  if (adu.has_value()) {
    ready_.push_back(DecodedAdu{0, adu->address, std::move(adu->pdu)});
  } else {
    Logger()->warn("discarding {} byte frame with bad CRC", frame_size);
  }

  if (frame_size < buffer_.size()) {
    Logger()->warn("discarding {} bytes trailing a complete frame", buffer_.size() - frame_size);
  }
  buffer_.clear();
}

void RtuFramer::Feed(std::span<const uint8_t> bytes, TimePoint now) {
  if (bytes.empty()) {
    return;
  }

  if (SilenceEndsFrame(now)) {
    CloseFrame(buffer_.size());
  }
  last_byte_at_ = now;

  if (!expecting_) {
    Logger()->warn("discarding {} unsolicited bytes", bytes.size());
    Logger()->trace("rx {}", spdlog::to_hex(bytes.begin(), bytes.end()));
    return;
  }

  buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());

  size_t required = RequiredFrameSize();
  if (required != 0 && buffer_.size() >= required) {
    CloseFrame(required);
  } else if (buffer_.size() >= RtuFrame::kMaxFrameSize) {
    CloseFrame(buffer_.size());
  }
}

std::optional<DecodedAdu> RtuFramer::Next(TimePoint now) {
  if (ready_.empty() && SilenceEndsFrame(now)) {
    CloseFrame(buffer_.size());
  }

  if (ready_.empty()) {
    return {};
  }
  DecodedAdu adu = std::move(ready_.front());
  ready_.pop_front();
  return adu;
}

void RtuFramer::Reset() {
  if (!buffer_.empty()) {
    Logger()->debug("flushing {} stale bytes", buffer_.size());
  }
  buffer_.clear();
  ready_.clear();
  last_byte_at_.reset();
}

}  // namespace asyncmb
