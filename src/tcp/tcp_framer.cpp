#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>
#include <spdlog/fmt/bin_to_hex.h>
#include "common/log.hpp"
#include "tcp/tcp_frame.hpp"
#include "tcp/tcp_framer.hpp"

namespace asyncmb {

std::vector<uint8_t> TcpFramer::Encode(uint16_t correlation_key, uint8_t unit_id, const Pdu &pdu) const {
  return TcpFrame::Encode(correlation_key, unit_id, pdu);
}

void TcpFramer::Feed(std::span<const uint8_t> bytes, TimePoint) {
  if (stream_error_) {
    return;
  }
  buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

std::optional<DecodedAdu> TcpFramer::Next(TimePoint) {
  while (!stream_error_ && buffer_.size() >= TcpFrame::kMbapHeaderSize) {
    uint16_t length = TcpFrame::ExtractLength(buffer_);
    if (length < TcpFrame::kMinLength || length > TcpFrame::kMaxLength) {
      Logger()->warn("MBAP length {} out of range, stream lost synchronisation", length);
      stream_error_ = true;
      buffer_.clear();
      return {};
    }

    size_t frame_size = TcpFrame::FrameSize(buffer_);
    if (buffer_.size() < frame_size) {
      return {};  // Wait for the rest of the frame
    }

    std::vector<uint8_t> frame(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(frame_size));
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(frame_size));
    Logger()->trace("rx {}", spdlog::to_hex(frame));

    uint16_t protocol_id = TcpFrame::ExtractProtocolId(frame);
    if (protocol_id != TcpFrame::kProtocolId) {
      Logger()->warn("discarding frame with protocol id {:#06x}", protocol_id);
      continue;
    }

    auto adu = TcpFrame::Decode(frame);
    if (!adu.has_value()) {
      Logger()->warn("discarding malformed frame");
      continue;
    }
    return DecodedAdu{adu->transaction_id, adu->unit_id, std::move(adu->pdu)};
  }
  return {};
}

void TcpFramer::Reset() {
  buffer_.clear();
  stream_error_ = false;
}

}  // namespace asyncmb
