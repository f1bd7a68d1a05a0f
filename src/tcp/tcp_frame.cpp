#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>
#include "common/byte_helpers.hpp"
#include "pdu/pdu.hpp"
#include "tcp/tcp_frame.hpp"

namespace asyncmb {

uint16_t TcpFrame::ExtractTransactionId(std::span<const uint8_t> frame) {
  if (frame.size() < 2) {
    return 0;
  }
  return MakeUint16(frame[0], frame[1]);
}

uint16_t TcpFrame::ExtractProtocolId(std::span<const uint8_t> frame) {
  if (frame.size() < 4) {
    return 0;
  }
  return MakeUint16(frame[2], frame[3]);
}

uint16_t TcpFrame::ExtractLength(std::span<const uint8_t> frame) {
  if (frame.size() < 6) {
    return 0;
  }
  // Length is at offset 4-5 (big-endian)
  return MakeUint16(frame[4], frame[5]);
}

size_t TcpFrame::FrameSize(std::span<const uint8_t> frame) {
  if (frame.size() < 6) {
    return 0;
  }
  // Length counts the unit id and the PDU, which follow the first 6 header bytes
  return 6 + static_cast<size_t>(ExtractLength(frame));
}

std::vector<uint8_t> TcpFrame::Encode(uint16_t transaction_id, uint8_t unit_id, const Pdu &pdu) {
  std::vector<uint8_t> frame;
  frame.reserve(kMbapHeaderSize + pdu.data.size() + 1);

  frame.push_back(GetHighByte(transaction_id));
  frame.push_back(GetLowByte(transaction_id));

  frame.push_back(GetHighByte(kProtocolId));
  frame.push_back(GetLowByte(kProtocolId));

  uint16_t length = static_cast<uint16_t>(1 + pdu.Size());  // Unit ID(1) + PDU
  frame.push_back(GetHighByte(length));
  frame.push_back(GetLowByte(length));

  frame.push_back(unit_id);

  frame.push_back(pdu.function_code);
  frame.insert(frame.end(), pdu.data.begin(), pdu.data.end());

  return frame;
}

std::optional<TcpAdu> TcpFrame::Decode(std::span<const uint8_t> frame) {
  if (frame.size() < kMbapHeaderSize + 1) {
    return {};
  }

  if (ExtractProtocolId(frame) != kProtocolId) {
    return {};
  }

  uint16_t length = ExtractLength(frame);
  if (length < kMinLength || length > kMaxLength || frame.size() != FrameSize(frame)) {
    return {};
  }

  auto pdu = Pdu::FromBytes(frame.subspan(kMbapHeaderSize));
  if (!pdu.has_value()) {
    return {};
  }

  return TcpAdu{ExtractTransactionId(frame), frame[6], std::move(*pdu)};
}

}  // namespace asyncmb
