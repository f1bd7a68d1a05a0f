#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>
#include "common/crc16.hpp"
#include "pdu/pdu.hpp"
#include "rtu/rtu_frame.hpp"

namespace asyncmb {

std::vector<uint8_t> RtuFrame::Encode(uint8_t address, const Pdu &pdu) {
  std::vector<uint8_t> frame;
  frame.reserve(pdu.Size() + kEnvelopeSize);

  frame.push_back(address);
  frame.push_back(pdu.function_code);
  frame.insert(frame.end(), pdu.data.begin(), pdu.data.end());

  AppendCrc16(frame);
  return frame;
}

std::optional<RtuAdu> RtuFrame::Decode(std::span<const uint8_t> frame) {
  if (frame.size() < kMinFrameSize || frame.size() > kMaxFrameSize) {
    return {};
  }

  if (!VerifyCrc16(frame)) {
    return {};
  }

  auto pdu = Pdu::FromBytes(frame.subspan(1, frame.size() - kEnvelopeSize));
  if (!pdu.has_value()) {
    return {};
  }

  return RtuAdu{frame[0], std::move(*pdu)};
}

}  // namespace asyncmb
