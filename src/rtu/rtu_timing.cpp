#include <cstddef>
#include <cstdint>
#include "common/clock.hpp"
#include "pdu/pdu_codec.hpp"
#include "pdu/request.hpp"
#include "rtu/rtu_frame.hpp"
#include "rtu/rtu_timing.hpp"

namespace asyncmb {

static constexpr uint64_t kMicrosecondsPerSecond = 1000000;

static uint64_t DivideRoundingUp(uint64_t numerator, uint64_t denominator) {
  return (numerator + denominator - 1) / denominator;
}

Duration RtuTiming::TransmissionTime(size_t characters) const noexcept {
  if (baud_rate_ == 0) {
    return Duration::zero();
  }
  uint64_t bits = static_cast<uint64_t>(characters) * bits_per_character_;
  return Duration(static_cast<Duration::rep>(DivideRoundingUp(bits * kMicrosecondsPerSecond, baud_rate_)));
}

Duration RtuTiming::TurnaroundDeadline(size_t request_length, size_t response_length,
                                       Duration extra_wait) const noexcept {
  // Summed before rounding so the result is exact whenever the total is
  return TransmissionTime(request_length + response_length) + extra_wait;
}

Duration RtuTiming::CharacterMultiple(uint32_t tenths) const noexcept {
  if (baud_rate_ == 0) {
    return Duration::zero();
  }
  uint64_t bits_times_ten = static_cast<uint64_t>(tenths) * bits_per_character_;
  return Duration(
      static_cast<Duration::rep>(DivideRoundingUp(bits_times_ten * kMicrosecondsPerSecond, 10ULL * baud_rate_)));
}

Duration RtuTiming::InterCharacterTimeout() const noexcept {
  if (baud_rate_ > kFixedTimingBaudRate) {
    return kFixedInterCharacterTimeout;
  }
  return CharacterMultiple(15);
}

Duration RtuTiming::InterFrameDelay() const noexcept {
  if (baud_rate_ > kFixedTimingBaudRate) {
    return kFixedInterFrameDelay;
  }
  return CharacterMultiple(35);
}

size_t RtuTiming::ExpectedResponseAduSize(const Request &request) {
  size_t pdu_size = PduCodec::ExpectedResponsePduSize(request);
  if (pdu_size == 0) {
    return 0;
  }
  return pdu_size + RtuFrame::kEnvelopeSize;
}

}  // namespace asyncmb
