#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <span>
#include <vector>
#include "../common/clock.hpp"
#include "../engine/framer.hpp"
#include "../pdu/pdu.hpp"
#include "rtu_frame.hpp"
#include "rtu_timing.hpp"

namespace asyncmb {

/**
 * @brief Silence and length delimited RTU receiver
 *
 * A frame ends when the expected number of bytes has arrived (the normal
 * response size announced through Expect(), or 5 bytes once the exception bit
 * is seen). Only a frame of unknown size is ended by more than t3.5 between
 * reads, since reads are spaced by polling and not by the line. Frames
 * failing the CRC are dropped as noise, as is anything received while no
 * response is expected.
 */
class RtuFramer : public Framer {
 public:
  explicit RtuFramer(RtuTiming timing)
      : timing_(timing) {}

  [[nodiscard]] bool IsCorrelated() const noexcept override { return false; }
  [[nodiscard]] size_t EnvelopeSize() const noexcept override { return RtuFrame::kEnvelopeSize; }

  [[nodiscard]] std::vector<uint8_t> Encode(uint16_t correlation_key, uint8_t unit_id, const Pdu &pdu) const override;

  void Expect(uint8_t unit_id, size_t response_pdu_size) override;
  void ClearExpectation() override;

  void Feed(std::span<const uint8_t> bytes, TimePoint now) override;
  [[nodiscard]] std::optional<DecodedAdu> Next(TimePoint now) override;

  // Silence always resynchronises an RTU line
  [[nodiscard]] bool HasStreamError() const noexcept override { return false; }

  void Reset() override;

  [[nodiscard]] const RtuTiming &GetTiming() const noexcept { return timing_; }
  [[nodiscard]] size_t BufferedBytes() const noexcept { return buffer_.size(); }

 private:
  /** Bytes the frame in the buffer needs, 0 while that is not yet known */
  [[nodiscard]] size_t RequiredFrameSize() const noexcept;

  [[nodiscard]] bool SilenceEndsFrame(TimePoint now) const noexcept;

  /** Validate the buffered bytes as one frame and queue it */
  void CloseFrame(size_t frame_size);

  RtuTiming timing_;
  std::vector<uint8_t> buffer_{};
  std::deque<DecodedAdu> ready_{};
  std::optional<TimePoint> last_byte_at_{};
  bool expecting_{false};
  size_t expected_frame_size_{0};
};

}  // namespace asyncmb
