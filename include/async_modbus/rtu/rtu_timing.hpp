#pragma once

#include <cstddef>
#include <cstdint>
#include "../common/clock.hpp"
#include "../common/parity.hpp"
#include "../pdu/request.hpp"

namespace asyncmb {

/**
 * @brief Serial line timing for Modbus RTU
 *
 * A character is a start bit, the data bits, an optional parity bit and the
 * stop bits. All durations are rounded up to whole microseconds.
 */
class RtuTiming {
 public:
  /** Above this rate t1.5 and t3.5 are fixed instead of derived from the character time */
  static constexpr uint32_t kFixedTimingBaudRate = 19200;
  static constexpr Duration kFixedInterCharacterTimeout{750};
  static constexpr Duration kFixedInterFrameDelay{1750};

  RtuTiming(uint32_t baud_rate, uint8_t data_bits, Parity parity, uint8_t stop_bits)
      : baud_rate_(baud_rate),
        bits_per_character_(1U + data_bits + (parity == Parity::kNone ? 0U : 1U) + stop_bits) {}

  [[nodiscard]] uint32_t GetBaudRate() const noexcept { return baud_rate_; }
  [[nodiscard]] uint32_t BitsPerCharacter() const noexcept { return bits_per_character_; }

  [[nodiscard]] Duration CharacterTime() const noexcept { return TransmissionTime(1); }

  /**
   * @brief Time to put n characters on the wire
   */
  [[nodiscard]] Duration TransmissionTime(size_t characters) const noexcept;

  /**
   * @brief Deadline for a response, measured from the end of the request write
   *
   * The device cannot start answering before it has received the whole
   * request, so both frames count, followed by the device's processing
   * allowance.
   *
   * @param request_length Request ADU size in bytes
   * @param response_length Expected response ADU size in bytes
   * @param extra_wait Device processing allowance, added on top
   */
  [[nodiscard]] Duration TurnaroundDeadline(size_t request_length, size_t response_length,
                                            Duration extra_wait) const noexcept;

  /** t1.5: longest gap allowed between characters of one frame */
  [[nodiscard]] Duration InterCharacterTimeout() const noexcept;

  /** t3.5: minimum silence separating two frames */
  [[nodiscard]] Duration InterFrameDelay() const noexcept;

  /**
   * @brief Size of the normal response ADU a request should produce
   * @return Bytes including address and CRC, or 0 if unknown
   */
  [[nodiscard]] static size_t ExpectedResponseAduSize(const Request &request);

 private:
  [[nodiscard]] Duration CharacterMultiple(uint32_t tenths) const noexcept;

  uint32_t baud_rate_;
  uint32_t bits_per_character_;
};

}  // namespace asyncmb
