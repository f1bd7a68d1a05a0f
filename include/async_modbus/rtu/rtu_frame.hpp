#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "../pdu/pdu.hpp"

namespace asyncmb {

/**
 * @brief A decoded Modbus RTU frame
 */
struct RtuAdu {
  uint8_t address{0};
  Pdu pdu{};

  bool operator==(const RtuAdu &) const = default;
};

/**
 * @brief RTU frame encoder/decoder
 *
 * Frame layout: station address, PDU, CRC-16 over address + PDU (low byte first).
 */
class RtuFrame {
 public:
  static constexpr size_t kMinFrameSize = 4;  // address + function_code + CRC (2 bytes)
  static constexpr size_t kCrcSize = 2;
  static constexpr size_t kEnvelopeSize = 3;                // address + CRC
  static constexpr size_t kExceptionResponseFrameSize = 5;  // address + function_code + exception_code + CRC
  static constexpr size_t kMaxFrameSize = 256;

  /**
   * @brief Encode a PDU into an RTU frame with CRC
   * @return Byte vector containing the complete RTU frame (address, function_code, data, CRC)
   */
  [[nodiscard]] static std::vector<uint8_t> Encode(uint8_t address, const Pdu &pdu);

  /**
   * @brief Decode an RTU frame
   * @param frame Complete RTU frame including CRC
   * @return Parsed frame if the size and CRC are valid, empty optional otherwise
   */
  [[nodiscard]] static std::optional<RtuAdu> Decode(std::span<const uint8_t> frame);
};

}  // namespace asyncmb
