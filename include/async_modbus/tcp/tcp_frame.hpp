#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "../pdu/pdu.hpp"

namespace asyncmb {

/**
 * @brief A decoded Modbus TCP frame
 */
struct TcpAdu {
  uint16_t transaction_id{0};
  uint8_t unit_id{0};
  Pdu pdu{};

  bool operator==(const TcpAdu &) const = default;
};

/**
 * @brief TCP frame encoder/decoder
 *
 * Modbus TCP uses MBAP (Modbus Application Protocol) header:
 * - Transaction ID (2 bytes)
 * - Protocol ID (2 bytes, always 0x0000)
 * - Length (2 bytes) - number of bytes following (Unit ID + PDU)
 * - Unit ID (1 byte) - similar to slave ID in RTU
 * - PDU (Protocol Data Unit) - function code + data
 */
class TcpFrame {
 public:
  static constexpr size_t kMbapHeaderSize = 7;  // Transaction ID(2) + Protocol ID(2) + Length(2) + Unit ID(1)
  static constexpr uint16_t kProtocolId = 0x0000;
  static constexpr uint16_t kMinLength = 2;    // Unit ID + function code
  static constexpr uint16_t kMaxLength = 254;  // Unit ID + 253 byte PDU

  /**
   * @brief Encode a PDU into a TCP frame with MBAP header
   * @param transaction_id Echoed unchanged by the device
   * @param unit_id Unit addressed behind the endpoint
   * @param pdu Function code and payload
   * @return Byte vector containing the complete TCP frame (MBAP header + PDU)
   */
  [[nodiscard]] static std::vector<uint8_t> Encode(uint16_t transaction_id, uint8_t unit_id, const Pdu &pdu);

  /**
   * @brief Decode exactly one TCP frame
   * @param frame Complete TCP frame including MBAP header
   * @return Parsed frame, or empty if the protocol id, length or size is wrong
   */
  [[nodiscard]] static std::optional<TcpAdu> Decode(std::span<const uint8_t> frame);

  /**
   * @brief Extract transaction ID from MBAP header (big-endian)
   */
  [[nodiscard]] static uint16_t ExtractTransactionId(std::span<const uint8_t> frame);

  [[nodiscard]] static uint16_t ExtractProtocolId(std::span<const uint8_t> frame);

  /**
   * @brief Extract length from MBAP header (big-endian)
   */
  [[nodiscard]] static uint16_t ExtractLength(std::span<const uint8_t> frame);

  /**
   * @brief Total frame size announced by a header
   * @return 6 + length, or 0 if fewer than 6 bytes are available
   */
  [[nodiscard]] static size_t FrameSize(std::span<const uint8_t> frame);
};

}  // namespace asyncmb
