#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace asyncmb {

namespace detail {

// Reflected form of the Modbus polynomial 0x8005
inline constexpr uint16_t kCrc16Polynomial = 0xA001;

[[nodiscard]] constexpr std::array<uint16_t, 256> MakeCrc16Table() {
  std::array<uint16_t, 256> table{};
  for (size_t index = 0; index < table.size(); ++index) {
    auto value = static_cast<uint16_t>(index);
    for (int bit = 0; bit < 8; ++bit) {
      value = (value & 0x0001) != 0 ? static_cast<uint16_t>((value >> 1) ^ kCrc16Polynomial)
                                    : static_cast<uint16_t>(value >> 1);
    }
    table[index] = value;
  }
  return table;
}

inline constexpr std::array<uint16_t, 256> kCrc16Table = MakeCrc16Table();

}  // namespace detail

/**
 * @brief CRC-16/MODBUS of a byte sequence
 *
 * Starts from 0xFFFF. The result is sent low byte first.
 */
[[nodiscard]] constexpr uint16_t CalculateCrc16(std::span<const uint8_t> data) {
  uint16_t crc = 0xFFFF;
  for (uint8_t byte : data) {
    crc = static_cast<uint16_t>((crc >> 8) ^ detail::kCrc16Table[(crc ^ byte) & 0xFF]);
  }
  return crc;
}

/** Append the CRC of everything already in frame */
inline void AppendCrc16(std::vector<uint8_t> &frame) {
  uint16_t crc = CalculateCrc16(frame);
  frame.push_back(static_cast<uint8_t>(crc & 0xFF));
  frame.push_back(static_cast<uint8_t>(crc >> 8));
}

/**
 * @brief Check the trailing CRC of an RTU frame
 *
 * Frames shorter than an address byte plus the CRC never verify.
 */
[[nodiscard]] constexpr bool VerifyCrc16(std::span<const uint8_t> frame) {
  if (frame.size() < 3) {
    return false;
  }
  size_t body = frame.size() - 2;
  auto received = static_cast<uint16_t>(frame[body] | (frame[body + 1] << 8));
  return CalculateCrc16(frame.first(body)) == received;
}

}  // namespace asyncmb
