#pragma once

#include <cstdint>

namespace asyncmb {

static constexpr uint8_t kMaxByte = 0xFF;
static constexpr uint8_t kBitsPerByte = 8;
static constexpr uint16_t kCoilOnValue = 0xFF00;
static constexpr uint16_t kCoilOffValue = 0x0000;

static inline constexpr uint8_t GetLowByte(uint16_t value) {
  return value & kMaxByte;
}

static inline constexpr uint8_t GetHighByte(uint16_t value) {
  return (value >> kBitsPerByte) & kMaxByte;
}

// Modbus puts 16-bit fields on the wire high byte first
static inline constexpr uint16_t MakeUint16(uint8_t high_byte, uint8_t low_byte) {
  return static_cast<uint16_t>((static_cast<uint16_t>(high_byte) << kBitsPerByte) | static_cast<uint16_t>(low_byte));
}

static inline constexpr uint16_t ByteCountForBits(uint16_t bit_count) {
  return static_cast<uint16_t>((bit_count + kBitsPerByte - 1) / kBitsPerByte);
}

}  // namespace asyncmb
