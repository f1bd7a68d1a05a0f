#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "../common/function_code.hpp"

namespace asyncmb {

/**
 * @brief Protocol Data Unit: function code byte plus payload, independent of the transport envelope
 */
struct Pdu {
  uint8_t function_code{0};
  std::vector<uint8_t> data{};

  [[nodiscard]] bool IsException() const noexcept { return (function_code & kExceptionFunctionCodeMask) != 0; }
  [[nodiscard]] size_t Size() const noexcept { return 1 + data.size(); }

  /** Function code followed by the payload */
  [[nodiscard]] std::vector<uint8_t> ToBytes() const {
    std::vector<uint8_t> bytes;
    bytes.reserve(Size());
    bytes.push_back(function_code);
    bytes.insert(bytes.end(), data.begin(), data.end());
    return bytes;
  }

  [[nodiscard]] static std::optional<Pdu> FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
      return {};
    }
    return Pdu{bytes[0], std::vector<uint8_t>(bytes.begin() + 1, bytes.end())};
  }

  bool operator==(const Pdu &) const = default;
};

}  // namespace asyncmb
