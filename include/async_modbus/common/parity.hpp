#pragma once

#include <cstdint>

namespace asyncmb {

enum class Parity : uint8_t { kNone, kEven, kOdd };

/** 'N', 'E' or 'O' as written in serial settings such as 9600-8E1 */
[[nodiscard]] constexpr char ToChar(Parity parity) {
  switch (parity) {
    case Parity::kEven:
      return 'E';
    case Parity::kOdd:
      return 'O';
    default:
      return 'N';
  }
}

}  // namespace asyncmb
