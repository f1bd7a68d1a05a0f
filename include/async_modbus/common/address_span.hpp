#pragma once

#include <cstdint>

namespace asyncmb {

struct AddressSpan {
  uint16_t start_address{0};
  uint16_t reg_count{0};

  bool operator==(const AddressSpan &) const = default;
};

}  // namespace asyncmb
