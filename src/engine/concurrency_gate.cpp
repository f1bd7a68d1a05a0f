#include <algorithm>
#include <optional>
#include "engine/concurrency_gate.hpp"

namespace asyncmb {

std::optional<TransactionId> ConcurrencyGate::Admit() {
  if (waiting_.empty() || !HasFreeSlot()) {
    return {};
  }
  TransactionId id = waiting_.front();
  waiting_.pop_front();
  ++in_use_;
  return id;
}

void ConcurrencyGate::Release() noexcept {
  if (in_use_ > 0) {
    --in_use_;
  }
}

bool ConcurrencyGate::Remove(TransactionId id) {
  auto it = std::find(waiting_.begin(), waiting_.end(), id);
  if (it == waiting_.end()) {
    return false;
  }
  waiting_.erase(it);
  return true;
}

}  // namespace asyncmb
