#include <cstdint>
#include <optional>
#include <utility>
#include <vector>
#include "common/error.hpp"
#include "common/log.hpp"
#include "engine/transaction_manager.hpp"

namespace asyncmb {

static constexpr uint16_t kFifoKey = 0;

bool TransactionManager::CanRegister() const noexcept {
  if (mode_ == CorrelationMode::kFifo) {
    return outstanding_.empty();
  }
  return outstanding_.size() < kMaxTransactionId;
}

std::optional<uint16_t> TransactionManager::NextKey() {
  for (uint32_t tries = 0; tries < kMaxTransactionId; ++tries) {
    auto key = static_cast<uint16_t>(counter_ % kMaxTransactionId + 1);
    counter_ = (counter_ + 1) % kMaxTransactionId;
    if (!outstanding_.contains(key)) {
      return key;
    }
  }
  return {};
}

Result<uint16_t> TransactionManager::Register(TransactionPtr transaction, TimePoint deadline) {
  uint16_t key = kFifoKey;
  if (mode_ == CorrelationMode::kFifo) {
    if (!outstanding_.empty()) {
      return Error::Protocol("a transaction is already outstanding on this line");
    }
  } else {
    auto next = NextKey();
    if (!next.has_value()) {
      return Error::Protocol("no free transaction id");
    }
    key = *next;
  }

  transaction->state = TransactionState::kPending;
  outstanding_.emplace(key, Entry{std::move(transaction), deadline});
  return key;
}

TransactionManager::EntryMap::const_iterator TransactionManager::Lookup(uint16_t key) const {
  if (mode_ == CorrelationMode::kFifo) {
    return outstanding_.begin();
  }
  return outstanding_.find(key);
}

TransactionPtr TransactionManager::Find(uint16_t key) const {
  auto it = Lookup(key);
  if (it == outstanding_.end()) {
    return nullptr;
  }
  return it->second.transaction;
}

TransactionPtr TransactionManager::Complete(uint16_t key, Result<Response> outcome) {
  auto it = Lookup(key);
  if (it == outstanding_.end()) {
    return nullptr;
  }
  TransactionPtr transaction = it->second.transaction;
  outstanding_.erase(it);
  transaction->Resolve(std::move(outcome));
  return transaction;
}

void TransactionManager::Retire(TransactionPtr transaction, const Error &error, Retired &retired) {
  if (transaction->retries_left > 0) {
    --transaction->retries_left;
    Logger()->debug("transaction {} failed ({}), {} retries left", transaction->id, error.ToString(),
                    transaction->retries_left);
    retired.retry.push_back(std::move(transaction));
    return;
  }
  transaction->Resolve(error);
  retired.failed.push_back(std::move(transaction));
}

TransactionManager::Retired TransactionManager::Reject(uint16_t key, const Error &error) {
  Retired retired;
  auto it = Lookup(key);
  if (it == outstanding_.end()) {
    return retired;
  }
  TransactionPtr transaction = it->second.transaction;
  outstanding_.erase(it);
  Retire(std::move(transaction), error, retired);
  return retired;
}

TransactionManager::Retired TransactionManager::ExpireDue(TimePoint now) {
  std::vector<TransactionPtr> expired;
  for (auto it = outstanding_.begin(); it != outstanding_.end();) {
    if (it->second.deadline <= now) {
      expired.push_back(std::move(it->second.transaction));
      it = outstanding_.erase(it);
    } else {
      ++it;
    }
  }

  Retired retired;
  for (auto &transaction : expired) {
    Retire(std::move(transaction), Error::Timeout("no response before the deadline"), retired);
  }
  return retired;
}

std::vector<TransactionPtr> TransactionManager::FailAll(const Error &error) {
  std::vector<TransactionPtr> failed;
  failed.reserve(outstanding_.size());
  for (auto &[key, entry] : outstanding_) {
    failed.push_back(std::move(entry.transaction));
  }
  outstanding_.clear();

  for (auto &transaction : failed) {
    transaction->Resolve(error);
  }
  return failed;
}

std::optional<TimePoint> TransactionManager::Remove(TransactionId id) {
  for (auto it = outstanding_.begin(); it != outstanding_.end(); ++it) {
    if (it->second.transaction->id == id) {
      TimePoint deadline = it->second.deadline;
      outstanding_.erase(it);
      return deadline;
    }
  }
  return {};
}

std::optional<TimePoint> TransactionManager::EarliestDeadline() const {
  std::optional<TimePoint> earliest;
  for (const auto &[key, entry] : outstanding_) {
    if (!earliest.has_value() || entry.deadline < *earliest) {
      earliest = entry.deadline;
    }
  }
  return earliest;
}

}  // namespace asyncmb
