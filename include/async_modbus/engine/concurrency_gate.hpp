#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include "transaction.hpp"

namespace asyncmb {

/**
 * @brief FIFO admission bound on in-flight requests
 *
 * A limit of 0 means unbounded. Waiters are admitted strictly in arrival
 * order: a newcomer never overtakes a queued request even if a slot is free.
 */
class ConcurrencyGate {
 public:
  explicit ConcurrencyGate(size_t limit = 0)
      : limit_(limit) {}

  /** Join the end of the queue */
  void Enqueue(TransactionId id) { waiting_.push_back(id); }

  /**
   * @brief Admit the head of the queue if a slot is free
   * @return The admitted id, which now holds a slot until Release()
   */
  [[nodiscard]] std::optional<TransactionId> Admit();

  /** Give a slot back (on any resolution) */
  void Release() noexcept;

  /**
   * @brief Withdraw a waiter that was never admitted
   * @return false if the id is not queued
   */
  bool Remove(TransactionId id);

  [[nodiscard]] bool HasFreeSlot() const noexcept { return limit_ == 0 || in_use_ < limit_; }
  [[nodiscard]] size_t InUse() const noexcept { return in_use_; }
  [[nodiscard]] size_t Waiting() const noexcept { return waiting_.size(); }
  [[nodiscard]] size_t Limit() const noexcept { return limit_; }
  [[nodiscard]] const std::deque<TransactionId> &GetWaiting() const noexcept { return waiting_; }

 private:
  size_t limit_;
  size_t in_use_{0};
  std::deque<TransactionId> waiting_{};
};

}  // namespace asyncmb
