#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>
#include "../common/clock.hpp"
#include "../common/error.hpp"
#include "../common/result.hpp"
#include "../pdu/response.hpp"
#include "transaction.hpp"

namespace asyncmb {

enum class CorrelationMode {
  /** Responses carry the key (TCP transaction id); many may be outstanding */
  kTransactionId,
  /** Half-duplex line: at most one outstanding, answered in order */
  kFifo
};

/**
 * @brief Outstanding transactions of one connection
 *
 * Assigns correlation keys, remembers deadlines and routes each response to
 * at most one transaction. Keys in transaction id mode come from a wrapping
 * counter over 1..0xFFFE that skips keys still in use.
 *
 * Timeouts and protocol errors consume the retry budget: the transaction is
 * removed but left unresolved so the caller can send it again. Once the
 * budget is spent the last failure resolves it.
 */
class TransactionManager {
 public:
  static constexpr uint16_t kMaxTransactionId = 0xFFFE;

  struct Retired {
    /** Removed and left unresolved; send again */
    std::vector<TransactionPtr> retry;
    /** Removed and resolved with the failure */
    std::vector<TransactionPtr> failed;
  };

  explicit TransactionManager(CorrelationMode mode)
      : mode_(mode) {}

  [[nodiscard]] CorrelationMode GetMode() const noexcept { return mode_; }

  /** False while a FIFO line has its transaction outstanding */
  [[nodiscard]] bool CanRegister() const noexcept;

  /**
   * @brief Make a transaction outstanding
   * @return The correlation key (always 0 in FIFO mode), or an error if the line is busy or no key is free
   */
  [[nodiscard]] Result<uint16_t> Register(TransactionPtr transaction, TimePoint deadline);

  /** Transaction a response with this key belongs to; in FIFO mode the key is ignored */
  [[nodiscard]] TransactionPtr Find(uint16_t key) const;

  /**
   * @brief Resolve the transaction waiting on key with the outcome
   * @return The resolved transaction, or nullptr if nothing waits on key
   */
  TransactionPtr Complete(uint16_t key, Result<Response> outcome);

  /**
   * @brief Remove the transaction on key after a malformed or mismatched reply
   */
  Retired Reject(uint16_t key, const Error &error);

  /** Remove every transaction whose deadline is at or before now */
  Retired ExpireDue(TimePoint now);

  /** Resolve and remove everything outstanding, e.g. on connection loss */
  std::vector<TransactionPtr> FailAll(const Error &error);

  /**
   * @brief Remove a transaction without resolving it
   * @return Its deadline, or empty if it was not outstanding
   */
  std::optional<TimePoint> Remove(TransactionId id);

  [[nodiscard]] std::optional<TimePoint> EarliestDeadline() const;
  [[nodiscard]] size_t OutstandingCount() const noexcept { return outstanding_.size(); }
  [[nodiscard]] bool IsOutstanding(uint16_t key) const { return outstanding_.contains(key); }

 private:
  struct Entry {
    TransactionPtr transaction;
    TimePoint deadline;
  };

  using EntryMap = std::map<uint16_t, Entry>;

  [[nodiscard]] EntryMap::const_iterator Lookup(uint16_t key) const;
  [[nodiscard]] std::optional<uint16_t> NextKey();
  static void Retire(TransactionPtr transaction, const Error &error, Retired &retired);

  CorrelationMode mode_;
  EntryMap outstanding_{};
  uint32_t counter_{0};
};

}  // namespace asyncmb
