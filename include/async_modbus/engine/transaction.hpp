#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include "../common/clock.hpp"
#include "../common/result.hpp"
#include "../pdu/request.hpp"
#include "../pdu/response.hpp"

namespace asyncmb {

/** Engine-wide id of a submitted request; unlike the wire correlation key it is never reused */
using TransactionId = uint64_t;

enum class TransactionState {
  /** Waiting for a connection or a concurrency slot */
  kQueued,
  /** Admitted; written or about to be written */
  kPending,
  kResolved,
  kFailed,
  kCancelled
};

using CompletionHandler = std::function<void(const Result<Response> &)>;

/**
 * @brief Shared state of one submitted request
 *
 * Owned jointly by the engine and the caller's TransactionHandle. The outcome
 * is recorded exactly once by Resolve().
 */
struct TransactionRecord {
  TransactionRecord(TransactionId transaction_id, Request req, CompletionHandler completion, TimePoint now,
                    int retry_budget)
      : id(transaction_id),
        request(std::move(req)),
        handler(std::move(completion)),
        submitted_at(now),
        retries_left(retry_budget) {}

  TransactionId id;
  Request request;
  CompletionHandler handler;
  TimePoint submitted_at;
  int retries_left;
  int attempts{0};
  TransactionState state{TransactionState::kQueued};
  std::optional<Result<Response>> result{};

  [[nodiscard]] bool IsDone() const noexcept { return result.has_value(); }

  /**
   * @brief Record the outcome and run the completion handler
   * @return false if the transaction was already resolved (the new outcome is dropped)
   */
  bool Resolve(Result<Response> outcome);
};

using TransactionPtr = std::shared_ptr<TransactionRecord>;

/**
 * @brief Caller's view of a submitted request
 */
class TransactionHandle {
 public:
  TransactionHandle() = default;
  explicit TransactionHandle(TransactionPtr record)
      : record_(std::move(record)) {}

  [[nodiscard]] bool IsValid() const noexcept { return record_ != nullptr; }
  [[nodiscard]] TransactionId GetId() const noexcept { return record_ ? record_->id : 0; }
  [[nodiscard]] TransactionState GetState() const noexcept {
    return record_ ? record_->state : TransactionState::kFailed;
  }
  [[nodiscard]] bool IsDone() const noexcept { return record_ && record_->IsDone(); }

  /** Number of times the request was written to the wire */
  [[nodiscard]] int GetAttempts() const noexcept { return record_ ? record_->attempts : 0; }

  /** Empty until the transaction is done */
  [[nodiscard]] const std::optional<Result<Response>> &GetResult() const { return record_->result; }

 private:
  friend class ClientEngine;

  TransactionPtr record_{};
};

}  // namespace asyncmb
