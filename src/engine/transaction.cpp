#include <utility>
#include "common/error.hpp"
#include "common/result.hpp"
#include "engine/transaction.hpp"
#include "pdu/response.hpp"

namespace asyncmb {

bool TransactionRecord::Resolve(Result<Response> outcome) {
  if (result.has_value()) {
    return false;
  }

  if (outcome.has_value()) {
    state = TransactionState::kResolved;
  } else if (outcome.error().Is(ErrorKind::kCancelled)) {
    state = TransactionState::kCancelled;
  } else {
    state = TransactionState::kFailed;
  }
  result = std::move(outcome);

  if (handler) {
    // Move out first so a handler that resubmits cannot run twice
    CompletionHandler completion = std::move(handler);
    handler = nullptr;
    completion(*result);
  }
  return true;
}

}  // namespace asyncmb
