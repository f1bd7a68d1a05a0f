#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>
#include <gtest/gtest.h>
#include "async_modbus/common/clock.hpp"
#include "async_modbus/common/error.hpp"
#include "async_modbus/common/function_code.hpp"
#include "async_modbus/engine/transaction.hpp"
#include "async_modbus/engine/transaction_manager.hpp"
#include "async_modbus/pdu/request.hpp"
#include "async_modbus/pdu/response.hpp"

using asyncmb::CorrelationMode;
using asyncmb::Error;
using asyncmb::ErrorKind;
using asyncmb::FunctionCode;
using asyncmb::Request;
using asyncmb::Response;
using asyncmb::Result;
using asyncmb::TimePoint;
using asyncmb::TransactionManager;
using asyncmb::TransactionPtr;
using asyncmb::TransactionRecord;
using asyncmb::TransactionState;
using std::chrono::milliseconds;

namespace {

TransactionPtr MakeTransaction(asyncmb::TransactionId id, int retries = 0, int *calls = nullptr) {
  return std::make_shared<TransactionRecord>(
      id, Request::ReadHoldingRegisters(1, 0, 1),
      [calls](const Result<Response> &) {
        if (calls != nullptr) {
          ++*calls;
        }
      },
      TimePoint{}, retries);
}

Response MakeResponse() {
  Response response(1, FunctionCode::kReadHR);
  response.SetRegisters({0x002A});
  return response;
}

}  // namespace

TEST(TransactionManager, KeysStartAtOneAndIncrement) {
  TransactionManager manager(CorrelationMode::kTransactionId);
  TimePoint deadline = TimePoint{} + milliseconds(100);

  auto first = manager.Register(MakeTransaction(1), deadline);
  auto second = manager.Register(MakeTransaction(2), deadline);

  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*first, 1);
  EXPECT_EQ(*second, 2);
  EXPECT_EQ(manager.OutstandingCount(), 2U);
  EXPECT_EQ(manager.Find(2)->id, 2U);
  EXPECT_EQ(manager.Find(3), nullptr);
}

TEST(TransactionManager, KeysWrapAndSkipOutstanding) {
  TransactionManager manager(CorrelationMode::kTransactionId);
  TimePoint deadline = TimePoint{} + milliseconds(100);

  // Key 1 stays outstanding while the counter runs all the way round
  auto held = manager.Register(MakeTransaction(0), deadline);
  ASSERT_TRUE(held.has_value());
  ASSERT_EQ(*held, 1);

  for (asyncmb::TransactionId id = 1; id < TransactionManager::kMaxTransactionId; ++id) {
    auto key = manager.Register(MakeTransaction(id), deadline);
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, id + 1);
    EXPECT_NE(manager.Complete(*key, MakeResponse()), nullptr);
  }

  auto wrapped = manager.Register(MakeTransaction(0xFFFF), deadline);
  ASSERT_TRUE(wrapped.has_value());
  EXPECT_EQ(*wrapped, 2);
}

TEST(TransactionManager, KeyZeroAndFFFFNeverUsed) {
  TransactionManager manager(CorrelationMode::kTransactionId);
  TimePoint deadline = TimePoint{} + milliseconds(100);

  for (asyncmb::TransactionId id = 0; id < 2 * TransactionManager::kMaxTransactionId; ++id) {
    auto key = manager.Register(MakeTransaction(id), deadline);
    ASSERT_TRUE(key.has_value());
    ASSERT_NE(*key, 0);
    ASSERT_NE(*key, 0xFFFF);
    manager.Complete(*key, MakeResponse());
  }
}

TEST(TransactionManager, CompleteResolvesOnce) {
  TransactionManager manager(CorrelationMode::kTransactionId);
  int calls = 0;
  auto transaction = MakeTransaction(1, 0, &calls);

  auto key = manager.Register(transaction, TimePoint{} + milliseconds(100));
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ(transaction->state, TransactionState::kPending);

  EXPECT_EQ(manager.Complete(*key, MakeResponse()), transaction);
  EXPECT_EQ(manager.Complete(*key, MakeResponse()), nullptr);
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(transaction->state, TransactionState::kResolved);
  EXPECT_FALSE(manager.IsOutstanding(*key));
}

TEST(TransactionManager, FifoAllowsOneOutstanding) {
  TransactionManager manager(CorrelationMode::kFifo);
  TimePoint deadline = TimePoint{} + milliseconds(100);

  auto first = manager.Register(MakeTransaction(1), deadline);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, 0);
  EXPECT_FALSE(manager.CanRegister());

  auto second = manager.Register(MakeTransaction(2), deadline);
  ASSERT_FALSE(second.has_value());
  EXPECT_TRUE(second.error().Is(ErrorKind::kProtocol));

  // Any key reaches the single outstanding transaction
  EXPECT_EQ(manager.Find(1234)->id, 1U);
  EXPECT_NE(manager.Complete(99, MakeResponse()), nullptr);
  EXPECT_TRUE(manager.CanRegister());
}

TEST(TransactionManager, ExpireDueOnlyPastDeadline) {
  TransactionManager manager(CorrelationMode::kTransactionId);
  TimePoint start{};
  auto early = MakeTransaction(1);
  auto late = MakeTransaction(2);
  ASSERT_TRUE(manager.Register(early, start + milliseconds(50)).has_value());
  ASSERT_TRUE(manager.Register(late, start + milliseconds(200)).has_value());

  EXPECT_EQ(manager.EarliestDeadline(), start + milliseconds(50));
  EXPECT_TRUE(manager.ExpireDue(start + milliseconds(49)).failed.empty());

  auto retired = manager.ExpireDue(start + milliseconds(50));
  ASSERT_EQ(retired.failed.size(), 1U);
  EXPECT_TRUE(retired.retry.empty());
  EXPECT_EQ(retired.failed[0], early);
  ASSERT_TRUE(early->result.has_value());
  EXPECT_TRUE(early->result->error().Is(ErrorKind::kTimeout));
  EXPECT_EQ(early->state, TransactionState::kFailed);
  EXPECT_EQ(manager.OutstandingCount(), 1U);
  EXPECT_EQ(manager.EarliestDeadline(), start + milliseconds(200));
}

TEST(TransactionManager, RetryBudgetLeavesTransactionUnresolved) {
  TransactionManager manager(CorrelationMode::kTransactionId);
  int calls = 0;
  auto transaction = MakeTransaction(1, 1, &calls);
  TimePoint deadline = TimePoint{} + milliseconds(10);

  ASSERT_TRUE(manager.Register(transaction, deadline).has_value());
  auto first = manager.ExpireDue(deadline);
  ASSERT_EQ(first.retry.size(), 1U);
  EXPECT_TRUE(first.failed.empty());
  EXPECT_FALSE(transaction->IsDone());
  EXPECT_EQ(transaction->retries_left, 0);
  EXPECT_EQ(calls, 0);

  ASSERT_TRUE(manager.Register(transaction, deadline).has_value());
  auto second = manager.ExpireDue(deadline);
  EXPECT_TRUE(second.retry.empty());
  ASSERT_EQ(second.failed.size(), 1U);
  EXPECT_EQ(calls, 1);
}

TEST(TransactionManager, RejectRetiresWithError) {
  TransactionManager manager(CorrelationMode::kFifo);
  auto transaction = MakeTransaction(1);
  ASSERT_TRUE(manager.Register(transaction, TimePoint{} + milliseconds(10)).has_value());

  auto retired = manager.Reject(0, Error::Protocol("unit id mismatch"));

  ASSERT_EQ(retired.failed.size(), 1U);
  EXPECT_TRUE(transaction->result->error().Is(ErrorKind::kProtocol));
  EXPECT_EQ(manager.OutstandingCount(), 0U);
  EXPECT_TRUE(manager.Reject(0, Error::Protocol("again")).failed.empty());
}

TEST(TransactionManager, FailAllResolvesEverything) {
  TransactionManager manager(CorrelationMode::kTransactionId);
  std::vector<TransactionPtr> transactions{MakeTransaction(1, 3), MakeTransaction(2), MakeTransaction(3)};
  for (const auto &transaction : transactions) {
    ASSERT_TRUE(manager.Register(transaction, TimePoint{} + milliseconds(10)).has_value());
  }

  auto failed = manager.FailAll(Error::Connection("connection lost"));

  EXPECT_EQ(failed.size(), 3U);
  EXPECT_EQ(manager.OutstandingCount(), 0U);
  for (const auto &transaction : transactions) {
    ASSERT_TRUE(transaction->IsDone());
    EXPECT_TRUE(transaction->result->error().Is(ErrorKind::kConnection));
  }
}

TEST(TransactionManager, RemoveReturnsDeadline) {
  TransactionManager manager(CorrelationMode::kTransactionId);
  TimePoint deadline = TimePoint{} + milliseconds(30);
  auto transaction = MakeTransaction(7);
  ASSERT_TRUE(manager.Register(transaction, deadline).has_value());

  EXPECT_EQ(manager.Remove(7), deadline);
  EXPECT_FALSE(manager.Remove(7).has_value());
  EXPECT_FALSE(transaction->IsDone());
}
