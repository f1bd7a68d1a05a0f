#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include "../common/clock.hpp"
#include "../common/error.hpp"
#include "../common/result.hpp"
#include "../pdu/request.hpp"
#include "../pdu/response.hpp"
#include "../transport/connectable_transport.hpp"
#include "concurrency_gate.hpp"
#include "connection_lifecycle.hpp"
#include "deadline_policy.hpp"
#include "framer.hpp"
#include "transaction.hpp"
#include "transaction_manager.hpp"

namespace asyncmb {

struct EngineOptions {
  /** Resends after a timeout or a malformed reply; exception responses are never retried */
  int retries{0};
  /** In-flight bound for correlated transports, 0 for unbounded. FIFO lines always use 1 */
  size_t concurrency_limit{0};
  /** Hold requests while (re)connecting instead of failing them at once */
  bool queue_while_disconnected{true};
  /** A held request fails once it has waited this long for a connection */
  Duration connect_wait_timeout{std::chrono::seconds(2)};
  LifecycleOptions lifecycle{};
  /** Longest single sleep inside Wait() and RunUntil() */
  Duration idle_interval{std::chrono::milliseconds(1)};
};

/**
 * @brief Single-threaded Modbus client transaction engine
 *
 * Owns the connection state, the concurrency gate and the outstanding
 * transactions of one transport. Everything happens inside Submit(),
 * Cancel() and Poll(); nothing runs in the background, so callers either
 * poll from their own loop or block in Wait().
 *
 * The transport, framer, deadline policy and clock must outlive the engine.
 */
class ClientEngine {
 public:
  using IdleHandler = std::function<void(Duration)>;

  ClientEngine(ConnectableTransport &transport, Framer &framer, const DeadlinePolicy &deadlines, const Clock &clock,
               EngineOptions options);

  ClientEngine(const ClientEngine &) = delete;
  ClientEngine &operator=(const ClientEngine &) = delete;

  /** Begin connecting; the first attempt is made by the next Poll() */
  void Start();

  /**
   * @brief Close the transport and fail all outstanding and queued requests
   *
   * No reconnect happens until Start() is called again.
   */
  void Stop();

  /**
   * @brief Submit a request
   *
   * Invalid requests fail immediately with an encoding error and nothing is
   * written. Otherwise the request joins the admission queue and is written
   * as soon as the connection and the concurrency bound allow, possibly
   * before Submit() returns.
   *
   * @param request Request to send; the engine keeps its own copy
   * @param handler Runs exactly once when the transaction resolves
   */
  TransactionHandle Submit(Request request, CompletionHandler handler = {});

  /**
   * @brief Withdraw a request
   *
   * Frees its concurrency slot and resolves it as cancelled. Bytes already
   * written are not retracted; on a FIFO line the line stays reserved until
   * the cancelled request's deadline so a late reply is not taken for the next
   * request's.
   *
   * @return false if the transaction had already resolved
   */
  bool Cancel(const TransactionHandle &handle);

  /** One step: connection, reads, deliveries, deadlines, admission, writes */
  void Poll();

  /** Poll until the transaction resolves */
  Result<Response> Wait(const TransactionHandle &handle);

  /**
   * @brief Poll until done() holds or limit elapses
   * @return Whether done() held
   */
  bool RunUntil(const std::function<bool()> &done, std::optional<Duration> limit = {});

  /** Replace the sleep used between polls in Wait() and RunUntil() */
  void SetIdleHandler(IdleHandler handler) { idle_ = std::move(handler); }

  [[nodiscard]] ConnectionState GetConnectionState() const noexcept { return lifecycle_.GetState(); }
  [[nodiscard]] const ConcurrencyGate &GetGate() const noexcept { return gate_; }
  [[nodiscard]] const TransactionManager &GetTransactions() const noexcept { return manager_; }
  [[nodiscard]] size_t QueuedCount() const noexcept { return waiting_.size(); }
  [[nodiscard]] const EngineOptions &GetOptions() const noexcept { return options_; }

 private:
  void ReadAvailable(TimePoint now);
  void Deliver(const DecodedAdu &adu, TimePoint now);
  void HandleRetired(TransactionManager::Retired retired, TimePoint now);
  void ExpireQueued(TimePoint now);
  void AdmitWaiting();
  void Dispatch(TimePoint now);
  void Send(const TransactionPtr &transaction, TimePoint now);
  void Finish(TimePoint now);
  void LineIdle(TimePoint now);
  void HandleIoError(TimePoint now, std::string reason);
  void FailOutstanding(const Error &error);
  void FailQueued(const Error &error);
  void Idle(TimePoint now);
  [[nodiscard]] std::optional<TimePoint> NextWakeup() const;

  ConnectableTransport &transport_;
  Framer &framer_;
  const DeadlinePolicy &deadlines_;
  const Clock &clock_;
  EngineOptions options_;
  ConnectionLifecycle lifecycle_;
  ConcurrencyGate gate_;
  TransactionManager manager_;
  /** Submitted, not yet admitted */
  std::map<TransactionId, TransactionPtr> waiting_{};
  /** Admitted (holding a slot), waiting for the line */
  std::deque<TransactionPtr> ready_{};
  TimePoint line_free_at_{};
  TimePoint disconnected_since_{};
  TransactionId next_id_{1};
  std::string loss_reason_{"connection lost"};
  IdleHandler idle_{};
  bool in_poll_{false};
};

}  // namespace asyncmb
