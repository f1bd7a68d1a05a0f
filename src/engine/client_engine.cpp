#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <spdlog/fmt/bin_to_hex.h>
#include "common/byte_helpers.hpp"
#include "common/log.hpp"
#include "engine/client_engine.hpp"
#include "pdu/pdu_codec.hpp"

namespace asyncmb {

static constexpr size_t kReadChunkSize = 512;
static constexpr Duration kMinIdle{1};

/** What a device would have echoed for a write that was broadcast */
static Response BroadcastAcknowledgement(const Request &request) {
  Response response(request.GetUnitId(), request.GetFunctionCode());
  auto span = request.GetAddressSpan();
  switch (request.GetFunctionCode()) {
    case FunctionCode::kWriteSingleCoil:
      response.SetEcho(span.start_address, request.GetCoils().front() ? kCoilOnValue : kCoilOffValue);
      break;
    case FunctionCode::kWriteSingleReg:
      response.SetEcho(span.start_address, request.GetRegisters().front());
      break;
    case FunctionCode::kMaskWriteReg:
      response.SetEcho(span.start_address, 0);
      response.SetRegisters(request.GetRegisters());
      break;
    default:
      response.SetEcho(span.start_address, span.reg_count);
      break;
  }
  return response;
}

ClientEngine::ClientEngine(ConnectableTransport &transport, Framer &framer, const DeadlinePolicy &deadlines,
                           const Clock &clock, EngineOptions options)
    : transport_(transport),
      framer_(framer),
      deadlines_(deadlines),
      clock_(clock),
      options_(options),
      lifecycle_(transport, options.lifecycle),
      gate_(framer.IsCorrelated() ? options.concurrency_limit : 1),
      manager_(framer.IsCorrelated() ? CorrelationMode::kTransactionId : CorrelationMode::kFifo),
      disconnected_since_(clock.Now()),
      idle_([](Duration duration) { std::this_thread::sleep_for(duration); }) {
  lifecycle_.SetLossHandler([this] { FailOutstanding(Error::Connection(loss_reason_)); });
}

void ClientEngine::Start() {
  TimePoint now = clock_.Now();
  if (!lifecycle_.IsConnected()) {
    disconnected_since_ = now;
  }
  lifecycle_.Start(now);
}

void ClientEngine::Stop() {
  lifecycle_.Stop();
  framer_.Reset();
  Error stopped = Error::Connection("client stopped");
  FailOutstanding(stopped);
  FailQueued(stopped);
}

TransactionHandle ClientEngine::Submit(Request request, CompletionHandler handler) {
  TimePoint now = clock_.Now();
  auto transaction =
      std::make_shared<TransactionRecord>(next_id_++, std::move(request), std::move(handler), now, options_.retries);
  TransactionHandle handle(transaction);

  if (auto error = PduCodec::Validate(transaction->request)) {
    transaction->Resolve(*error);
    return handle;
  }
  if (lifecycle_.IsDown()) {
    transaction->Resolve(Error::Connection("client isn't connected"));
    return handle;
  }
  if (!lifecycle_.IsConnected() && !options_.queue_while_disconnected) {
    transaction->Resolve(Error::Connection("client isn't connected"));
    return handle;
  }

  waiting_.emplace(transaction->id, transaction);
  gate_.Enqueue(transaction->id);

  if (!in_poll_ && lifecycle_.IsConnected()) {
    AdmitWaiting();
    Dispatch(now);
  }
  return handle;
}

bool ClientEngine::Cancel(const TransactionHandle &handle) {
  const TransactionPtr &transaction = handle.record_;
  if (!transaction || transaction->IsDone()) {
    return false;
  }

  Error cancelled = Error::Cancelled("cancelled by caller");

  if (waiting_.erase(transaction->id) > 0) {
    gate_.Remove(transaction->id);
    transaction->Resolve(cancelled);
    return true;
  }

  auto ready = std::find(ready_.begin(), ready_.end(), transaction);
  if (ready != ready_.end()) {
    ready_.erase(ready);
    gate_.Release();
    transaction->Resolve(cancelled);
    return true;
  }

  auto deadline = manager_.Remove(transaction->id);
  if (deadline.has_value()) {
    gate_.Release();
    if (!framer_.IsCorrelated()) {
      // The device may still answer; keep the line until the answer would have been due
      framer_.ClearExpectation();
      line_free_at_ = std::max(line_free_at_, *deadline);
    }
    Logger()->debug("transaction {} cancelled while outstanding", transaction->id);
    transaction->Resolve(cancelled);
    return true;
  }
  return false;
}

void ClientEngine::Poll() {
  in_poll_ = true;
  TimePoint now = clock_.Now();

  switch (lifecycle_.Poll(now)) {
    case ConnectionLifecycle::Event::kConnected:
      framer_.Reset();
      line_free_at_ = now;
      break;
    case ConnectionLifecycle::Event::kConnectFailed:
      if (lifecycle_.IsDown()) {
        FailQueued(Error::Connection("connect failed"));
      }
      break;
    case ConnectionLifecycle::Event::kNone:
      break;
  }

  if (lifecycle_.IsConnected()) {
    ReadAvailable(now);
  }

  while (auto adu = framer_.Next(now)) {
    Deliver(*adu, now);
  }
  if (framer_.HasStreamError()) {
    HandleIoError(now, "stream lost synchronisation");
  }

  auto earliest = manager_.EarliestDeadline();
  if (earliest.has_value() && *earliest <= now) {
    HandleRetired(manager_.ExpireDue(now), now);
  }

  ExpireQueued(now);

  if (lifecycle_.IsConnected()) {
    AdmitWaiting();
    Dispatch(now);
  }
  in_poll_ = false;
}

void ClientEngine::ReadAvailable(TimePoint now) {
  std::array<uint8_t, kReadChunkSize> buffer{};
  while (lifecycle_.IsConnected()) {
    int n = transport_.Read(buffer);
    if (n < 0) {
      HandleIoError(now, "read failed");
      return;
    }
    if (n == 0) {
      return;
    }
    framer_.Feed(std::span<const uint8_t>(buffer.data(), static_cast<size_t>(n)), now);
  }
}

void ClientEngine::Deliver(const DecodedAdu &adu, TimePoint now) {
  TransactionPtr transaction = manager_.Find(adu.correlation_key);
  if (!transaction) {
    if (framer_.IsCorrelated()) {
      Logger()->warn("discarding response with unknown transaction id {}", adu.correlation_key);
    } else {
      Logger()->warn("discarding response while nothing is outstanding");
    }
    return;
  }

  if (!framer_.IsCorrelated() && adu.unit_id != transaction->request.GetUnitId()) {
    Logger()->warn("response from unit {} while waiting for unit {}", adu.unit_id, transaction->request.GetUnitId());
    HandleRetired(manager_.Reject(adu.correlation_key,
                                  Error::Protocol("response from unit " + std::to_string(adu.unit_id) +
                                                  ", expected unit " +
                                                  std::to_string(transaction->request.GetUnitId()))),
                  now);
    return;
  }

  auto decoded = PduCodec::DecodeResponse(transaction->request, adu.pdu);
  if (!decoded.has_value() && decoded.error().Is(ErrorKind::kProtocol)) {
    Logger()->warn("transaction {}: {}", transaction->id, decoded.error().GetMessage());
    HandleRetired(manager_.Reject(adu.correlation_key, decoded.error()), now);
    return;
  }

  if (!decoded.has_value()) {
    Logger()->debug("transaction {}: {}", transaction->id, decoded.error().GetMessage());
  }
  if (manager_.Complete(adu.correlation_key, std::move(decoded))) {
    Finish(now);
  }
}

void ClientEngine::HandleRetired(TransactionManager::Retired retired, TimePoint now) {
  for (const auto &transaction : retired.failed) {
    Logger()->debug("transaction {} failed: {}", transaction->id, transaction->result->error().ToString());
    Finish(now);
  }
  if (!retired.retry.empty()) {
    LineIdle(now);
  }
  // Retries keep their slot and go ahead of everything admitted later
  for (auto it = retired.retry.rbegin(); it != retired.retry.rend(); ++it) {
    ready_.push_front(*it);
  }
}

void ClientEngine::ExpireQueued(TimePoint now) {
  if (lifecycle_.IsConnected() || waiting_.empty()) {
    return;
  }
  if (lifecycle_.IsDown()) {
    FailQueued(Error::Connection("client isn't connected"));
    return;
  }

  std::vector<TransactionPtr> expired;
  for (const auto &[id, transaction] : waiting_) {
    TimePoint waiting_since = std::max(transaction->submitted_at, disconnected_since_);
    if (now - waiting_since >= options_.connect_wait_timeout) {
      expired.push_back(transaction);
    }
  }
  for (const auto &transaction : expired) {
    waiting_.erase(transaction->id);
    gate_.Remove(transaction->id);
    transaction->Resolve(Error::Connection("client isn't connected"));
  }
}

void ClientEngine::AdmitWaiting() {
  while (auto id = gate_.Admit()) {
    auto it = waiting_.find(*id);
    if (it == waiting_.end()) {
      gate_.Release();
      continue;
    }
    TransactionPtr transaction = std::move(it->second);
    waiting_.erase(it);
    transaction->state = TransactionState::kPending;
    ready_.push_back(std::move(transaction));
  }
}

void ClientEngine::Dispatch(TimePoint now) {
  while (!ready_.empty() && lifecycle_.IsConnected() && manager_.CanRegister()) {
    if (!framer_.IsCorrelated() && now < line_free_at_) {
      return;
    }
    TransactionPtr transaction = std::move(ready_.front());
    ready_.pop_front();
    Send(transaction, now);
  }
}

void ClientEngine::Send(const TransactionPtr &transaction, TimePoint now) {
  const Request &request = transaction->request;

  auto pdu = PduCodec::EncodeRequest(request);
  if (!pdu.has_value()) {
    transaction->Resolve(pdu.error());
    Finish(now);
    return;
  }

  size_t adu_size = pdu->Size() + framer_.EnvelopeSize();
  Duration timeout = deadlines_.ResponseTimeout(request, adu_size);
  bool broadcast = !framer_.IsCorrelated() && request.IsBroadcast();

  uint16_t key = 0;
  if (!broadcast) {
    auto registered = manager_.Register(transaction, now + timeout);
    if (!registered.has_value()) {
      transaction->Resolve(registered.error());
      Finish(now);
      return;
    }
    key = *registered;
  }

  if (!framer_.IsCorrelated()) {
    // Anything still in the receive path belongs to an earlier exchange
    framer_.Reset();
    transport_.DiscardInput();
    if (!broadcast) {
      framer_.Expect(request.GetUnitId(), PduCodec::ExpectedResponsePduSize(request));
    }
  }

  std::vector<uint8_t> adu = framer_.Encode(key, request.GetUnitId(), *pdu);
  ++transaction->attempts;
  Logger()->trace("tx {}", spdlog::to_hex(adu));
  if (transaction->attempts > 1) {
    Logger()->debug("transaction {} resent, attempt {}", transaction->id, transaction->attempts);
  }

  int written = transport_.Write(adu);
  if (written != static_cast<int>(adu.size())) {
    if (broadcast) {
      transaction->Resolve(Error::Connection("write failed"));
      Finish(now);
    }
    HandleIoError(now, "write failed");
    return;
  }

  if (broadcast) {
    // No reply comes; devices still need the turnaround time to act on it
    line_free_at_ = std::max(line_free_at_, now + timeout);
    gate_.Release();
    transaction->Resolve(BroadcastAcknowledgement(request));
  }
}

void ClientEngine::Finish(TimePoint now) {
  gate_.Release();
  LineIdle(now);
}

void ClientEngine::LineIdle(TimePoint now) {
  if (framer_.IsCorrelated()) {
    return;
  }
  framer_.ClearExpectation();
  line_free_at_ = std::max(line_free_at_, now + deadlines_.InterFrameDelay());
}

void ClientEngine::HandleIoError(TimePoint now, std::string reason) {
  Logger()->warn("{}", reason);
  framer_.Reset();
  loss_reason_ = reason;

  if (!lifecycle_.OnIoError(now)) {
    // Transport held open: only the work in flight is lost
    FailOutstanding(Error::Connection(reason));
    return;
  }

  FailOutstanding(Error::Connection(reason));
  disconnected_since_ = now;
  if (lifecycle_.IsDown()) {
    FailQueued(Error::Connection(reason));
  }
}

void ClientEngine::FailOutstanding(const Error &error) {
  for (size_t i = manager_.FailAll(error).size(); i > 0; --i) {
    gate_.Release();
  }

  std::deque<TransactionPtr> admitted;
  admitted.swap(ready_);
  for (const auto &transaction : admitted) {
    gate_.Release();
    transaction->Resolve(error);
  }

  if (!framer_.IsCorrelated()) {
    framer_.ClearExpectation();
  }
}

void ClientEngine::FailQueued(const Error &error) {
  std::map<TransactionId, TransactionPtr> queued;
  queued.swap(waiting_);
  for (const auto &[id, transaction] : queued) {
    gate_.Remove(id);
    transaction->Resolve(error);
  }
}

std::optional<TimePoint> ClientEngine::NextWakeup() const {
  std::optional<TimePoint> wake = manager_.EarliestDeadline();
  auto consider = [&wake](std::optional<TimePoint> candidate) {
    if (candidate.has_value() && (!wake.has_value() || *candidate < *wake)) {
      wake = candidate;
    }
  };
  consider(lifecycle_.NextAttemptAt());
  consider(lifecycle_.AttemptDeadline());
  if (!ready_.empty()) {
    consider(line_free_at_);
  }
  return wake;
}

void ClientEngine::Idle(TimePoint now) {
  Duration sleep = options_.idle_interval;
  auto wake = NextWakeup();
  if (wake.has_value() && *wake > now) {
    sleep = std::min(sleep, std::chrono::duration_cast<Duration>(*wake - now));
  }
  idle_(std::max(sleep, kMinIdle));
}

Result<Response> ClientEngine::Wait(const TransactionHandle &handle) {
  if (!handle.IsValid()) {
    return Error::Protocol("invalid transaction handle");
  }
  while (!handle.IsDone()) {
    Poll();
    if (handle.IsDone()) {
      break;
    }
    Idle(clock_.Now());
  }
  return *handle.GetResult();
}

bool ClientEngine::RunUntil(const std::function<bool()> &done, std::optional<Duration> limit) {
  TimePoint started = clock_.Now();
  while (!done()) {
    Poll();
    if (done()) {
      break;
    }
    TimePoint now = clock_.Now();
    if (limit.has_value() && now - started >= *limit) {
      return false;
    }
    Idle(now);
  }
  return true;
}

}  // namespace asyncmb
