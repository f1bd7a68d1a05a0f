#pragma once

#include <cstddef>
#include "../common/clock.hpp"
#include "../pdu/request.hpp"

namespace asyncmb {

/**
 * @brief How long a connection waits for each response
 */
class DeadlinePolicy {
 public:
  virtual ~DeadlinePolicy() = default;

  /**
   * @brief Time allowed for the response, counted from the end of the request write
   * @param request Request being sent; its own timeout takes part as each policy defines
   * @param request_adu_size Size of the request on the wire
   */
  [[nodiscard]] virtual Duration ResponseTimeout(const Request &request, size_t request_adu_size) const = 0;

  /** Idle time the line needs between the end of one exchange and the next request */
  [[nodiscard]] virtual Duration InterFrameDelay() const { return Duration::zero(); }
};

/**
 * @brief The request's own timeout, else one default for every request
 */
class FixedDeadlinePolicy : public DeadlinePolicy {
 public:
  explicit FixedDeadlinePolicy(Duration default_timeout)
      : default_timeout_(default_timeout) {}

  [[nodiscard]] Duration ResponseTimeout(const Request &request, size_t) const override {
    return request.GetTimeout().value_or(default_timeout_);
  }

 private:
  Duration default_timeout_;
};

}  // namespace asyncmb
