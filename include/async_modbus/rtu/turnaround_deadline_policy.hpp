#pragma once

#include <cstddef>
#include "../common/clock.hpp"
#include "../engine/deadline_policy.hpp"
#include "../pdu/request.hpp"
#include "rtu_frame.hpp"
#include "rtu_timing.hpp"

namespace asyncmb {

/**
 * @brief RTU deadlines from the physical transmission time of both frames
 *
 * The configured extra wait covers the device's processing time only. A
 * request-level timeout replaces that extra wait; the transmission time is
 * always added.
 */
class TurnaroundDeadlinePolicy : public DeadlinePolicy {
 public:
  TurnaroundDeadlinePolicy(RtuTiming timing, Duration extra_wait)
      : timing_(timing),
        extra_wait_(extra_wait) {}

  [[nodiscard]] Duration ResponseTimeout(const Request &request, size_t request_adu_size) const override {
    size_t response_size = 0;
    if (!request.IsBroadcast()) {
      response_size = RtuTiming::ExpectedResponseAduSize(request);
      if (response_size == 0) {
        response_size = RtuFrame::kExceptionResponseFrameSize;
      }
    }
    return timing_.TurnaroundDeadline(request_adu_size, response_size, request.GetTimeout().value_or(extra_wait_));
  }

  [[nodiscard]] Duration InterFrameDelay() const override { return timing_.InterFrameDelay(); }

  [[nodiscard]] const RtuTiming &GetTiming() const noexcept { return timing_; }
  [[nodiscard]] Duration GetExtraWait() const noexcept { return extra_wait_; }

 private:
  RtuTiming timing_;
  Duration extra_wait_;
};

}  // namespace asyncmb
