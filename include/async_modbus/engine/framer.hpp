#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "../common/clock.hpp"
#include "../pdu/pdu.hpp"

namespace asyncmb {

/**
 * @brief One delimited, envelope-checked ADU
 *
 * On TCP the correlation key is the MBAP transaction id. RTU has no
 * correlation field; the key is always 0 there.
 */
struct DecodedAdu {
  uint16_t correlation_key{0};
  uint8_t unit_id{0};
  Pdu pdu{};

  bool operator==(const DecodedAdu &) const = default;
};

/**
 * @brief Transport envelope and stream delimiting
 *
 * Turns PDUs into wire bytes and a byte stream back into ADUs. Framers keep
 * their own receive buffer; the engine feeds whatever the transport returned
 * and then pulls complete ADUs.
 */
class Framer {
 public:
  virtual ~Framer() = default;

  /** True when responses carry a correlation key (TCP), false for strict FIFO lines (RTU) */
  [[nodiscard]] virtual bool IsCorrelated() const noexcept = 0;

  /** Bytes the envelope adds around a PDU */
  [[nodiscard]] virtual size_t EnvelopeSize() const noexcept = 0;

  [[nodiscard]] virtual std::vector<uint8_t> Encode(uint16_t correlation_key, uint8_t unit_id,
                                                    const Pdu &pdu) const = 0;

  /**
   * @brief Announce the response the line is waiting for
   * @param unit_id Addressed unit
   * @param response_pdu_size Normal response PDU size, 0 if unknown
   */
  virtual void Expect(uint8_t unit_id, size_t response_pdu_size) = 0;

  /** Nothing is outstanding any more; bytes that arrive now are noise */
  virtual void ClearExpectation() = 0;

  virtual void Feed(std::span<const uint8_t> bytes, TimePoint now) = 0;

  /**
   * @brief Take the next complete ADU
   * @param now Used by silence-delimited framers to close a frame
   */
  [[nodiscard]] virtual std::optional<DecodedAdu> Next(TimePoint now) = 0;

  /** The stream can no longer be delimited and the connection must be dropped */
  [[nodiscard]] virtual bool HasStreamError() const noexcept = 0;

  /** Drop buffered bytes and any stream error */
  virtual void Reset() = 0;
};

}  // namespace asyncmb
