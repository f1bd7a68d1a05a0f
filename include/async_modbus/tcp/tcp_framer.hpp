#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "../common/clock.hpp"
#include "../engine/framer.hpp"
#include "../pdu/pdu.hpp"
#include "tcp_frame.hpp"

namespace asyncmb {

/**
 * @brief Length-prefixed MBAP stream delimiter
 *
 * Accepts arbitrary chunks from the socket and yields whole ADUs: several
 * frames in one read and frames split across reads are both handled. Frames
 * with a non-zero protocol id are dropped. A length field outside 2..254 means
 * the stream has lost synchronisation, which is reported through
 * HasStreamError().
 */
class TcpFramer : public Framer {
 public:
  [[nodiscard]] bool IsCorrelated() const noexcept override { return true; }
  [[nodiscard]] size_t EnvelopeSize() const noexcept override { return TcpFrame::kMbapHeaderSize; }

  [[nodiscard]] std::vector<uint8_t> Encode(uint16_t correlation_key, uint8_t unit_id, const Pdu &pdu) const override;

  // Correlation is by transaction id; nothing to prepare
  void Expect(uint8_t, size_t) override {}
  void ClearExpectation() override {}

  void Feed(std::span<const uint8_t> bytes, TimePoint now) override;
  [[nodiscard]] std::optional<DecodedAdu> Next(TimePoint now) override;
  [[nodiscard]] bool HasStreamError() const noexcept override { return stream_error_; }
  void Reset() override;

  [[nodiscard]] size_t BufferedBytes() const noexcept { return buffer_.size(); }

 private:
  std::vector<uint8_t> buffer_{};
  bool stream_error_{false};
};

}  // namespace asyncmb
