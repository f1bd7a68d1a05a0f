#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include "../common/error.hpp"
#include "../common/exception_code.hpp"
#include "../common/function_code.hpp"
#include "../common/result.hpp"
#include "pdu.hpp"
#include "request.hpp"
#include "response.hpp"

namespace asyncmb {

/**
 * @brief Pure PDU encoder/decoder
 *
 * Converts between structured requests/responses and function code + payload.
 * All 16-bit fields are big-endian. No I/O and no timing.
 */
class PduCodec {
 public:
  static constexpr uint16_t kMaxReadBits = 2000;
  static constexpr uint16_t kMaxReadRegisters = 125;
  static constexpr uint16_t kMaxWriteCoils = 1968;
  static constexpr uint16_t kMaxWriteRegisters = 123;
  static constexpr uint16_t kMaxReadWriteWriteRegisters = 121;
  static constexpr size_t kExceptionPduSize = 2;  // function_code + exception_code

  /**
   * @brief Check quantity and address bounds for the request's function code
   * @return The encoding error, or empty if the request may be encoded
   */
  [[nodiscard]] static std::optional<Error> Validate(const Request &request);

  /**
   * @brief Encode a request into a PDU
   * @return PDU, or an EncodingError if the request is out of bounds or unsupported
   */
  [[nodiscard]] static Result<Pdu> EncodeRequest(const Request &request);

  /**
   * @brief Parse a request PDU back into a structured request
   * @param unit_id Unit id from the transport envelope
   * @param pdu Request PDU
   */
  [[nodiscard]] static Result<Request> DecodeRequest(uint8_t unit_id, const Pdu &pdu);

  /**
   * @brief Decode a response PDU against the request that produced it
   *
   * A matching function code yields typed values; the request's function code
   * with the exception bit set yields an ExceptionResponse error; anything else
   * is a protocol error.
   */
  [[nodiscard]] static Result<Response> DecodeResponse(const Request &request, const Pdu &pdu);

  /** Encode a normal response (device side; used by tests and loopback tools) */
  [[nodiscard]] static Pdu EncodeResponse(const Response &response);

  /** Encode an exception response for the given function */
  [[nodiscard]] static Pdu EncodeException(FunctionCode function_code, ExceptionCode exception_code);

  /**
   * @brief Size of the normal response PDU the request should produce
   * @return Bytes including the function code, or 0 if not known in advance
   */
  [[nodiscard]] static size_t ExpectedResponsePduSize(const Request &request);
};

}  // namespace asyncmb
