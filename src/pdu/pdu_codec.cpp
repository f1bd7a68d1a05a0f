#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/error.hpp"
#include "common/exception_code.hpp"
#include "common/function_code.hpp"
#include "pdu/pdu.hpp"
#include "pdu/pdu_codec.hpp"
#include "pdu/request.hpp"
#include "pdu/response.hpp"

namespace asyncmb {

static constexpr uint32_t kAddressSpaceSize{0x10000};
static constexpr size_t kAddressQuantitySize{4};  // address(2) + quantity/value(2)
static constexpr size_t kWriteMultipleHeaderSize{5};  // address(2) + quantity(2) + byte_count(1)
static constexpr size_t kReadWriteHeaderSize{9};  // read(4) + write(4) + byte_count(1)
static constexpr size_t kMaskWriteSize{6};  // address(2) + and(2) + or(2)

static void PutU16(std::vector<uint8_t> &out, uint16_t value) {
  out.push_back(GetHighByte(value));
  out.push_back(GetLowByte(value));
}

static uint16_t ReadU16(const std::vector<uint8_t> &data, size_t offset) {
  return MakeUint16(data[offset], data[offset + 1]);
}

// Coils are packed LSB first: coil N is bit (N % 8) of byte (N / 8)
static std::vector<uint8_t> PackBits(const std::vector<bool> &bits) {
  std::vector<uint8_t> bytes(ByteCountForBits(static_cast<uint16_t>(bits.size())), 0);
  for (size_t i = 0; i < bits.size(); ++i) {
    if (bits[i]) {
      bytes[i / kBitsPerByte] |= static_cast<uint8_t>(1U << (i % kBitsPerByte));
    }
  }
  return bytes;
}

static std::vector<bool> UnpackBits(const std::vector<uint8_t> &data, size_t offset, uint16_t count) {
  std::vector<bool> bits;
  bits.reserve(count);
  for (uint16_t i = 0; i < count; ++i) {
    uint8_t byte = data[offset + i / kBitsPerByte];
    bits.push_back((byte & (1U << (i % kBitsPerByte))) != 0);
  }
  return bits;
}

static std::vector<uint16_t> UnpackRegisters(const std::vector<uint8_t> &data, size_t offset, uint16_t count) {
  std::vector<uint16_t> registers;
  registers.reserve(count);
  for (uint16_t i = 0; i < count; ++i) {
    registers.push_back(ReadU16(data, offset + static_cast<size_t>(i) * 2));
  }
  return registers;
}

static std::string FunctionNumber(FunctionCode function_code) {
  return std::to_string(static_cast<int>(function_code));
}

static std::optional<Error> CheckQuantity(const char *what, uint32_t start, uint32_t quantity, uint32_t max) {
  if (quantity < 1 || quantity > max) {
    return Error::Encoding(std::string(what) + " quantity " + std::to_string(quantity) + " outside 1.." +
                           std::to_string(max));
  }
  if (start + quantity > kAddressSpaceSize) {
    return Error::Encoding(std::string(what) + " span " + std::to_string(start) + "+" + std::to_string(quantity) +
                           " exceeds the address space");
  }
  return {};
}

std::optional<Error> PduCodec::Validate(const Request &request) {
  auto span = request.GetAddressSpan();
  switch (request.GetFunctionCode()) {
    case FunctionCode::kReadCoils:
    case FunctionCode::kReadDI:
      return CheckQuantity("read bits", span.start_address, span.reg_count, kMaxReadBits);
    case FunctionCode::kReadHR:
    case FunctionCode::kReadIR:
      return CheckQuantity("read registers", span.start_address, span.reg_count, kMaxReadRegisters);
    case FunctionCode::kWriteSingleCoil:
      if (request.GetCoils().size() != 1) {
        return Error::Encoding("write single coil needs exactly one value");
      }
      return {};
    case FunctionCode::kWriteSingleReg:
      if (request.GetRegisters().size() != 1) {
        return Error::Encoding("write single register needs exactly one value");
      }
      return {};
    case FunctionCode::kWriteMultCoils:
      if (request.GetCoils().size() != span.reg_count) {
        return Error::Encoding("write multiple coils value count does not match quantity");
      }
      return CheckQuantity("write coils", span.start_address, span.reg_count, kMaxWriteCoils);
    case FunctionCode::kWriteMultRegs:
      if (request.GetRegisters().size() != span.reg_count) {
        return Error::Encoding("write multiple registers value count does not match quantity");
      }
      return CheckQuantity("write registers", span.start_address, span.reg_count, kMaxWriteRegisters);
    case FunctionCode::kReadExceptionStatus:
      return {};
    case FunctionCode::kMaskWriteReg:
      if (request.GetRegisters().size() != 2) {
        return Error::Encoding("mask write register needs an AND and an OR mask");
      }
      return {};
    case FunctionCode::kReadWriteMultRegs: {
      if (auto error = CheckQuantity("read registers", span.start_address, span.reg_count, kMaxReadRegisters)) {
        return error;
      }
      return CheckQuantity("write registers", request.GetWriteStart(),
                           static_cast<uint32_t>(request.GetRegisters().size()), kMaxReadWriteWriteRegisters);
    }
    default:
      return Error::Encoding("unsupported function code " + FunctionNumber(request.GetFunctionCode()));
  }
}

Result<Pdu> PduCodec::EncodeRequest(const Request &request) {
  if (auto error = Validate(request)) {
    return *error;
  }

  Pdu pdu{static_cast<uint8_t>(request.GetFunctionCode()), {}};
  auto span = request.GetAddressSpan();
  const auto &registers = request.GetRegisters();
  auto &data = pdu.data;

  switch (request.GetFunctionCode()) {
    case FunctionCode::kReadCoils:
    case FunctionCode::kReadDI:
    case FunctionCode::kReadHR:
    case FunctionCode::kReadIR:
      PutU16(data, span.start_address);
      PutU16(data, span.reg_count);
      break;
    case FunctionCode::kWriteSingleCoil:
      PutU16(data, span.start_address);
      PutU16(data, request.GetCoils().front() ? kCoilOnValue : kCoilOffValue);
      break;
    case FunctionCode::kWriteSingleReg:
      PutU16(data, span.start_address);
      PutU16(data, registers.front());
      break;
    case FunctionCode::kWriteMultCoils: {
      auto packed = PackBits(request.GetCoils());
      PutU16(data, span.start_address);
      PutU16(data, span.reg_count);
      data.push_back(static_cast<uint8_t>(packed.size()));
      data.insert(data.end(), packed.begin(), packed.end());
      break;
    }
    case FunctionCode::kWriteMultRegs:
      PutU16(data, span.start_address);
      PutU16(data, span.reg_count);
      data.push_back(static_cast<uint8_t>(registers.size() * 2));
      for (uint16_t value : registers) {
        PutU16(data, value);
      }
      break;
    case FunctionCode::kReadExceptionStatus:
      break;
    case FunctionCode::kMaskWriteReg:
      PutU16(data, span.start_address);
      PutU16(data, registers[0]);
      PutU16(data, registers[1]);
      break;
    case FunctionCode::kReadWriteMultRegs:
      PutU16(data, span.start_address);
      PutU16(data, span.reg_count);
      PutU16(data, request.GetWriteStart());
      PutU16(data, static_cast<uint16_t>(registers.size()));
      data.push_back(static_cast<uint8_t>(registers.size() * 2));
      for (uint16_t value : registers) {
        PutU16(data, value);
      }
      break;
    default:
      return Error::Encoding("unsupported function code " + FunctionNumber(request.GetFunctionCode()));
  }

  return pdu;
}

Result<Request> PduCodec::DecodeRequest(uint8_t unit_id, const Pdu &pdu) {
  if (pdu.IsException() || !IsSupportedFunction(pdu.function_code)) {
    return Error::Protocol("unsupported request function code " + std::to_string(pdu.function_code));
  }

  const auto function_code = static_cast<FunctionCode>(pdu.function_code);
  const auto &data = pdu.data;
  auto malformed = [&] { return Error::Protocol("malformed request for function " + FunctionNumber(function_code)); };

  std::optional<Request> request;
  switch (function_code) {
    case FunctionCode::kReadCoils:
    case FunctionCode::kReadDI:
    case FunctionCode::kReadHR:
    case FunctionCode::kReadIR: {
      if (data.size() != kAddressQuantitySize) {
        return malformed();
      }
      uint16_t start = ReadU16(data, 0);
      uint16_t count = ReadU16(data, 2);
      if (function_code == FunctionCode::kReadCoils) {
        request = Request::ReadCoils(unit_id, start, count);
      } else if (function_code == FunctionCode::kReadDI) {
        request = Request::ReadDiscreteInputs(unit_id, start, count);
      } else if (function_code == FunctionCode::kReadHR) {
        request = Request::ReadHoldingRegisters(unit_id, start, count);
      } else {
        request = Request::ReadInputRegisters(unit_id, start, count);
      }
      break;
    }
    case FunctionCode::kWriteSingleCoil: {
      if (data.size() != kAddressQuantitySize) {
        return malformed();
      }
      uint16_t value = ReadU16(data, 2);
      if (value != kCoilOnValue && value != kCoilOffValue) {
        return Error::Protocol("write single coil value must be 0xFF00 or 0x0000");
      }
      request = Request::WriteSingleCoil(unit_id, ReadU16(data, 0), value == kCoilOnValue);
      break;
    }
    case FunctionCode::kWriteSingleReg:
      if (data.size() != kAddressQuantitySize) {
        return malformed();
      }
      request = Request::WriteSingleRegister(unit_id, ReadU16(data, 0), ReadU16(data, 2));
      break;
    case FunctionCode::kWriteMultCoils: {
      if (data.size() < kWriteMultipleHeaderSize) {
        return malformed();
      }
      uint16_t quantity = ReadU16(data, 2);
      uint8_t byte_count = data[4];
      if (byte_count != ByteCountForBits(quantity) || data.size() != kWriteMultipleHeaderSize + byte_count) {
        return malformed();
      }
      request = Request::WriteMultipleCoils(unit_id, ReadU16(data, 0),
                                            UnpackBits(data, kWriteMultipleHeaderSize, quantity));
      break;
    }
    case FunctionCode::kWriteMultRegs: {
      if (data.size() < kWriteMultipleHeaderSize) {
        return malformed();
      }
      uint16_t quantity = ReadU16(data, 2);
      uint8_t byte_count = data[4];
      if (byte_count != quantity * 2 || data.size() != kWriteMultipleHeaderSize + byte_count) {
        return malformed();
      }
      request = Request::WriteMultipleRegisters(unit_id, ReadU16(data, 0),
                                                UnpackRegisters(data, kWriteMultipleHeaderSize, quantity));
      break;
    }
    case FunctionCode::kReadExceptionStatus:
      if (!data.empty()) {
        return malformed();
      }
      request = Request::ReadExceptionStatus(unit_id);
      break;
    case FunctionCode::kMaskWriteReg:
      if (data.size() != kMaskWriteSize) {
        return malformed();
      }
      request = Request::MaskWriteRegister(unit_id, ReadU16(data, 0), ReadU16(data, 2), ReadU16(data, 4));
      break;
    case FunctionCode::kReadWriteMultRegs: {
      if (data.size() < kReadWriteHeaderSize) {
        return malformed();
      }
      uint16_t write_quantity = ReadU16(data, 6);
      uint8_t byte_count = data[8];
      if (byte_count != write_quantity * 2 || data.size() != kReadWriteHeaderSize + byte_count) {
        return malformed();
      }
      request = Request::ReadWriteMultipleRegisters(unit_id, ReadU16(data, 0), ReadU16(data, 2), ReadU16(data, 4),
                                                    UnpackRegisters(data, kReadWriteHeaderSize, write_quantity));
      break;
    }
    default:
      return malformed();
  }

  if (auto error = Validate(*request)) {
    return Error::Protocol(error->GetMessage());
  }
  return *request;
}

Result<Response> PduCodec::DecodeResponse(const Request &request, const Pdu &pdu) {
  const auto function_code = request.GetFunctionCode();
  const auto expected = static_cast<uint8_t>(function_code);
  const auto &data = pdu.data;

  if (pdu.function_code == (expected | kExceptionFunctionCodeMask)) {
    if (data.size() != 1) {
      return Error::Protocol("malformed exception response for function " + FunctionNumber(function_code));
    }
    return Error::FromException(function_code, static_cast<ExceptionCode>(data[0]));
  }

  if (pdu.function_code != expected) {
    return Error::Protocol("function code mismatch: sent " + std::to_string(expected) + ", received " +
                           std::to_string(pdu.function_code));
  }

  auto malformed = [&] { return Error::Protocol("malformed response for function " + FunctionNumber(function_code)); };
  auto span = request.GetAddressSpan();
  Response response(request.GetUnitId(), function_code);

  switch (function_code) {
    case FunctionCode::kReadCoils:
    case FunctionCode::kReadDI: {
      uint16_t byte_count = ByteCountForBits(span.reg_count);
      if (data.empty() || data[0] != byte_count || data.size() != 1U + byte_count) {
        return malformed();
      }
      // Padding bits of the last byte are dropped
      response.SetBits(UnpackBits(data, 1, span.reg_count));
      break;
    }
    case FunctionCode::kReadHR:
    case FunctionCode::kReadIR:
    case FunctionCode::kReadWriteMultRegs: {
      size_t byte_count = static_cast<size_t>(span.reg_count) * 2;
      if (data.empty() || data[0] != byte_count || data.size() != 1 + byte_count) {
        return malformed();
      }
      response.SetRegisters(UnpackRegisters(data, 1, span.reg_count));
      break;
    }
    case FunctionCode::kWriteSingleCoil:
    case FunctionCode::kWriteSingleReg: {
      if (data.size() != kAddressQuantitySize) {
        return malformed();
      }
      uint16_t address = ReadU16(data, 0);
      uint16_t value = ReadU16(data, 2);
      uint16_t sent = function_code == FunctionCode::kWriteSingleCoil
                          ? (request.GetCoils().front() ? kCoilOnValue : kCoilOffValue)
                          : request.GetRegisters().front();
      if (address != span.start_address || value != sent) {
        return Error::Protocol("write echo does not match the request");
      }
      response.SetEcho(address, value);
      break;
    }
    case FunctionCode::kWriteMultCoils:
    case FunctionCode::kWriteMultRegs: {
      if (data.size() != kAddressQuantitySize) {
        return malformed();
      }
      uint16_t address = ReadU16(data, 0);
      uint16_t quantity = ReadU16(data, 2);
      if (address != span.start_address || quantity != span.reg_count) {
        return Error::Protocol("write echo does not match the request");
      }
      response.SetEcho(address, quantity);
      break;
    }
    case FunctionCode::kReadExceptionStatus:
      if (data.size() != 1) {
        return malformed();
      }
      response.SetExceptionStatus(data[0]);
      break;
    case FunctionCode::kMaskWriteReg: {
      if (data.size() != kMaskWriteSize) {
        return malformed();
      }
      uint16_t address = ReadU16(data, 0);
      std::vector<uint16_t> masks{ReadU16(data, 2), ReadU16(data, 4)};
      if (address != span.start_address || masks != request.GetRegisters()) {
        return Error::Protocol("mask write echo does not match the request");
      }
      response.SetEcho(address, 0);
      response.SetRegisters(std::move(masks));
      break;
    }
    default:
      return Error::Protocol("unsupported function code " + FunctionNumber(function_code));
  }

  return response;
}

Pdu PduCodec::EncodeResponse(const Response &response) {
  Pdu pdu{static_cast<uint8_t>(response.GetFunctionCode()), {}};
  auto &data = pdu.data;

  switch (response.GetFunctionCode()) {
    case FunctionCode::kReadCoils:
    case FunctionCode::kReadDI: {
      auto packed = PackBits(response.GetBits());
      data.push_back(static_cast<uint8_t>(packed.size()));
      data.insert(data.end(), packed.begin(), packed.end());
      break;
    }
    case FunctionCode::kReadHR:
    case FunctionCode::kReadIR:
    case FunctionCode::kReadWriteMultRegs:
      data.push_back(static_cast<uint8_t>(response.GetRegisters().size() * 2));
      for (uint16_t value : response.GetRegisters()) {
        PutU16(data, value);
      }
      break;
    case FunctionCode::kWriteSingleCoil:
    case FunctionCode::kWriteSingleReg:
    case FunctionCode::kWriteMultCoils:
    case FunctionCode::kWriteMultRegs:
      PutU16(data, response.GetAddress());
      PutU16(data, response.GetValue());
      break;
    case FunctionCode::kReadExceptionStatus:
      data.push_back(response.GetExceptionStatus());
      break;
    case FunctionCode::kMaskWriteReg:
      PutU16(data, response.GetAddress());
      for (uint16_t mask : response.GetRegisters()) {
        PutU16(data, mask);
      }
      break;
    default:
      break;
  }

  return pdu;
}

Pdu PduCodec::EncodeException(FunctionCode function_code, ExceptionCode exception_code) {
  return Pdu{static_cast<uint8_t>(static_cast<uint8_t>(function_code) | kExceptionFunctionCodeMask),
             {static_cast<uint8_t>(exception_code)}};
}

size_t PduCodec::ExpectedResponsePduSize(const Request &request) {
  auto quantity = request.GetAddressSpan().reg_count;
  switch (request.GetFunctionCode()) {
    case FunctionCode::kReadCoils:
    case FunctionCode::kReadDI:
      return 2 + ByteCountForBits(quantity);  // function_code + byte_count + bits
    case FunctionCode::kReadHR:
    case FunctionCode::kReadIR:
    case FunctionCode::kReadWriteMultRegs:
      return 2 + static_cast<size_t>(quantity) * 2;  // function_code + byte_count + registers
    case FunctionCode::kWriteSingleCoil:
    case FunctionCode::kWriteSingleReg:
    case FunctionCode::kWriteMultCoils:
    case FunctionCode::kWriteMultRegs:
      return 1 + kAddressQuantitySize;
    case FunctionCode::kReadExceptionStatus:
      return 2;
    case FunctionCode::kMaskWriteReg:
      return 1 + kMaskWriteSize;
    default:
      return 0;
  }
}

}  // namespace asyncmb
