#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>
#include <gtest/gtest.h>
#include "async_modbus/common/clock.hpp"
#include "async_modbus/common/error.hpp"
#include "async_modbus/common/exception_code.hpp"
#include "async_modbus/engine/connection_lifecycle.hpp"
#include "async_modbus/pdu/request.hpp"
#include "async_modbus/tcp/tcp_client.hpp"
#include "async_modbus/tcp/tcp_config.hpp"
#include "async_modbus/transport/memory_transport.hpp"
#include "support/fake_device.hpp"

using asyncmb::ConnectionState;
using asyncmb::Duration;
using asyncmb::ErrorKind;
using asyncmb::ExceptionCode;
using asyncmb::ManualClock;
using asyncmb::MemoryTransport;
using asyncmb::Request;
using asyncmb::TcpClient;
using asyncmb::TcpConfig;
using asyncmb_test::FakeDevice;
using std::chrono::milliseconds;

namespace {

class TcpClientFixture : public ::testing::Test {
 protected:
  void Build(TcpConfig config = {}) {
    client_ = std::make_unique<TcpClient>(config, transport_, clock_);
    client_->GetEngine().SetIdleHandler([this](Duration duration) { clock_.Advance(duration); });
  }

  ManualClock clock_;
  MemoryTransport transport_;
  FakeDevice device_{transport_, FakeDevice::Framing::kTcp};
  std::unique_ptr<TcpClient> client_;
};

}  // namespace

TEST(TcpClientOptions, ConfigMapsOntoEngine) {
  TcpConfig config;
  config.max_active_requests = 4;
  config.retries = 2;
  config.auto_reconnect_after = milliseconds(250);
  config.queue_while_disconnected = false;

  auto options = TcpClient::ToEngineOptions(config);

  EXPECT_EQ(options.concurrency_limit, 4U);
  EXPECT_EQ(options.retries, 2);
  EXPECT_FALSE(options.queue_while_disconnected);
  EXPECT_FALSE(options.lifecycle.hold_open);
  ASSERT_TRUE(options.lifecycle.auto_reconnect_after.has_value());
  EXPECT_EQ(*options.lifecycle.auto_reconnect_after, milliseconds(250));
}

TEST_F(TcpClientFixture, ConnectsOnFirstPoll) {
  Build();
  EXPECT_EQ(client_->GetConnectionState(), ConnectionState::kDisconnected);

  client_->Poll();

  EXPECT_EQ(client_->GetConnectionState(), ConnectionState::kConnected);
  EXPECT_EQ(transport_.GetConnectAttempts(), 1);
}

TEST_F(TcpClientFixture, ReadHoldingRegistersWireFormat) {
  TcpConfig config;
  config.default_unit_id = 0x11;
  Build(config);
  device_.SetRegister(0x006B, 0x022B);
  device_.SetRegister(0x006C, 0x0000);
  device_.SetRegister(0x006D, 0x0064);

  auto values = client_->ReadHoldingRegisters(0x006B, 3);

  ASSERT_TRUE(values.has_value()) << values.error().ToString();
  EXPECT_EQ(*values, (std::vector<uint16_t>{0x022B, 0x0000, 0x0064}));
  ASSERT_EQ(transport_.GetWrittenFrames().size(), 1U);
  EXPECT_EQ(transport_.GetWrittenFrames()[0],
            (std::vector<uint8_t>{0x00, 0x01, 0x00, 0x00, 0x00, 0x06, 0x11, 0x03, 0x00, 0x6B, 0x00, 0x03}));
}

TEST_F(TcpClientFixture, TypedOperations) {
  Build();
  device_.SetExceptionStatus(0x01);

  ASSERT_TRUE(client_->WriteSingleCoil(3, true).has_value());
  ASSERT_TRUE(client_->WriteMultipleCoils(4, {false, true}).has_value());
  ASSERT_TRUE(client_->WriteSingleRegister(10, 0x1111).has_value());
  ASSERT_TRUE(client_->WriteMultipleRegisters(11, {0x2222, 0x3333}).has_value());
  ASSERT_TRUE(client_->MaskWriteRegister(10, 0xFF00, 0x0022).has_value());

  auto coils = client_->ReadCoils(3, 3);
  auto inputs = client_->ReadDiscreteInputs(3, 2);
  auto registers = client_->ReadInputRegisters(10, 3);
  auto read_write = client_->ReadWriteMultipleRegisters(12, 1, 12, {0x4444});
  auto status = client_->ReadExceptionStatus();

  ASSERT_TRUE(coils.has_value());
  EXPECT_EQ(*coils, (std::vector<bool>{true, false, true}));
  ASSERT_TRUE(inputs.has_value());
  EXPECT_EQ(*inputs, (std::vector<bool>{true, false}));
  ASSERT_TRUE(registers.has_value());
  EXPECT_EQ(*registers, (std::vector<uint16_t>{0x1122, 0x2222, 0x3333}));
  ASSERT_TRUE(read_write.has_value());
  EXPECT_EQ(*read_write, (std::vector<uint16_t>{0x4444}));
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(*status, 0x01);
}

TEST_F(TcpClientFixture, DefaultAndOverriddenUnitId) {
  TcpConfig config;
  config.default_unit_id = 0xFF;
  Build(config);

  ASSERT_TRUE(client_->ReadHoldingRegisters(0, 1).has_value());
  ASSERT_TRUE(client_->ReadHoldingRegisters(0, 1, 0x05).has_value());

  ASSERT_EQ(device_.GetRequests().size(), 2U);
  EXPECT_EQ(device_.GetRequests()[0].GetUnitId(), 0xFF);
  EXPECT_EQ(device_.GetRequests()[1].GetUnitId(), 0x05);
}

TEST_F(TcpClientFixture, ExceptionResponse) {
  Build();
  device_.RespondWithException(ExceptionCode::kServerDeviceBusy);

  auto result = client_->WriteSingleRegister(1, 2);

  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().Is(ErrorKind::kExceptionResponse));
  EXPECT_EQ(result.error().GetExceptionCode(), ExceptionCode::kServerDeviceBusy);
}

TEST_F(TcpClientFixture, TimeoutOverride) {
  Build();
  device_.SetSilent(true);
  client_->Poll();
  auto started = clock_.Now();

  auto result = client_->ReadCoils(0, 1, {}, milliseconds(30));

  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().Is(ErrorKind::kTimeout));
  EXPECT_LT(clock_.Now() - started, milliseconds(200));
}

TEST_F(TcpClientFixture, InvalidQuantityRejectedLocally) {
  Build();

  auto result = client_->ReadHoldingRegisters(0, 126);

  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().Is(ErrorKind::kEncoding));
  EXPECT_TRUE(transport_.GetWrittenFrames().empty());
}

TEST_F(TcpClientFixture, ConcurrentSubmissions) {
  TcpConfig config;
  config.max_active_requests = 2;
  Build(config);
  client_->Poll();
  device_.SetHoldReplies(true);

  std::vector<asyncmb::TransactionHandle> handles;
  for (uint16_t address = 0; address < 4; ++address) {
    device_.SetRegister(address, address);
    handles.push_back(client_->Submit(Request::ReadHoldingRegisters(0, address, 1)));
  }
  EXPECT_EQ(transport_.GetWrittenFrames().size(), 2U);

  while (transport_.GetWrittenFrames().size() < 4 || device_.HeldCount() > 0) {
    if (device_.HeldCount() > 0) {
      device_.ReleaseHeld(device_.HeldCount() - 1);
    }
    client_->Poll();
  }
  client_->Poll();

  for (uint16_t address = 0; address < 4; ++address) {
    ASSERT_TRUE(handles[address].IsDone());
    EXPECT_EQ((*handles[address].GetResult())->GetRegisters(), (std::vector<uint16_t>{address}));
  }
}

TEST_F(TcpClientFixture, StopThenStartReconnects) {
  Build();
  client_->Poll();

  client_->Stop();
  EXPECT_EQ(client_->GetConnectionState(), ConnectionState::kDisconnected);
  EXPECT_FALSE(client_->ReadHoldingRegisters(0, 1).has_value());

  client_->Start();
  auto values = client_->ReadHoldingRegisters(0, 1);
  ASSERT_TRUE(values.has_value());
  EXPECT_EQ(transport_.GetConnectAttempts(), 2);
}
