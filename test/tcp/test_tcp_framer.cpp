#include <cstdint>
#include <span>
#include <vector>
#include <gtest/gtest.h>
#include "async_modbus/common/clock.hpp"
#include "async_modbus/pdu/pdu.hpp"
#include "async_modbus/tcp/tcp_frame.hpp"
#include "async_modbus/tcp/tcp_framer.hpp"

using asyncmb::Pdu;
using asyncmb::TcpFrame;
using asyncmb::TcpFramer;
using asyncmb::TimePoint;

namespace {

std::vector<uint8_t> ReadResponseFrame(uint16_t transaction_id, uint16_t value) {
  return TcpFrame::Encode(transaction_id, 0x01,
                          Pdu{0x03, {0x02, static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value & 0xFF)}});
}

}  // namespace

TEST(TcpFramer, SingleFrame) {
  TcpFramer framer;
  TimePoint now{};

  framer.Feed(ReadResponseFrame(7, 0x1234), now);
  auto adu = framer.Next(now);

  ASSERT_TRUE(adu.has_value());
  EXPECT_EQ(adu->correlation_key, 7);
  EXPECT_EQ(adu->unit_id, 0x01);
  EXPECT_EQ(adu->pdu.data, (std::vector<uint8_t>{0x02, 0x12, 0x34}));
  EXPECT_FALSE(framer.Next(now).has_value());
  EXPECT_EQ(framer.BufferedBytes(), 0U);
}

TEST(TcpFramer, SeveralFramesInOneRead) {
  TcpFramer framer;
  TimePoint now{};
  std::vector<uint8_t> bytes = ReadResponseFrame(1, 0x0001);
  auto second = ReadResponseFrame(2, 0x0002);
  auto third = ReadResponseFrame(3, 0x0003);
  bytes.insert(bytes.end(), second.begin(), second.end());
  bytes.insert(bytes.end(), third.begin(), third.end());

  framer.Feed(bytes, now);

  for (uint16_t id = 1; id <= 3; ++id) {
    auto adu = framer.Next(now);
    ASSERT_TRUE(adu.has_value());
    EXPECT_EQ(adu->correlation_key, id);
  }
  EXPECT_FALSE(framer.Next(now).has_value());
}

TEST(TcpFramer, FrameSplitAcrossReads) {
  TcpFramer framer;
  TimePoint now{};
  auto frame = ReadResponseFrame(9, 0xBEEF);
  std::span<const uint8_t> bytes(frame);

  framer.Feed(bytes.subspan(0, 4), now);
  EXPECT_FALSE(framer.Next(now).has_value());
  framer.Feed(bytes.subspan(4, 5), now);
  EXPECT_FALSE(framer.Next(now).has_value());
  framer.Feed(bytes.subspan(9), now);

  auto adu = framer.Next(now);
  ASSERT_TRUE(adu.has_value());
  EXPECT_EQ(adu->correlation_key, 9);
  EXPECT_EQ(adu->pdu.data, (std::vector<uint8_t>{0x02, 0xBE, 0xEF}));
}

TEST(TcpFramer, NonZeroProtocolIdDiscarded) {
  TcpFramer framer;
  TimePoint now{};
  std::vector<uint8_t> foreign{0x00, 0x05, 0x00, 0x01, 0x00, 0x03, 0x01, 0x83, 0x02};
  auto good = ReadResponseFrame(6, 0x0042);
  foreign.insert(foreign.end(), good.begin(), good.end());

  framer.Feed(foreign, now);
  auto adu = framer.Next(now);

  ASSERT_TRUE(adu.has_value());
  EXPECT_EQ(adu->correlation_key, 6);
  EXPECT_FALSE(framer.HasStreamError());
}

TEST(TcpFramer, LengthOutOfRangeIsStreamError) {
  TcpFramer framer;
  TimePoint now{};
  std::vector<uint8_t> garbage{0x00, 0x01, 0x00, 0x00, 0x01, 0x00, 0x01, 0x03};

  framer.Feed(garbage, now);

  EXPECT_FALSE(framer.Next(now).has_value());
  EXPECT_TRUE(framer.HasStreamError());

  // Further bytes are ignored until reset
  framer.Feed(ReadResponseFrame(1, 1), now);
  EXPECT_FALSE(framer.Next(now).has_value());

  framer.Reset();
  EXPECT_FALSE(framer.HasStreamError());
  framer.Feed(ReadResponseFrame(1, 1), now);
  EXPECT_TRUE(framer.Next(now).has_value());
}

TEST(TcpFramer, EncodeUsesCorrelationKeyAsTransactionId) {
  TcpFramer framer;

  auto frame = framer.Encode(0x0102, 0x05, Pdu{0x03, {0x00, 0x00, 0x00, 0x01}});

  EXPECT_TRUE(framer.IsCorrelated());
  EXPECT_EQ(framer.EnvelopeSize(), TcpFrame::kMbapHeaderSize);
  EXPECT_EQ(TcpFrame::ExtractTransactionId(frame), 0x0102);
  EXPECT_EQ(frame[6], 0x05);
}
