#include <cstdint>
#include <vector>
#include <gtest/gtest.h>
#include "async_modbus/pdu/pdu.hpp"
#include "async_modbus/tcp/tcp_frame.hpp"

using asyncmb::Pdu;
using asyncmb::TcpFrame;

TEST(TcpFrame, EncodeReadHoldingRegisters) {
  Pdu pdu{0x03, {0x00, 0x6B, 0x00, 0x03}};

  auto frame = TcpFrame::Encode(0x0001, 0x11, pdu);

  EXPECT_EQ(frame, (std::vector<uint8_t>{0x00, 0x01, 0x00, 0x00, 0x00, 0x06, 0x11, 0x03, 0x00, 0x6B, 0x00, 0x03}));
}

TEST(TcpFrame, EncodeTransactionIdBigEndian) {
  auto frame = TcpFrame::Encode(0xABCD, 0x01, Pdu{0x07, {}});

  ASSERT_EQ(frame.size(), 8U);
  EXPECT_EQ(frame[0], 0xAB);
  EXPECT_EQ(frame[1], 0xCD);
  EXPECT_EQ(TcpFrame::ExtractTransactionId(frame), 0xABCD);
  EXPECT_EQ(TcpFrame::ExtractLength(frame), 2);
  EXPECT_EQ(TcpFrame::FrameSize(frame), 8U);
}

TEST(TcpFrame, DecodeResponse) {
  std::vector<uint8_t> frame{0x12, 0x34, 0x00, 0x00, 0x00, 0x09, 0x11, 0x03, 0x06, 0x02, 0x2B, 0x00, 0x00, 0x00, 0x64};

  auto adu = TcpFrame::Decode(frame);

  ASSERT_TRUE(adu.has_value());
  EXPECT_EQ(adu->transaction_id, 0x1234);
  EXPECT_EQ(adu->unit_id, 0x11);
  EXPECT_EQ(adu->pdu.function_code, 0x03);
  EXPECT_EQ(adu->pdu.data, (std::vector<uint8_t>{0x06, 0x02, 0x2B, 0x00, 0x00, 0x00, 0x64}));
}

TEST(TcpFrame, DecodeRejectsNonZeroProtocolId) {
  std::vector<uint8_t> frame{0x00, 0x01, 0x00, 0x01, 0x00, 0x03, 0x11, 0x83, 0x02};

  EXPECT_FALSE(TcpFrame::Decode(frame).has_value());
}

TEST(TcpFrame, DecodeRejectsLengthMismatch) {
  std::vector<uint8_t> too_short{0x00, 0x01, 0x00, 0x00, 0x00, 0x06, 0x11, 0x03, 0x00};
  std::vector<uint8_t> too_long{0x00, 0x01, 0x00, 0x00, 0x00, 0x03, 0x11, 0x83, 0x02, 0xFF};

  EXPECT_FALSE(TcpFrame::Decode(too_short).has_value());
  EXPECT_FALSE(TcpFrame::Decode(too_long).has_value());
}

TEST(TcpFrame, DecodeRejectsLengthOutOfRange) {
  std::vector<uint8_t> length_one{0x00, 0x01, 0x00, 0x00, 0x00, 0x01, 0x11};

  EXPECT_FALSE(TcpFrame::Decode(length_one).has_value());
}

TEST(TcpFrame, HeaderAccessorsOnShortInput) {
  std::vector<uint8_t> partial{0x00, 0x01, 0x00};

  EXPECT_EQ(TcpFrame::ExtractProtocolId(partial), 0);
  EXPECT_EQ(TcpFrame::ExtractLength(partial), 0);
  EXPECT_EQ(TcpFrame::FrameSize(partial), 0U);
}
