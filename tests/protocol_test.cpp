// ANOD-Prod headers
#include "protocols/Command.hpp"
#include "protocols/ModbusRtu.hpp"
#include "protocols/Response.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace anod::test {

  using protocols::Command;
  using protocols::FunctionCode;
  using protocols::Response;
  using Bytes = std::vector<std::uint8_t>;

  namespace {
    Bytes sealed(Bytes frame) {
      const std::uint16_t crc = protocols::crc16(frame);
      frame.push_back(static_cast<std::uint8_t>(crc & 0xFF));
      frame.push_back(static_cast<std::uint8_t>(crc >> 8));
      return frame;
    }
  } // namespace

  TEST(ModbusRtu, crc16_matches_reference_frames) {
    EXPECT_EQ(0x0A84, protocols::crc16(Bytes{ 0x01, 0x03, 0x00, 0x00, 0x00, 0x01 }));
    EXPECT_EQ(0xCDC5, protocols::crc16(Bytes{ 0x01, 0x03, 0x00, 0x00, 0x00, 0x0A }));
    EXPECT_EQ(0xFFFF, protocols::crc16(Bytes{}));
  }

  TEST(ModbusRtu, crc_check_detects_corruption) {
    Bytes frame{ 0x01, 0x03, 0x00, 0x00, 0x00, 0x0A, 0xC5, 0xCD };
    EXPECT_TRUE(protocols::hasValidCrc(frame));
    frame[3] ^= 0x01;
    EXPECT_FALSE(protocols::hasValidCrc(frame));
    EXPECT_FALSE(protocols::hasValidCrc(Bytes{ 0xC5, 0xCD }));
  }

  TEST(ModbusRtu, frame_length_from_header) {
    EXPECT_EQ(9u, protocols::expectedFrameLength(Bytes{ 0x01, 0x03, 0x04 }).value());
    EXPECT_EQ(8u, protocols::expectedFrameLength(Bytes{ 0x01, 0x06, 0x00 }).value());
    EXPECT_EQ(8u, protocols::expectedFrameLength(Bytes{ 0x01, 0x10, 0x00 }).value());
    EXPECT_EQ(5u, protocols::expectedFrameLength(Bytes{ 0x01, 0x83, 0x02 }).value());
    EXPECT_FALSE(protocols::expectedFrameLength(Bytes{ 0x01, 0x07, 0x00 }));
    EXPECT_FALSE(protocols::expectedFrameLength(Bytes{ 0x01, 0x03 }));
  }

  TEST(Command, read_holding_wire_format) {
    const auto wire = Command::readHolding(1, 0x0000, 10).toWire();
    EXPECT_EQ((Bytes{ 0x01, 0x03, 0x00, 0x00, 0x00, 0x0A, 0xC5, 0xCD }), wire);
  }

  TEST(Command, single_value_uses_write_single_register) {
    const auto cmd = Command::write(1, 0x0030, { 500 });
    EXPECT_EQ(FunctionCode::WriteSingleRegister, cmd.function);
    const auto wire = cmd.toWire();
    ASSERT_EQ(8u, wire.size());
    EXPECT_EQ((Bytes{ 0x01, 0x06, 0x00, 0x30, 0x01, 0xF4 }), Bytes(wire.begin(), wire.begin() + 6));
    EXPECT_TRUE(protocols::hasValidCrc(wire));
  }

  TEST(Command, several_values_use_write_multiple_registers) {
    const auto cmd = Command::write(2, 0x0022, { 0x0001, 0x86A0 });
    EXPECT_EQ(FunctionCode::WriteMultipleRegisters, cmd.function);
    const auto wire = cmd.toWire();
    ASSERT_EQ(13u, wire.size());
    EXPECT_EQ((Bytes{ 0x02, 0x10, 0x00, 0x22, 0x00, 0x02, 0x04, 0x00, 0x01, 0x86, 0xA0 }),
              Bytes(wire.begin(), wire.begin() + 11));
    EXPECT_TRUE(protocols::hasValidCrc(wire));
  }

  TEST(Command, rejects_counts_the_protocol_cannot_frame) {
    EXPECT_THROW(Command::readHolding(1, 0, 0), std::invalid_argument);
    EXPECT_THROW(Command::readHolding(1, 0, protocols::kMaxReadCount + 1), std::invalid_argument);
    EXPECT_THROW(Command::write(1, 0, {}), std::invalid_argument);
    EXPECT_THROW(Command::write(1, 0, std::vector<std::uint16_t>(protocols::kMaxWriteCount + 1, 0)),
                 std::invalid_argument);
  }

  TEST(Response, decodes_read_reply) {
    const auto frame = sealed({ 0x01, 0x03, 0x04, 0x00, 0x0A, 0x01, 0xF4 });
    const auto reply = Response::fromWire(frame);
    ASSERT_TRUE(reply);
    EXPECT_EQ((std::vector<std::uint16_t>{ 10, 500 }), reply->registers);
    EXPECT_FALSE(reply->exceptionCode);

    EXPECT_TRUE(reply->answers(Command::readHolding(1, 0x0010, 2)));
    EXPECT_FALSE(reply->answers(Command::readHolding(1, 0x0010, 3)));
    EXPECT_FALSE(reply->answers(Command::readHolding(2, 0x0010, 2)));
    EXPECT_FALSE(reply->answers(Command::write(1, 0x0010, { 10 })));
  }

  TEST(Response, decodes_write_echo) {
    const auto single = Response::fromWire(sealed({ 0x01, 0x06, 0x00, 0x30, 0x01, 0xF4 }));
    ASSERT_TRUE(single);
    EXPECT_TRUE(single->answers(Command::write(1, 0x0030, { 500 })));
    EXPECT_FALSE(single->answers(Command::write(1, 0x0030, { 501 })));

    const auto multi = Response::fromWire(sealed({ 0x01, 0x10, 0x00, 0x22, 0x00, 0x02 }));
    ASSERT_TRUE(multi);
    EXPECT_TRUE(multi->answers(Command::write(1, 0x0022, { 1, 2 })));
    EXPECT_FALSE(multi->answers(Command::write(1, 0x0020, { 1, 2 })));
  }

  TEST(Response, decodes_exception_reply) {
    const auto reply = Response::fromWire(sealed({ 0x01, 0x83, 0x02 }));
    ASSERT_TRUE(reply);
    ASSERT_TRUE(reply->exceptionCode);
    EXPECT_EQ(0x02, *reply->exceptionCode);
    EXPECT_TRUE(reply->answers(Command::readHolding(1, 0x0099, 1)));
  }

  TEST(Response, rejects_truncated_or_odd_frames) {
    EXPECT_FALSE(Response::fromWire(Bytes{ 0x01, 0x03, 0x04, 0x00 }));
    EXPECT_FALSE(Response::fromWire(sealed({ 0x01, 0x03, 0x03, 0x00, 0x0A, 0x01 })));
  }

} // namespace anod::test
