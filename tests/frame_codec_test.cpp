// labcomm headers
#include "protocols/Command.hpp"
#include "protocols/FrameCodec.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <cstdio>
#include <random>
#include <string>

using namespace labcomm::protocols;
using ::testing::HasSubstr;
using ::testing::ThrowsMessage;

TEST(frame_codec, checksum_is_two_lowercase_hex_digits_of_byte_sum) {
  EXPECT_EQ(checksum(""), "00");
  EXPECT_EQ(checksum("00fa"), "27");
  EXPECT_EQ(checksum("010000"), "21");
  EXPECT_EQ(checksum("ffff"), "98");

  std::mt19937 gen(7);
  std::uniform_int_distribution<int> byte(0, 255);
  std::uniform_int_distribution<int> len(0, 40);
  for (int i = 0; i < 200; ++i) {
    std::string bytes;
    unsigned int sum = 0;
    const int n = len(gen);
    for (int k = 0; k < n; ++k) {
      const int b = byte(gen);
      bytes += static_cast<char>(b);
      sum += static_cast<unsigned int>(b);
    }
    char expected[3];
    std::snprintf(expected, sizeof(expected), "%02x", sum % 256);
    EXPECT_EQ(checksum(bytes), expected);
  }
}

TEST(frame_codec, write_frames_carry_the_six_char_command) {
  const auto frame = encodeFrame("010000", kWriteTerminator);
  EXPECT_EQ(frame, "*01000021\r");
  EXPECT_EQ(frame.size(), 10u);
  EXPECT_EQ(commands::Temperature.toWire(), frame);
}

TEST(frame_codec, set_point_command_is_1c_plus_four_hex_digits) {
  EXPECT_EQ(commands::setPoint(660).code, "1c0294");
  EXPECT_EQ(commands::setPoint(0).code, "1c0000");
  EXPECT_EQ(commands::setPoint(0xFFFF).code, "1cffff");
}

TEST(frame_codec, decodes_signed_big_endian_payload) {
  EXPECT_EQ(decodeFrame("*00fa27^"), 250);
  EXPECT_EQ(decodeFrame("*ffff98^"), -1);
  EXPECT_EQ(decodeFrame("*8000c8^"), -32768);
  EXPECT_EQ(decodeFrame("*7fff" + checksum("7fff") + "^"), 32767);
  EXPECT_EQ(decodeFrame("*00FAe7^"), 250); // device may send upper-case digits
}

TEST(frame_codec, every_valid_payload_decodes) {
  for (unsigned int raw = 0; raw <= 0xFFFF; raw += 257) {
    char payload[5];
    std::snprintf(payload, sizeof(payload), "%04x", raw);
    const auto frame = encodeFrame(payload, kReadTerminator);
    ASSERT_EQ(frame.size(), kFrameSize);
    EXPECT_EQ(decodeFrame(frame), static_cast<std::int16_t>(raw)) << frame;
  }
}

TEST(frame_codec, rejects_bad_length) {
  EXPECT_THROW(decodeFrame(""), MalformedFrame);
  EXPECT_THROW(decodeFrame("*00fa27"), MalformedFrame);
  EXPECT_THAT([] { decodeFrame("*00fa27^^"); },
              ThrowsMessage<MalformedFrame>(HasSubstr("bad length")));
}

TEST(frame_codec, rejects_bad_markers) {
  EXPECT_THAT([] { decodeFrame("#00fa27^"); },
              ThrowsMessage<MalformedFrame>(HasSubstr("start/end marker")));
  EXPECT_THROW(decodeFrame("*00fa27\r"), MalformedFrame);
}

TEST(frame_codec, rejects_bad_checksum_sentinel) {
  EXPECT_THAT([] { decodeFrame(kBadChecksumSentinel); },
              ThrowsMessage<MalformedFrame>(HasSubstr("bad checksum")));
}

TEST(frame_codec, rejects_non_hex_payload) {
  EXPECT_THAT([] { decodeFrame("*00g?27^"); },
              ThrowsMessage<MalformedFrame>(HasSubstr("not provided as hex")));
}

TEST(frame_codec, rejects_checksum_mismatch) {
  EXPECT_THAT([] { decodeFrame("*00fa28^"); },
              ThrowsMessage<MalformedFrame>(HasSubstr("Checksum mismatch")));
}

TEST(frame_codec, decimal_values_are_tenths) {
  EXPECT_DOUBLE_EQ(toDecimal(250), 25.0);
  EXPECT_DOUBLE_EQ(toDecimal(-15), -1.5);
}
