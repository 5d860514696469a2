// airbeacon headers
#include "protocol/state_record.h"

// GTest headers
#include <gtest/gtest.h>

namespace airbeacon::test {

  TEST(StateRecordCodecTest, decode_ReadsLittleEndianPortAndPid) {
    std::vector<uint8_t> bytes = { 0x58, 0x1B, 0x39, 0x30, 0x00, 0x00, 'u', 'x', 'p', 'l', 'a', 'y', 0 };

    StateRecord record;
    DecodeError error = DecodeError::TOO_SHORT;
    ASSERT_TRUE(StateRecordCodec::decode(bytes, record, &error));

    EXPECT_EQ(error, DecodeError::NONE);
    EXPECT_EQ(record.port, 7000);
    EXPECT_EQ(record.owner_pid, 12345u);
    EXPECT_EQ(record.owner_executable_path, "uxplay");
  }

  TEST(StateRecordCodecTest, decode_IgnoresBytesAfterFirstNul) {
    std::vector<uint8_t> bytes = { 0x01, 0x00, 0x02, 0x00, 0x00, 0x00, 'a', 'b', 0, 0xFF, 0xFE, 'z' };

    StateRecord record;
    ASSERT_TRUE(StateRecordCodec::decode(bytes, record));
    EXPECT_EQ(record.owner_executable_path, "ab");
  }

  TEST(StateRecordCodecTest, decode_AcceptsUnterminatedPath) {
    std::vector<uint8_t> bytes = { 0x01, 0x00, 0x02, 0x00, 0x00, 0x00, '/', 'b', 'i', 'n', '/', 'x' };

    StateRecord record;
    ASSERT_TRUE(StateRecordCodec::decode(bytes, record));
    EXPECT_EQ(record.owner_executable_path, "/bin/x");
    EXPECT_EQ(record.owner_executable_name(), "x");
  }

  TEST(StateRecordCodecTest, decode_AcceptsEmptyPath) {
    std::vector<uint8_t> bytes = { 0x01, 0x00, 0x02, 0x00, 0x00, 0x00 };

    StateRecord record;
    ASSERT_TRUE(StateRecordCodec::decode(bytes, record));
    EXPECT_TRUE(record.owner_executable_path.empty());
    EXPECT_TRUE(record.owner_executable_name().empty());
  }

  TEST(StateRecordCodecTest, decode_RejectsShortBuffers) {
    StateRecord record;
    DecodeError error = DecodeError::NONE;

    EXPECT_FALSE(StateRecordCodec::decode(std::vector<uint8_t>{}, record, &error));
    EXPECT_EQ(error, DecodeError::TOO_SHORT);

    EXPECT_FALSE(StateRecordCodec::decode(std::vector<uint8_t>{ 0x58, 0x1B, 0x39, 0x30, 0x00 }, record, &error));
    EXPECT_EQ(error, DecodeError::TOO_SHORT);
  }

  TEST(StateRecordCodecTest, decode_RejectsInvalidUtf8) {
    StateRecord record;
    DecodeError error = DecodeError::NONE;

    // lone continuation byte
    std::vector<uint8_t> bytes = { 0x01, 0x00, 0x02, 0x00, 0x00, 0x00, 'a', 0x80, 0 };
    EXPECT_FALSE(StateRecordCodec::decode(bytes, record, &error));
    EXPECT_EQ(error, DecodeError::INVALID_UTF8);

    // truncated two-byte sequence at end of buffer
    bytes = { 0x01, 0x00, 0x02, 0x00, 0x00, 0x00, 'a', 0xC3 };
    EXPECT_FALSE(StateRecordCodec::decode(bytes, record, &error));

    // overlong encoding of '/'
    bytes = { 0x01, 0x00, 0x02, 0x00, 0x00, 0x00, 0xC0, 0xAF };
    EXPECT_FALSE(StateRecordCodec::decode(bytes, record, &error));
  }

  TEST(StateRecordCodecTest, decode_AcceptsMultibyteUtf8) {
    // "/opt/é/airplayd"
    std::vector<uint8_t> bytes = { 0x01, 0x00, 0x02, 0x00, 0x00, 0x00,
                                   '/', 'o', 'p', 't', '/', 0xC3, 0xA9, '/',
                                   'a', 'i', 'r', 'p', 'l', 'a', 'y', 'd', 0 };

    StateRecord record;
    ASSERT_TRUE(StateRecordCodec::decode(bytes, record));
    EXPECT_EQ(record.owner_executable_name(), "airplayd");
  }

  TEST(StateRecordCodecTest, encode_ThenDecodeRestoresRecord) {
    StateRecord original;
    original.port = 65535;
    original.owner_pid = 0xDEADBEEF;
    original.owner_executable_path = "/usr/local/bin/airplayd";

    auto bytes = StateRecordCodec::encode(original);
    ASSERT_EQ(bytes.size(), 6u + original.owner_executable_path.size() + 1);
    EXPECT_EQ(bytes[0], 0xFF);
    EXPECT_EQ(bytes[2], 0xEF);
    EXPECT_EQ(bytes[5], 0xDE);
    EXPECT_EQ(bytes.back(), 0);

    StateRecord decoded;
    ASSERT_TRUE(StateRecordCodec::decode(bytes, decoded));
    EXPECT_EQ(decoded, original);
  }

} // namespace airbeacon::test
