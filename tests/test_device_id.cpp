#include <gtest/gtest.h>
#include "device_id.hpp"
#include "errors.hpp"

using namespace devroute;

TEST(DeviceIdTest, ParseAndFormat) {
    DeviceId id = parse_device_id("0102030405AbCdEf");
    DeviceId expected{0x01, 0x02, 0x03, 0x04, 0x05, 0xab, 0xcd, 0xef};
    EXPECT_EQ(id, expected);
    EXPECT_EQ(to_hex(id), "0102030405abcdef");
}

TEST(DeviceIdTest, RejectsMalformedText) {
    EXPECT_THROW(parse_device_id(""), Failure);
    EXPECT_THROW(parse_device_id("0102030405abcd"), Failure);
    EXPECT_THROW(parse_device_id("0102030405abcdefab"), Failure);
    EXPECT_THROW(parse_device_id("010203040506070g"), Failure);
}

TEST(DeviceIdTest, KeyIsRawBytes) {
    DeviceId id{0x00, 0xff, 0, 0, 0, 0, 0, 0x10};
    std::string key = device_key(id);
    ASSERT_EQ(key.size(), 8u);
    EXPECT_EQ(static_cast<unsigned char>(key[0]), 0x00);
    EXPECT_EQ(static_cast<unsigned char>(key[1]), 0xff);
    EXPECT_EQ(encode_hex(key), "00ff000000000010");
}
