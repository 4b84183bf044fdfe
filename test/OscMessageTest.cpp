#include <gtest/gtest.h>
#include <string.h>
#include "OscMessage.h"

TEST(OscMessageTest, FaderMessageLayout) {
    uint8_t buffer[64];
    size_t written = OscMessage::encodeFloat("/ch/01/mix/fader", 0.5f, buffer, sizeof(buffer));

    // 16 caracteres + nulo -> 20, ",f" -> 4, float -> 4
    ASSERT_EQ(28u, written);
    EXPECT_EQ(0, memcmp(buffer, "/ch/01/mix/fader", 16));
    for (size_t i = 16; i < 20; i++) {
        EXPECT_EQ(0, buffer[i]) << "padding do endereço em " << i;
    }

    EXPECT_EQ(',', buffer[20]);
    EXPECT_EQ('f', buffer[21]);
    EXPECT_EQ(0, buffer[22]);
    EXPECT_EQ(0, buffer[23]);

    // 0.5f = 0x3F000000 em big-endian
    EXPECT_EQ(0x3F, buffer[24]);
    EXPECT_EQ(0x00, buffer[25]);
    EXPECT_EQ(0x00, buffer[26]);
    EXPECT_EQ(0x00, buffer[27]);
}

TEST(OscMessageTest, FloatIsBigEndian) {
    uint8_t buffer[16];
    ASSERT_EQ(12u, OscMessage::encodeFloat("/a", 1.0f, buffer, sizeof(buffer)));

    // 1.0f = 0x3F800000
    EXPECT_EQ(0x3F, buffer[8]);
    EXPECT_EQ(0x80, buffer[9]);
    EXPECT_EQ(0x00, buffer[10]);
    EXPECT_EQ(0x00, buffer[11]);
}

TEST(OscMessageTest, AddressFillingWholeWordGetsExtraPadding) {
    // "/abc" + nulo ocupa 5 bytes -> 8
    EXPECT_EQ(16u, OscMessage::encodedSize("/abc"));
    EXPECT_EQ(12u, OscMessage::encodedSize("/ab"));
}

TEST(OscMessageTest, RejectsSmallBuffer) {
    uint8_t buffer[27];
    memset(buffer, 0xAA, sizeof(buffer));
    EXPECT_EQ(0u, OscMessage::encodeFloat("/ch/01/mix/fader", 0.5f, buffer, sizeof(buffer)));
    EXPECT_EQ(0xAA, buffer[0]);
}

TEST(OscMessageTest, RejectsInvalidAddress) {
    uint8_t buffer[32];
    EXPECT_EQ(0u, OscMessage::encodedSize("ch/01"));
    EXPECT_EQ(0u, OscMessage::encodedSize(""));
    EXPECT_EQ(0u, OscMessage::encodedSize(nullptr));
    EXPECT_EQ(0u, OscMessage::encodeFloat("ch/01", 0.5f, buffer, sizeof(buffer)));
    EXPECT_EQ(0u, OscMessage::encodeFloat("/a", 0.5f, nullptr, 64));
}
