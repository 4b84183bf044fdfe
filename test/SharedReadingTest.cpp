#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "SharedReading.h"

TEST(SharedReadingTest, StartsZeroed) {
    SharedReading shared;
    FaderReading reading = shared.snapshot();
    EXPECT_EQ(0u, reading.rawCount);
    EXPECT_EQ(0u, reading.timestamp);
    EXPECT_EQ(0u, reading.sequence);
    EXPECT_EQ(0.0f, reading.output);
}

TEST(SharedReadingTest, SnapshotReturnsLastPublished) {
    SharedReading shared;
    FaderReading first;
    first.rawCount = 100;
    first.sequence = 1;
    shared.publish(first);

    FaderReading second;
    second.rawCount = 200;
    second.output = 0.25f;
    second.timestamp = 1700000000u;
    second.sequence = 2;
    shared.publish(second);

    FaderReading reading = shared.snapshot();
    EXPECT_EQ(200u, reading.rawCount);
    EXPECT_EQ(0.25f, reading.output);
    EXPECT_EQ(1700000000u, reading.timestamp);
    EXPECT_EQ(2u, reading.sequence);
}

TEST(SharedReadingTest, ReadersNeverSeeTornValues) {
    SharedReading shared;
    std::atomic<bool> done(false);

    // Todos os campos derivam da sequência; uma cópia parcial quebraria a relação
    std::thread writer([&shared, &done]() {
        for (uint32_t i = 1; i <= 20000; i++) {
            FaderReading reading;
            reading.sequence = i;
            reading.rawCount = i * 2;
            reading.timestamp = i * 3;
            reading.capturedAtMs = i * 4;
            shared.publish(reading);
        }
        done = true;
    });

    uint32_t lastSequence = 0;
    while (!done) {
        FaderReading reading = shared.snapshot();
        ASSERT_EQ(reading.sequence * 2, reading.rawCount);
        ASSERT_EQ(reading.sequence * 3, reading.timestamp);
        ASSERT_EQ(reading.sequence * 4, reading.capturedAtMs);
        ASSERT_GE(reading.sequence, lastSequence);
        lastSequence = reading.sequence;
    }

    writer.join();
    EXPECT_EQ(20000u, shared.snapshot().sequence);
}
