#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "PushTarget.h"

namespace {
    const uint32_t ADDRESS_A = 0x3201A8C0;  // 192.168.1.50 no formato de IPAddress
    const uint32_t ADDRESS_B = 0x3301A8C0;
}

TEST(PushTargetTest, UnknownUntilResolved) {
    PushTarget target(5000);
    uint32_t address = 0;

    EXPECT_FALSE(target.get(address));
    EXPECT_TRUE(target.shouldResolve(1, 0));

    EXPECT_TRUE(target.publish(ADDRESS_A, 1));
    ASSERT_TRUE(target.get(address));
    EXPECT_EQ(ADDRESS_A, address);
}

TEST(PushTargetTest, LiteralNeverAsksForDns) {
    PushTarget target(5000);
    target.setLiteral(ADDRESS_A);

    EXPECT_FALSE(target.shouldResolve(1, 0));
    EXPECT_FALSE(target.shouldResolve(7, 100000));

    uint32_t address = 0;
    ASSERT_TRUE(target.get(address));
    EXPECT_EQ(ADDRESS_A, address);
}

TEST(PushTargetTest, ResolvesOncePerLinkGeneration) {
    PushTarget target(5000);
    target.publish(ADDRESS_A, 1);

    EXPECT_FALSE(target.shouldResolve(1, 1000));
    EXPECT_FALSE(target.shouldResolve(1, 900000));

    // Reconexão: novo DNS, mas o endereço antigo segue valendo até lá
    EXPECT_TRUE(target.shouldResolve(2, 1000));
    uint32_t address = 0;
    ASSERT_TRUE(target.get(address));
    EXPECT_EQ(ADDRESS_A, address);

    EXPECT_FALSE(target.publish(ADDRESS_A, 2));
    EXPECT_TRUE(target.publish(ADDRESS_B, 3));
    ASSERT_TRUE(target.get(address));
    EXPECT_EQ(ADDRESS_B, address);
}

TEST(PushTargetTest, FailedLookupWaitsBeforeRetrying) {
    PushTarget target(5000);

    target.recordFailure(1, 10000);
    EXPECT_FALSE(target.shouldResolve(1, 10000));
    EXPECT_FALSE(target.shouldResolve(1, 14999));
    EXPECT_TRUE(target.shouldResolve(1, 15000));

    // Uma nova geração não espera o intervalo
    EXPECT_TRUE(target.shouldResolve(2, 10001));

    uint32_t address = 0;
    EXPECT_FALSE(target.get(address));
}

TEST(PushTargetTest, FailureKeepsPreviousAddress) {
    PushTarget target(5000);
    target.publish(ADDRESS_A, 1);
    target.recordFailure(2, 20000);

    uint32_t address = 0;
    ASSERT_TRUE(target.get(address));
    EXPECT_EQ(ADDRESS_A, address);
    EXPECT_FALSE(target.shouldResolve(2, 21000));
}

TEST(PushTargetTest, ReaderNeverSeesPartialAddress) {
    PushTarget target(5000);
    std::atomic<bool> done(false);

    std::thread resolver([&target, &done]() {
        for (uint32_t generation = 1; generation <= 20000; generation++) {
            target.publish((generation % 2) ? ADDRESS_A : ADDRESS_B, generation);
        }
        done = true;
    });

    uint32_t unexpected = 0;
    while (!done) {
        uint32_t address = 0;
        if (target.get(address) && address != ADDRESS_A && address != ADDRESS_B) {
            unexpected++;
        }
    }
    resolver.join();

    EXPECT_EQ(0u, unexpected);
}
