// Tests for the default seed, engine determinism and the bounded truncated normal sampler

#include <dwell/random/rng.hpp>
#include <dwell/random/truncated_normal.hpp>
#include <gtest/gtest.h>
#include <thread>

using namespace dwell;

TEST(Seed, DefaultSeedIsStable) {
    const auto first = random::seed();
    EXPECT_EQ(first, random::seed());

    random::rng_t::result_type other = 0;
    std::thread t([&] { other = random::seed(); });
    t.join();
    EXPECT_EQ(first, other);
}

TEST(Seed, EnginesRepeat) {
    random::rng_t a(97), b(97), c(98);
    bool differs = false;
    for (int i = 0; i < 10; i++) {
        auto x = a();
        EXPECT_EQ(x, b());
        if (x != c()) differs = true;
    }
    EXPECT_TRUE(differs);
}

TEST(TruncatedNormal, WithinBounds) {
    random::rng_t rng(3);
    for (int i = 0; i < 2000; i++) {
        auto x = random::truncnorm_rejection_bounded(rng, 50000.0, 20000.0, 10000.0, 250000.0, 10000);
        ASSERT_TRUE(x);
        EXPECT_GE(*x, 10000.0);
        EXPECT_LE(*x, 250000.0);
    }
}

TEST(TruncatedNormal, NarrowRange) {
    random::rng_t rng(4);
    for (int i = 0; i < 200; i++) {
        auto x = random::truncnorm_rejection_bounded(rng, 0.0, 1.0, 0.5, 0.6, 100000);
        ASSERT_TRUE(x);
        EXPECT_GE(*x, 0.5);
        EXPECT_LE(*x, 0.6);
    }
}

TEST(TruncatedNormal, BudgetExhausted) {
    random::rng_t rng(5);
    EXPECT_FALSE(random::truncnorm_rejection_bounded(rng, 1e6, 10.0, 0.0, 100.0, 500));
    EXPECT_FALSE(random::truncnorm_rejection_bounded(rng, 0.0, 1.0, -1.0, 1.0, 0));
    // Degenerate distribution
    EXPECT_FALSE(random::truncnorm_rejection_bounded(rng, 7.0, 0.0, 1.0, 5.0, 50));
    auto x = random::truncnorm_rejection_bounded(rng, 3.0, 0.0, 1.0, 5.0, 1);
    ASSERT_TRUE(x);
    EXPECT_EQ(3.0, *x);
}

TEST(TruncatedNormal, Reproducible) {
    random::rng_t a(11), b(11);
    for (int i = 0; i < 50; i++)
        EXPECT_EQ(*random::truncnorm_rejection_bounded(a, 10.0, 4.0, 2.0, 30.0, 1000),
                *random::truncnorm_rejection_bounded(b, 10.0, 4.0, 2.0, 30.0, 1000));
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
