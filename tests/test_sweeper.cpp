#include "test_common.h"


TEST(SweeperTest, SweepsOnScopeExit)
{
    int count = 0;
    {
        const infra::sweeper sweep = [&]() { ++count; };
    }
    EXPECT_EQ(count, 1);
}

TEST(SweeperTest, SuppressedSweeperNeverSweeps)
{
    int count = 0;
    {
        infra::sweeper sweep = [&]() { ++count; };
        EXPECT_TRUE(sweep.is_armed());
        sweep.suppress_sweep();
        EXPECT_FALSE(sweep.is_armed());
    }
    EXPECT_EQ(count, 0);
}

TEST(SweeperTest, ExplicitSweepRunsOnlyOnce)
{
    int count = 0;
    {
        infra::sweeper sweep = [&]() { ++count; };
        sweep.sweep();
        EXPECT_FALSE(sweep.is_armed());
        sweep.sweep();
        EXPECT_EQ(count, 1);
    }
    EXPECT_EQ(count, 1);
}

TEST(SweeperTest, ThrowingCleanupIsContained)
{
    bool reached = false;
    EXPECT_NO_THROW({
        infra::sweeper sweep = [&]() {
            reached = true;
            throw std::runtime_error("loop device busy");
        };
        sweep.sweep();
    });
    EXPECT_TRUE(reached);
}

TEST(SweeperTest, SweepsWhileUnwinding)
{
    int count = 0;
    try {
        const infra::sweeper sweep = [&]() { ++count; };
        throw lacq::provisioning_error("no mount path");
    }
    catch (const lacq::provisioning_error&) {
        EXPECT_EQ(count, 1);
    }
    EXPECT_EQ(count, 1);
}
