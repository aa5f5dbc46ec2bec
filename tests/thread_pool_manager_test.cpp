#include "core/thread_pool_manager.hpp"
#include <gtest/gtest.h>

class ThreadPoolManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
        ThreadPoolManager::shutdown();
    }

    void TearDown() override
    {
        ThreadPoolManager::shutdown();
    }
};

TEST_F(ThreadPoolManagerTest, InitializeSetsLimit)
{
    ThreadPoolManager::initialize(6);
    EXPECT_TRUE(ThreadPoolManager::isInitialized());
    EXPECT_EQ(ThreadPoolManager::getCurrentThreadCount(), 6u);

    // A second initialize keeps the first limit
    ThreadPoolManager::initialize(2);
    EXPECT_EQ(ThreadPoolManager::getCurrentThreadCount(), 6u);
}

TEST_F(ThreadPoolManagerTest, InvalidCountFallsBackToDefault)
{
    ThreadPoolManager::initialize(0);
    EXPECT_EQ(ThreadPoolManager::getCurrentThreadCount(), 4u);
}

TEST_F(ThreadPoolManagerTest, Resize)
{
    ThreadPoolManager::initialize(4);
    EXPECT_TRUE(ThreadPoolManager::resizeThreadPool(8));
    EXPECT_EQ(ThreadPoolManager::getCurrentThreadCount(), 8u);

    EXPECT_FALSE(ThreadPoolManager::resizeThreadPool(ThreadPoolManager::kMaxThreadCount + 1));
    EXPECT_EQ(ThreadPoolManager::getCurrentThreadCount(), 8u);
}

TEST_F(ThreadPoolManagerTest, ShutdownClearsState)
{
    ThreadPoolManager::initialize(3);
    ThreadPoolManager::shutdown();
    EXPECT_FALSE(ThreadPoolManager::isInitialized());
    EXPECT_EQ(ThreadPoolManager::getCurrentThreadCount(), 0u);
}
