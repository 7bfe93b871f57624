/**
 * @file EntityLockManagerTest.cpp
 * @brief Тесты блокировок по сущностям и параллельного переноса токенов
 */

#include <gtest/gtest.h>

#include "../mocks/TestEnvironment.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <set>
#include <thread>
#include <vector>

using namespace containers;
using namespace containers::tests;

// ============================================================================
// EntityLockManager
// ============================================================================

TEST(EntityLockManagerTest, Lock_SameEntity_IsMutuallyExclusive)
{
    application::EntityLockManager locks;
    int counter = 0;

    auto worker = [&]() {
        for (int i = 0; i < 10000; ++i) {
            auto guard = locks.lockContainer("CONT00000001");
            ++counter;
        }
    };

    std::thread t1(worker);
    std::thread t2(worker);
    t1.join();
    t2.join();

    EXPECT_EQ(counter, 20000);
}

TEST(EntityLockManagerTest, Lock_OverlappingSets_NoDeadlock)
{
    application::EntityLockManager locks;
    int counter = 0;

    // Порядок перечисления в LockSet не влияет на порядок захвата
    auto worker = [&](const std::string& first, const std::string& second) {
        for (int i = 0; i < 5000; ++i) {
            application::LockSet set;
            set.containers.insert(first);
            set.containers.insert(second);
            set.tokens.insert("TOTP00000001");
            auto guard = locks.lock(set);
            ++counter;
        }
    };

    std::thread t1(worker, "CONT000000AA", "CONT000000BB");
    std::thread t2(worker, "CONT000000BB", "CONT000000AA");
    t1.join();
    t2.join();

    EXPECT_EQ(counter, 10000);
}

TEST(EntityLockManagerTest, Lock_ReentrantInSameThread)
{
    application::EntityLockManager locks;

    auto outer = locks.lockToken("OATH00000001");
    auto inner = locks.lockToken("OATH00000001");

    EXPECT_EQ(locks.size(), 1u);
}

TEST(EntityLockManagerTest, Guard_ReleasesOnDestruction)
{
    application::EntityLockManager locks;
    {
        auto guard = locks.lockTemplate("phones");
    }

    std::atomic<bool> acquired{false};
    std::thread other([&]() {
        auto guard = locks.lockTemplate("phones");
        acquired = true;
    });
    other.join();

    EXPECT_TRUE(acquired);
}

TEST(EntityLockManagerTest, Table_KeepsOnlyHeldEntities)
{
    application::EntityLockManager locks;
    {
        application::LockSet set;
        set.templates.insert("T1");
        set.containers.insert("CONT00000001");
        set.tokens.insert("HOTP00000001");
        set.tokens.insert("HOTP00000002");
        auto guard = locks.lock(set);
        EXPECT_EQ(locks.size(), 4u);

        {
            auto nested = locks.lockContainer("CONT00000001");
            EXPECT_EQ(locks.size(), 4u);
        }
        EXPECT_EQ(locks.size(), 4u);
    }

    EXPECT_EQ(locks.size(), 0u);
}

TEST(EntityLockManagerTest, MovedGuard_ReleasesOnce)
{
    application::EntityLockManager locks;
    auto first = locks.lockContainer("CONT00000001");
    auto second = std::move(first);
    EXPECT_EQ(locks.size(), 1u);

    second = locks.lockContainer("CONT00000002");
    EXPECT_EQ(locks.size(), 1u);

    second = application::EntityLockManager::Guard();
    EXPECT_EQ(locks.size(), 0u);
}

TEST(EntityLockManagerTest, Table_EmptyAfterContention)
{
    application::EntityLockManager locks;
    auto worker = [&](int offset) {
        for (int i = 0; i < 2000; ++i) {
            auto guard = locks.lockContainer("CONT" + std::to_string((i + offset) % 7));
        }
    };

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back(worker, t);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(locks.size(), 0u);
}

TEST(EntityLockManagerTest, ContainerLifecycle_LeavesNoLockEntries)
{
    TestEnvironment env;
    for (int i = 0; i < 200; ++i) {
        auto serial = env.createContainer("generic");
        env.provisionInto(serial, "hotp");
        env.containers->deleteContainer(serial, true, true);
    }

    EXPECT_EQ(env.locks->size(), 0u);
}

TEST(EntityLockManagerTest, FinalizeUnknownSerials_LeavesNoLockEntries)
{
    TestEnvironment env;
    for (int i = 0; i < 500; ++i) {
        EXPECT_THROW(
            env.registration->completeRegistration("BOGUS" + std::to_string(i), "nonce", std::nullopt, {}),
            domain::ContainerError);
    }

    EXPECT_EQ(env.locks->size(), 0u);
}

// ============================================================================
// Параллельный перенос токенов между контейнерами
// ============================================================================

TEST(ConcurrentMoveTest, OppositeDirections_NoDeadlockAndExclusiveBinding)
{
    TestEnvironment env;
    auto left = env.createContainer("generic");
    auto right = env.createContainer("generic");

    std::vector<std::string> leftTokens;
    std::vector<std::string> rightTokens;
    for (int i = 0; i < 5; ++i) {
        leftTokens.push_back(env.provisionInto(left, "hotp"));
        rightTokens.push_back(env.provisionInto(right, "totp"));
    }

    // Каждый поток гоняет свои токены туда и обратно, захватывая оба контейнера
    auto shuttle = [&](const std::vector<std::string>& tokens, const std::string& home, const std::string& away) {
        for (int round = 0; round < 50; ++round) {
            for (const auto& token : tokens) {
                env.containers->addToken(away, token, false);
            }
            for (const auto& token : tokens) {
                env.containers->addToken(home, token, false);
            }
        }
    };

    std::thread t1(shuttle, std::cref(leftTokens), left, right);
    std::thread t2(shuttle, std::cref(rightTokens), right, left);
    t1.join();
    t2.join();

    auto leftSerials = env.containers->getContainer(left).tokenSerials;
    auto rightSerials = env.containers->getContainer(right).tokenSerials;

    EXPECT_EQ(std::set<std::string>(leftSerials.begin(), leftSerials.end()),
              std::set<std::string>(leftTokens.begin(), leftTokens.end()));
    EXPECT_EQ(std::set<std::string>(rightSerials.begin(), rightSerials.end()),
              std::set<std::string>(rightTokens.begin(), rightTokens.end()));

    for (const auto& token : env.tokens->list()) {
        ASSERT_TRUE(token.containerSerial.has_value());
        bool inLeft = std::find(leftSerials.begin(), leftSerials.end(), token.serial) != leftSerials.end();
        bool inRight = std::find(rightSerials.begin(), rightSerials.end(), token.serial) != rightSerials.end();
        EXPECT_NE(inLeft, inRight) << token.serial;
    }
}

TEST(ConcurrentMoveTest, BulkToggleWhileMoving_KeepsEveryTokenBound)
{
    TestEnvironment env;
    auto source = env.createContainer("generic");
    auto target = env.createContainer("generic");

    std::vector<std::string> moving;
    for (int i = 0; i < 4; ++i) {
        moving.push_back(env.provisionInto(source, "hotp"));
    }
    env.provisionInto(target, "spass");

    std::thread mover([&]() {
        for (int round = 0; round < 30; ++round) {
            for (const auto& token : moving) {
                env.containers->addToken(target, token, false);
            }
            for (const auto& token : moving) {
                env.containers->addToken(source, token, false);
            }
        }
    });
    std::thread toggler([&]() {
        for (int round = 0; round < 30; ++round) {
            env.bulk->bulkAction(target, round % 2 == 0 ? "deactivate" : "activate");
        }
    });
    mover.join();
    toggler.join();

    EXPECT_EQ(env.containers->getContainer(source).tokenSerials.size(), 4u);
    EXPECT_EQ(env.containers->getContainer(target).tokenSerials.size(), 1u);
    EXPECT_EQ(env.tokens->list().size(), 5u);
}
