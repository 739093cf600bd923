#include <atomic>
#include <chrono>
#include <thread>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "stitchfs/upload/session_lock.h"

using stitchfs::upload::SessionLockTable;

TEST(SessionLockTable, EntryDisappearsWhenGuardReleased) {
    SessionLockTable table;
    {
        auto guard = table.Acquire("abc-1");
        EXPECT_EQ(table.active_count(), 1u);
    }
    EXPECT_EQ(table.active_count(), 0u);
}

TEST(SessionLockTable, DistinctSessionsDoNotBlockEachOther) {
    SessionLockTable table;
    auto first = table.Acquire("one");
    auto second = table.Acquire("two");
    EXPECT_EQ(table.active_count(), 2u);
}

TEST(SessionLockTable, MovedGuardReleasesOnce) {
    SessionLockTable table;
    {
        auto guard = table.Acquire("s");
        SessionLockTable::Guard moved(std::move(guard));
        EXPECT_EQ(table.active_count(), 1u);
    }
    EXPECT_EQ(table.active_count(), 0u);
    // The lock must be free again.
    auto again = table.Acquire("s");
    EXPECT_EQ(table.active_count(), 1u);
}

TEST(SessionLockTable, SerializesHoldersOfSameSession) {
    SessionLockTable table;
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    int counter = 0;

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 200; ++i) {
                auto guard = table.Acquire("shared");
                const int now = inside.fetch_add(1) + 1;
                int seen = max_inside.load();
                while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
                }
                ++counter;
                inside.fetch_sub(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_EQ(counter, 8 * 200);
    EXPECT_EQ(table.active_count(), 0u);
}

TEST(SessionLockTable, WaiterProceedsAfterRelease) {
    SessionLockTable table;
    std::atomic<bool> acquired{false};
    std::thread waiter;
    {
        auto guard = table.Acquire("s");
        waiter = std::thread([&]() {
            auto inner = table.Acquire("s");
            acquired.store(true);
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        EXPECT_FALSE(acquired.load());
    }
    waiter.join();
    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(table.active_count(), 0u);
}
