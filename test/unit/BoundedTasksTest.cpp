#include "fixpoint/core/BoundedTasks.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace fixpoint;

TEST(BoundedTasksTest, ResultsComeBackInInputOrder) {
    std::vector<std::string> files{"a.py", "b.py", "c.py", "d.py"};
    auto futures = runBounded(files, 2, [](const std::string &f) { return f + "!"; });
    ASSERT_EQ(futures.size(), 4u);
    for (size_t i = 0; i < files.size(); ++i)
        EXPECT_EQ(futures[i].get(), files[i] + "!");
}

TEST(BoundedTasksTest, NeverExceedsTheWorkerLimit) {
    std::vector<int> items(8, 0);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    auto futures = runBounded(items, 3, [&](int) {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --running;
        return 0;
    });
    for (auto &f : futures)
        f.get();
    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
}

TEST(BoundedTasksTest, ThrowingTaskReleasesItsSlot) {
    // With a single slot, a leaked permit would stall every later task.
    std::vector<std::string> files{"a.py", "boom.py", "c.py", "d.py"};
    auto futures = runBounded(files, 1, [](const std::string &f) {
        if (f == "boom.py")
            throw std::runtime_error("cannot process " + f);
        return f.size();
    });

    EXPECT_EQ(futures[0].get(), 4u);
    EXPECT_THROW(futures[1].get(), std::runtime_error);
    EXPECT_EQ(futures[2].get(), 4u);
    EXPECT_EQ(futures[3].get(), 4u);
}
