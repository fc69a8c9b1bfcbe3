#include <gtest/gtest.h>
#include "concurrency/ThreadPool.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>

using namespace ts::concurrency;

namespace {
struct FnTask final : Task {
    std::function<void()> fn;
    explicit FnTask(std::function<void()> f) : fn(std::move(f)) {}
    void operator()() override { fn(); }
};
}

TEST(ThreadPoolTest, RunsSubmittedTasks) {
    ThreadPool pool(2);
    EXPECT_EQ(pool.workerCount(), 2u);

    std::atomic<int> count{0};
    std::promise<void> done;
    for (int i = 0; i < 10; ++i)
        pool.submit(std::make_shared<FnTask>([&] {
            if (++count == 10) done.set_value();
        }));

    ASSERT_EQ(done.get_future().wait_for(std::chrono::seconds(10)), std::future_status::ready);
    EXPECT_EQ(count.load(), 10);
}

TEST(ThreadPoolTest, FailingTaskDoesNotKillWorker) {
    ThreadPool pool(1);
    pool.submit(std::make_shared<FnTask>([] { throw std::runtime_error("boom"); }));

    std::promise<void> done;
    pool.submit(std::make_shared<FnTask>([&] { done.set_value(); }));
    EXPECT_EQ(done.get_future().wait_for(std::chrono::seconds(10)), std::future_status::ready);
}

TEST(ThreadPoolTest, RejectsAfterStop) {
    ThreadPool pool(1);
    pool.stop();
    EXPECT_TRUE(pool.isStopped());
    EXPECT_EQ(pool.workerCount(), 0u);
    EXPECT_THROW(pool.submit(std::make_shared<FnTask>([] {})), std::runtime_error);
    EXPECT_THROW(pool.submit(nullptr), std::invalid_argument);
}
