#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "cbs/foundation/error_code.hpp"
#include "cbs/foundation/worker_pool.hpp"

using namespace cbs::foundation;
using namespace std::chrono_literals;

TEST(WorkerPoolTest, ZeroThreadsClampedToOne) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.workerCount(), 1u);
}

TEST(WorkerPoolTest, ScheduleAndWait) {
    WorkerPool pool(2);
    std::atomic<int> value{0};
    auto id = pool.schedule([&value] { value.store(42); });
    ASSERT_TRUE(id.hasValue());
    ASSERT_TRUE(pool.wait(id.value()).hasValue());
    EXPECT_EQ(value.load(), 42);
}

TEST(WorkerPoolTest, RunBlocksUntilDone) {
    WorkerPool pool(1);
    bool done = false;
    auto result = pool.run([&done] {
        std::this_thread::sleep_for(10ms);
        done = true;
    });
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(done);
}

TEST(WorkerPoolTest, WaitTwiceReportsJobNotFound) {
    WorkerPool pool(1);
    auto id = pool.schedule([] {});
    ASSERT_TRUE(id.hasValue());
    ASSERT_TRUE(pool.wait(id.value()).hasValue());

    auto again = pool.wait(id.value());
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::JobNotFound);
}

TEST(WorkerPoolTest, UnknownJobId) {
    WorkerPool pool(1);
    auto result = pool.wait(9999);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::JobNotFound);
}

TEST(WorkerPoolTest, ThrowingJobBecomesThreadError) {
    WorkerPool pool(1);
    auto result = pool.run([] { throw std::runtime_error("boom"); });
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ThreadError);
    EXPECT_NE(result.error().message().find("boom"), std::string_view::npos);
}

TEST(WorkerPoolTest, ManyJobsAllRun) {
    WorkerPool pool(4);
    std::atomic<int> counter{0};
    std::vector<WorkerPool::JobId> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = pool.schedule([&counter] { counter.fetch_add(1); });
        ASSERT_TRUE(id.hasValue());
        ids.push_back(id.value());
    }
    for (auto id : ids) {
        ASSERT_TRUE(pool.wait(id).hasValue());
    }
    EXPECT_EQ(counter.load(), 100);
}
