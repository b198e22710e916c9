#include "core/TaskPool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace QobuzDL;

TEST(TaskPoolTest, RunsEveryTask) {
    TaskPool pool(3);
    std::atomic<int> counter{0};
    
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.submit([&counter]() { counter++; }));
    }
    for (auto& future : futures) {
        future.get();
    }
    
    EXPECT_EQ(counter.load(), 20);
    EXPECT_EQ(pool.getWorkerCount(), 3u);
}

TEST(TaskPoolTest, NeverExceedsWorkerCount) {
    TaskPool pool(2);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.submit([&running, &peak]() {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            --running;
        }));
    }
    for (auto& future : futures) {
        future.get();
    }
    
    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
}

TEST(TaskPoolTest, ExceptionsStayInTheirFuture) {
    TaskPool pool(2);
    auto failing = pool.submit([]() { throw std::runtime_error("boom"); });
    auto fine = pool.submit([]() {});
    
    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_NO_THROW(fine.get());
}

TEST(TaskPoolTest, CloseDropsQueuedTasks) {
    TaskPool pool(1);
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::promise<void> started;
    std::atomic<int> ran{0};
    
    auto blocker = pool.submit([opened, &started, &ran]() {
        started.set_value();
        opened.wait();
        ran++;
    });
    started.get_future().wait();
    
    std::vector<std::future<void>> queued;
    for (int i = 0; i < 3; ++i) {
        queued.push_back(pool.submit([&ran]() { ran++; }));
    }
    
    pool.close();
    EXPECT_TRUE(pool.isClosed());
    EXPECT_EQ(pool.pendingCount(), 0u);
    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);
    
    gate.set_value();
    blocker.get();
    
    for (auto& future : queued) {
        try {
            future.get();
            FAIL() << "queued task should have been dropped";
        } catch (const std::future_error& e) {
            EXPECT_EQ(e.code(), std::future_errc::broken_promise);
        }
    }
    EXPECT_EQ(ran.load(), 1);
}
