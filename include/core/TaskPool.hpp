#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace QobuzDL {

/**
 * Fixed number of worker threads fed from one FIFO queue
 * At most `workers` tasks run at once; the rest wait in the queue.
 * close() stops accepting work and drops everything still queued:
 * futures of dropped tasks report std::future_errc::broken_promise.
 */
class TaskPool {
public:
    explicit TaskPool(std::size_t workers);
    ~TaskPool();
    
    // Prevent copying
    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;
    
    // Throws std::runtime_error once the pool is closed
    std::future<void> submit(std::function<void()> task);
    
    void close();
    bool isClosed() const;
    
    std::size_t getWorkerCount() const { return threads.size(); }
    std::size_t pendingCount() const;
    
private:
    std::vector<std::thread> threads;
    std::deque<std::packaged_task<void()>> queue;
    mutable std::mutex mutex;
    std::condition_variable available;
    bool closed;
    bool stopping;
    
    void workerLoop();
};

} // namespace QobuzDL
