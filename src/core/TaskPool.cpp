#include "core/TaskPool.hpp"
#include <stdexcept>

namespace QobuzDL {

TaskPool::TaskPool(std::size_t workers)
    : closed(false)
    , stopping(false) {
    if (workers == 0) {
        workers = 1;
    }
    threads.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        threads.emplace_back(&TaskPool::workerLoop, this);
    }
}

TaskPool::~TaskPool() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = true;
    }
    available.notify_all();
    
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

std::future<void> TaskPool::submit(std::function<void()> task) {
    std::packaged_task<void()> packaged(std::move(task));
    std::future<void> future = packaged.get_future();
    
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed || stopping) {
            throw std::runtime_error("task pool is closed");
        }
        queue.push_back(std::move(packaged));
    }
    available.notify_one();
    
    return future;
}

void TaskPool::close() {
    std::deque<std::packaged_task<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
        dropped.swap(queue);
    }
    // Destroying unrun packaged tasks breaks their promises
    dropped.clear();
    available.notify_all();
}

bool TaskPool::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return closed;
}

std::size_t TaskPool::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return queue.size();
}

void TaskPool::workerLoop() {
    while (true) {
        std::packaged_task<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex);
            available.wait(lock, [this] { return stopping || !queue.empty(); });
            
            if (queue.empty()) {
                return;
            }
            task = std::move(queue.front());
            queue.pop_front();
        }
        
        // Exceptions are captured in the task's future
        task();
    }
}

} // namespace QobuzDL
