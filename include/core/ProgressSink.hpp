#pragma once

#include <string>
#include <cstdint>
#include <map>
#include <mutex>

namespace QobuzDL {

enum class ProgressUnit {
    Bytes,
    Files
};

/**
 * Receives progress of a content item
 * advance() is called from worker threads in completion order
 */
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    
    virtual int addTask(const std::string& description, std::uint64_t total, ProgressUnit unit) = 0;
    virtual void advance(int taskId, std::uint64_t by) = 0;
    virtual void finishTask(int taskId) = 0;
};

/**
 * Discards all progress
 */
class NullProgressSink : public ProgressSink {
public:
    int addTask(const std::string&, std::uint64_t, ProgressUnit) override { return 0; }
    void advance(int, std::uint64_t) override {}
    void finishTask(int) override {}
};

/**
 * Logs a line every time a task crosses another quarter of its total
 */
class LogProgressSink : public ProgressSink {
public:
    int addTask(const std::string& description, std::uint64_t total, ProgressUnit unit) override;
    void advance(int taskId, std::uint64_t by) override;
    void finishTask(int taskId) override;
    
private:
    struct Task {
        std::string description;
        std::uint64_t total;
        std::uint64_t done;
        ProgressUnit unit;
        int lastQuarter;
    };
    
    std::map<int, Task> tasks;
    int nextId = 1;
    std::mutex mutex;
};

} // namespace QobuzDL
