#include "core/ProgressSink.hpp"
#include "utils/Logger.hpp"
#include <algorithm>

namespace QobuzDL {

int LogProgressSink::addTask(const std::string& description, std::uint64_t total, ProgressUnit unit) {
    std::lock_guard<std::mutex> lock(mutex);
    int id = nextId++;
    tasks[id] = Task{description, total, 0, unit, 0};
    return id;
}

void LogProgressSink::advance(int taskId, std::uint64_t by) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = tasks.find(taskId);
    if (it == tasks.end() || it->second.total == 0) {
        return;
    }
    
    Task& task = it->second;
    task.done += by;
    int quarter = static_cast<int>(std::min<std::uint64_t>(task.done * 4 / task.total, 4));
    if (quarter > task.lastQuarter) {
        task.lastQuarter = quarter;
        if (task.unit == ProgressUnit::Bytes) {
            LOG_DL_INFO("{}: {}% ({:.2f} / {:.2f} MiB)", task.description, quarter * 25,
                        task.done / (1024.0 * 1024.0), task.total / (1024.0 * 1024.0));
        } else {
            LOG_DL_INFO("{}: {}% ({} / {} files)", task.description, quarter * 25,
                        task.done, task.total);
        }
    }
}

void LogProgressSink::finishTask(int taskId) {
    std::lock_guard<std::mutex> lock(mutex);
    tasks.erase(taskId);
}

} // namespace QobuzDL
