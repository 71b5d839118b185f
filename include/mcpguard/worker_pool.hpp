#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace mcpguard {

/// Fixed set of worker threads sharing one FIFO.
///
/// Tasks start in submission order but run concurrently, so one slow task
/// only occupies its own worker.
class WorkerPool {
public:
    WorkerPool(std::string name, size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task. Returns false once stop() has been called.
    bool post(std::function<void()> task);

    /// Finish queued tasks, then join every worker. Idempotent.
    void stop();

    [[nodiscard]] size_t size() const { return workers_.size(); }

private:
    void run();

    std::string name_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> tasks_;
    std::atomic<bool> running_{true};
    std::vector<std::thread> workers_;
};

} // namespace mcpguard
