#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace mcpguard {

/// A single worker thread draining a FIFO of tasks.
///
/// Tasks run strictly in submission order, one at a time. Used for the
/// per-direction processing queues, the fd writers and alert delivery.
class SerialExecutor {
public:
    explicit SerialExecutor(std::string name);
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    /// Queue a task. Returns false once stop() has been called.
    bool post(std::function<void()> task);

    /// Block until every task posted so far has finished.
    void wait_idle();

    /// Finish queued tasks, then join the worker. Idempotent.
    void stop();

    [[nodiscard]] size_t pending() const;
    [[nodiscard]] const std::string& name() const { return name_; }

private:
    void run();

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::queue<std::function<void()>> tasks_;
    bool busy_{false};
    std::atomic<bool> running_{true};
    std::thread worker_;
};

} // namespace mcpguard
