#include "mcpguard/serial_executor.hpp"
#include "mcpguard/log.hpp"

namespace mcpguard {

SerialExecutor::SerialExecutor(std::string name)
    : name_(std::move(name)) {
    worker_ = std::thread([this] { run(); });
}

SerialExecutor::~SerialExecutor() {
    stop();
}

bool SerialExecutor::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return false;
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void SerialExecutor::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return tasks_.empty() && !busy_; });
}

void SerialExecutor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

size_t SerialExecutor::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size() + (busy_ ? 1 : 0);
}

void SerialExecutor::run() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !tasks_.empty() || !running_; });
            if (!running_ && tasks_.empty()) {
                idle_cv_.notify_all();
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            busy_ = true;
        }

        try {
            task();
        } catch (const std::exception& e) {
            log::error(name_ + ": task failed: " + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
            if (tasks_.empty()) idle_cv_.notify_all();
        }
    }
}

} // namespace mcpguard
