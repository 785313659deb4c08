#include <netscope/platform/serial_dispatcher.h>

#include <exception>
#include <stdexcept>

namespace netscope::platform {

SerialDispatcher::SerialDispatcher()
    : worker_([this]() { worker_loop(); }) {}

SerialDispatcher::~SerialDispatcher() {
    shutdown();
}

void SerialDispatcher::post(Task task) {
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            throw std::runtime_error("SerialDispatcher is shut down");
        }
        tasks_.emplace_back(std::move(task));
    }
    cv_.notify_one();
}

void SerialDispatcher::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this]() { return tasks_.empty() && !busy_; });
}

void SerialDispatcher::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            return; // Already shut down
        }
        shutdown_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
}

std::size_t SerialDispatcher::failed_count() const {
    std::lock_guard lock(mutex_);
    return failed_;
}

std::string SerialDispatcher::last_failure() const {
    std::lock_guard lock(mutex_);
    return last_failure_;
}

void SerialDispatcher::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this]() { return shutdown_ || !tasks_.empty(); });

            if (tasks_.empty()) {
                // shutdown_ is true and no more tasks
                idle_cv_.notify_all();
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
            busy_ = true;
        }

        std::string failure;
        bool failed = false;
        try {
            task();
        } catch (const std::exception& e) {
            failed = true;
            failure = e.what();
        } catch (...) {
            failed = true;
            failure = "unknown exception";
        }

        {
            std::lock_guard lock(mutex_);
            busy_ = false;
            if (failed) {
                ++failed_;
                last_failure_ = std::move(failure);
            }
        }
        idle_cv_.notify_all();
    }
}

} // namespace netscope::platform
