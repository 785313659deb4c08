#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace netscope::platform {

// One worker thread running posted tasks strictly in posting order. Stands
// in for a browser's I/O thread pushing notifications.
class SerialDispatcher {
public:
    using Task = std::function<void()>;

    SerialDispatcher();
    ~SerialDispatcher();

    // Non-copyable, non-movable
    SerialDispatcher(const SerialDispatcher&) = delete;
    SerialDispatcher& operator=(const SerialDispatcher&) = delete;

    // Throws std::runtime_error after shutdown().
    void post(Task task);

    // Block until every task posted so far has run.
    void wait_idle();

    // Runs the remaining tasks, then joins the worker.
    void shutdown();

    // Tasks that exited with an exception; the worker keeps going.
    std::size_t failed_count() const;
    std::string last_failure() const;

private:
    void worker_loop();

    std::deque<Task> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    bool shutdown_ = false;
    bool busy_ = false;
    std::size_t failed_ = 0;
    std::string last_failure_;
    std::jthread worker_;
};

} // namespace netscope::platform
