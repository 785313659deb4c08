#pragma once
#include <netscope/capture/event_buffer.h>
#include <netscope/capture/log_sink.h>
#include <netscope/core/diagnostics.h>
#include <netscope/core/lifecycle.h>
#include <netscope/devtools/event_feed.h>
#include <netscope/driver/session.h>
#include <netscope/session/session_registry.h>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace netscope::capture {

// Outcome of the one flush a test execution gets.
struct FlushReport {
    std::string test_name;
    std::size_t event_count = 0;
    std::size_t dropped_count = 0;
    bool sink_ok = false;
    bool teardown_ok = false;
};

// Brackets one test execution at a time:
//
//   before_test()        Idle/Terminated -> SessionStarting -> Capturing
//   after_test()         Capturing -> Flushing -> Terminated
//   on_test_exception()  Capturing -> Flushing -> Terminated, then rethrow
//
// Only the first terminal hook of a run flushes and tears down; later ones
// are ignored. The instance may be reused for the next test once Terminated.
class CaptureLifecycle {
public:
    CaptureLifecycle(session::SessionRegistry& registry,
                     driver::SessionFactory& factory,
                     devtools::EventFeed& feed,
                     LogSink& sink,
                     core::DiagnosticEmitter& diagnostics);

    // Flushes and tears down if a test is still being captured.
    ~CaptureLifecycle();

    // Non-copyable, non-movable
    CaptureLifecycle(const CaptureLifecycle&) = delete;
    CaptureLifecycle& operator=(const CaptureLifecycle&) = delete;

    // Start a session, make it current and subscribe to its network events.
    // Throws core::SessionInitError if any step fails; whatever was started is
    // torn down again first. Throws core::LifecycleStateError if a run is
    // already in progress.
    void before_test(const std::string& test_name);

    // Normal completion, whatever the assertion outcome.
    void after_test();

    // Uncaught failure in the test body. Flushes, then rethrows `error`
    // unchanged.
    [[noreturn]] void on_test_exception(std::exception_ptr error);

    core::CaptureStage stage() const;
    std::string test_name() const;

    // The session of the run in progress; nullptr outside SessionStarting/Capturing.
    driver::Session* session() const { return session_.get(); }

    std::size_t buffered_events() const;
    core::LifecycleTrace trace() const;
    std::optional<FlushReport> last_flush() const;

private:
    void enter(core::CaptureStage stage);
    void start_capture();
    [[noreturn]] void abort_start(const std::string& reason);
    bool begin_flush(const char* hook);
    void flush_and_teardown();
    bool teardown();

    session::SessionRegistry& registry_;
    driver::SessionFactory& factory_;
    devtools::EventFeed& feed_;
    LogSink& sink_;
    core::DiagnosticEmitter& diagnostics_;

    std::unique_ptr<driver::Session> session_;
    std::unique_ptr<driver::DebugChannel> channel_;
    std::shared_ptr<EventBuffer> buffer_;

    mutable std::mutex mutex_;
    core::CaptureStage stage_ = core::CaptureStage::Idle;
    core::LifecycleTrace trace_;
    std::string test_name_;
    std::optional<FlushReport> last_flush_;
    std::uint64_t run_id_ = 0;
};

} // namespace netscope::capture
