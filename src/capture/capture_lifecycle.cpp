#include <netscope/capture/capture_lifecycle.h>

#include <netscope/core/config.h>
#include <netscope/core/errors.h>

#include <chrono>
#include <iostream>
#include <utility>

namespace netscope::capture {

namespace {

constexpr const char kModule[] = "capture";

} // namespace

CaptureLifecycle::CaptureLifecycle(session::SessionRegistry& registry,
                                   driver::SessionFactory& factory,
                                   devtools::EventFeed& feed,
                                   LogSink& sink,
                                   core::DiagnosticEmitter& diagnostics)
    : registry_(registry),
      factory_(factory),
      feed_(feed),
      sink_(sink),
      diagnostics_(diagnostics) {}

CaptureLifecycle::~CaptureLifecycle() {
    try {
        if (stage() == core::CaptureStage::Capturing && begin_flush("destructor")) {
            flush_and_teardown();
        }
    } catch (const std::exception& e) {
        std::cerr << "netscope: capture teardown failed in destructor: " << e.what() << "\n";
    } catch (...) {
        std::cerr << "netscope: capture teardown failed in destructor: unknown exception\n";
    }
}

void CaptureLifecycle::enter(core::CaptureStage stage) {
    std::string name;
    {
        std::lock_guard lock(mutex_);
        stage_ = stage;
        trace_.record(stage);
        name = test_name_;
    }
    diagnostics_.emit(core::Severity::Info, kModule, core::capture_stage_name(stage), name);
}

void CaptureLifecycle::before_test(const std::string& test_name) {
    {
        std::lock_guard lock(mutex_);
        if (stage_ != core::CaptureStage::Idle && stage_ != core::CaptureStage::Terminated) {
            throw core::LifecycleStateError(std::string("before_test called while ") +
                                            core::capture_stage_name(stage_));
        }
        test_name_ = test_name.empty() ? core::config::kUnknownTestName : test_name;
        trace_.clear();
        last_flush_.reset();
        ++run_id_;
    }
    diagnostics_.set_correlation_id(run_id_);
    enter(core::CaptureStage::SessionStarting);

    try {
        session_ = factory_.create_session();
    } catch (const std::exception& e) {
        abort_start(std::string("session creation failed: ") + e.what());
    } catch (...) {
        abort_start("session creation failed: unknown exception");
    }
    if (!session_) {
        abort_start("session factory returned no session");
    }

    start_capture();
}

void CaptureLifecycle::start_capture() {
    registry_.set_current(session_.get());

    try {
        channel_ = factory_.open_debug_channel(*session_);
    } catch (const std::exception& e) {
        abort_start(std::string("debug channel open failed: ") + e.what());
    } catch (...) {
        abort_start("debug channel open failed: unknown exception");
    }
    if (!channel_) {
        abort_start("session " + session_->id() + " returned no debug channel");
    }

    // Listeners hold the buffer by value so a late callback never outlives it.
    buffer_ = std::make_shared<EventBuffer>();
    auto buffer = buffer_;
    try {
        feed_.enable(*channel_);
        feed_.on_request(*channel_, [buffer](const devtools::RequestEvent& request) {
            buffer->append(request);
        });
        feed_.on_response(*channel_, [buffer](const devtools::ResponseEvent& response) {
            buffer->append(response);
        });
    } catch (const std::exception& e) {
        abort_start(std::string("network event subscription failed: ") + e.what());
    } catch (...) {
        abort_start("network event subscription failed: unknown exception");
    }

    enter(core::CaptureStage::Capturing);
}

void CaptureLifecycle::abort_start(const std::string& reason) {
    diagnostics_.emit(core::Severity::Error, kModule,
                      core::capture_stage_name(core::CaptureStage::SessionStarting), reason);
    teardown();
    buffer_.reset();
    enter(core::CaptureStage::Terminated);
    throw core::SessionInitError(reason);
}

bool CaptureLifecycle::begin_flush(const char* hook) {
    core::CaptureStage current;
    {
        std::lock_guard lock(mutex_);
        current = stage_;
        if (current == core::CaptureStage::Capturing) {
            stage_ = core::CaptureStage::Flushing;
            trace_.record(stage_);
        }
    }
    if (current != core::CaptureStage::Capturing) {
        // Idle is the normal state before the first run; nothing to report.
        if (current != core::CaptureStage::Idle) {
            diagnostics_.emit(core::Severity::Warning, kModule, core::capture_stage_name(current),
                              std::string(hook) + " ignored: no capture in progress");
        }
        return false;
    }
    diagnostics_.emit(core::Severity::Info, kModule,
                      core::capture_stage_name(core::CaptureStage::Flushing), hook);
    return true;
}

void CaptureLifecycle::after_test() {
    if (begin_flush("after_test")) {
        flush_and_teardown();
    }
}

void CaptureLifecycle::on_test_exception(std::exception_ptr error) {
    if (begin_flush("on_test_exception")) {
        flush_and_teardown();
    }
    if (!error) {
        throw core::LifecycleStateError("on_test_exception called without an exception");
    }
    std::rethrow_exception(error);
}

void CaptureLifecycle::flush_and_teardown() {
    FlushReport report;
    report.test_name = test_name();

    auto events = buffer_->drain();
    report.event_count = events.size();

    FlushRecord record;
    record.test_name = report.test_name;
    record.finished_at = std::chrono::system_clock::now();
    if (events.empty()) {
        record.lines.emplace_back(core::config::kNoActivityMarker);
    } else {
        record.lines.reserve(events.size());
        for (const auto& event : events) {
            record.lines.push_back(devtools::format_network_event(event));
        }
    }

    try {
        sink_.write(record);
        report.sink_ok = true;
    } catch (const std::exception& e) {
        diagnostics_.emit(core::Severity::Error, kModule,
                          core::capture_stage_name(core::CaptureStage::Flushing),
                          std::string("failed to write network logs: ") + e.what());
    } catch (...) {
        diagnostics_.emit(core::Severity::Error, kModule,
                          core::capture_stage_name(core::CaptureStage::Flushing),
                          "failed to write network logs: unknown exception");
    }

    report.teardown_ok = teardown();

    report.dropped_count = buffer_->dropped();
    if (report.dropped_count > 0) {
        diagnostics_.emit(core::Severity::Warning, kModule,
                          core::capture_stage_name(core::CaptureStage::Flushing),
                          std::to_string(report.dropped_count) +
                              " network events arrived after flush and were dropped");
    }
    buffer_.reset();

    {
        std::lock_guard lock(mutex_);
        last_flush_ = report;
    }
    enter(core::CaptureStage::Terminated);
}

bool CaptureLifecycle::teardown() {
    bool ok = true;
    const char* stage = core::capture_stage_name(this->stage());

    if (channel_) {
        try {
            channel_->close();
        } catch (const std::exception& e) {
            ok = false;
            diagnostics_.emit(core::Severity::Error, kModule, stage,
                              std::string("debug channel close failed: ") + e.what());
        } catch (...) {
            ok = false;
            diagnostics_.emit(core::Severity::Error, kModule, stage,
                              "debug channel close failed: unknown exception");
        }
        channel_.reset();
    }

    if (session_) {
        // Drop the slot first so no test body can pick up a closing session.
        registry_.clear_current_if(session_.get());
        try {
            factory_.close_session(*session_);
        } catch (const std::exception& e) {
            ok = false;
            diagnostics_.emit(core::Severity::Error, kModule, stage,
                              "session " + session_->id() + " close failed: " + e.what());
        } catch (...) {
            ok = false;
            diagnostics_.emit(core::Severity::Error, kModule, stage,
                              "session " + session_->id() + " close failed: unknown exception");
        }
        session_.reset();
    }

    return ok;
}

core::CaptureStage CaptureLifecycle::stage() const {
    std::lock_guard lock(mutex_);
    return stage_;
}

std::string CaptureLifecycle::test_name() const {
    std::lock_guard lock(mutex_);
    return test_name_;
}

std::size_t CaptureLifecycle::buffered_events() const {
    return buffer_ ? buffer_->size() : 0;
}

core::LifecycleTrace CaptureLifecycle::trace() const {
    std::lock_guard lock(mutex_);
    return trace_;
}

std::optional<FlushReport> CaptureLifecycle::last_flush() const {
    std::lock_guard lock(mutex_);
    return last_flush_;
}

} // namespace netscope::capture
