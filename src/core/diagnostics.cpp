#include <netscope/core/diagnostics.h>

#include <iostream>
#include <sstream>
#include <utility>

namespace netscope::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    if (event.correlation_id != 0) {
        oss << " (cid:" << event.correlation_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

DiagnosticObserver stderr_observer() {
    return [](const DiagnosticEvent& event) {
        std::cerr << format_diagnostic(event) << "\n";
    };
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    if (severity < min_severity()) {
        return;
    }
    publish(severity, module, stage, message);
}

void DiagnosticEmitter::publish(Severity severity, const std::string& module,
                                const std::string& stage, const std::string& message) {
    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    dispatch(std::move(event));
}

void DiagnosticEmitter::dispatch(DiagnosticEvent event) {
    std::vector<DiagnosticObserver> observers;
    {
        std::lock_guard lock(mutex_);
        event.correlation_id = correlation_id_;
        if (retention_limit_ > 0) {
            if (events_.size() >= retention_limit_) {
                events_.pop_front();
                ++evicted_;
            }
            events_.push_back(event);
        } else {
            ++evicted_;
        }
        observers = observers_;
    }

    for (const auto& observer : observers) {
        observer(event);
    }
}

void DiagnosticEmitter::set_correlation_id(std::uint64_t id) {
    std::lock_guard lock(mutex_);
    correlation_id_ = id;
}

std::uint64_t DiagnosticEmitter::correlation_id() const {
    std::lock_guard lock(mutex_);
    return correlation_id_;
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    std::lock_guard lock(mutex_);
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    std::lock_guard lock(mutex_);
    return min_severity_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    std::lock_guard lock(mutex_);
    observers_.push_back(std::move(observer));
}

void DiagnosticEmitter::set_retention_limit(std::size_t limit) {
    std::lock_guard lock(mutex_);
    retention_limit_ = limit;
    while (events_.size() > retention_limit_) {
        events_.pop_front();
        ++evicted_;
    }
}

std::size_t DiagnosticEmitter::retention_limit() const {
    std::lock_guard lock(mutex_);
    return retention_limit_;
}

std::size_t DiagnosticEmitter::evicted() const {
    std::lock_guard lock(mutex_);
    return evicted_;
}

template <typename Pred>
std::vector<DiagnosticEvent> DiagnosticEmitter::select(Pred pred) const {
    std::lock_guard lock(mutex_);
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (pred(e)) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events() const {
    return select([](const DiagnosticEvent&) { return true; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select([severity](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    return select([&module](const DiagnosticEvent& e) { return e.module == module; });
}

void DiagnosticEmitter::clear() {
    std::lock_guard lock(mutex_);
    events_.clear();
    evicted_ = 0;
}

std::size_t DiagnosticEmitter::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

} // namespace netscope::core
