#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace netscope::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Observer that prints every event to std::cerr.
DiagnosticObserver stderr_observer();

// Events retained for queries by default. Observers see every event
// regardless of retention.
constexpr std::size_t kDefaultDiagnosticRetention = 4096;

// Thread-safe: feed callbacks and hook callers may emit concurrently.
// Observers run outside the emitter lock, in emission order per thread.
class DiagnosticEmitter {
public:
    // Dropped when below min_severity().
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    // Never filtered by min_severity(). For output a caller selected
    // explicitly, such as captured network lines.
    void publish(Severity severity, const std::string& module,
                 const std::string& stage, const std::string& message);

    void set_correlation_id(std::uint64_t id);
    std::uint64_t correlation_id() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    // Oldest events are evicted beyond the limit; 0 keeps none.
    void set_retention_limit(std::size_t limit);
    std::size_t retention_limit() const;
    std::size_t evicted() const;

    std::vector<DiagnosticEvent> events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;

    void clear();
    std::size_t size() const;

private:
    void dispatch(DiagnosticEvent event);

    template <typename Pred>
    std::vector<DiagnosticEvent> select(Pred pred) const;

    mutable std::mutex mutex_;
    std::deque<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
    std::size_t retention_limit_ = kDefaultDiagnosticRetention;
    std::size_t evicted_ = 0;
};

} // namespace netscope::core
