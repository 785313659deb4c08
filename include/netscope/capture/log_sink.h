#pragma once
#include <netscope/core/config.h>
#include <netscope/core/diagnostics.h>
#include <chrono>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace netscope::capture {

// Everything one flush hands to a sink.
struct FlushRecord {
    std::string test_name;
    std::chrono::system_clock::time_point finished_at;
    std::vector<std::string> lines;
};

// Destination for flushed network activity. write() throws
// core::SinkWriteError when the record cannot be persisted.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const FlushRecord& record) = 0;
};

// Replace every character outside [A-Za-z0-9._-] with '_'. An empty name
// becomes config::kUnknownTestName.
std::string sanitize_test_name(const std::string& name);

// Local time rendered with config::kTimestampFormat.
std::string format_timestamp(std::chrono::system_clock::time_point when);

// One file per test: <directory>/<test>_<yyyy-MM-dd_HH-mm-ss>.log, opened in
// append mode. The directory is created on first write.
class FileLogSink : public LogSink {
public:
    explicit FileLogSink(std::filesystem::path directory);

    void write(const FlushRecord& record) override;

    std::filesystem::path path_for(const FlushRecord& record) const;
    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path directory_;
};

class ConsoleLogSink : public LogSink {
public:
    ConsoleLogSink();
    explicit ConsoleLogSink(std::ostream& out);

    void write(const FlushRecord& record) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

// Structured-log sink: one Info event per line, module "network", stage set
// to the test name. Lines are published past the emitter's min_severity.
class DiagnosticLogSink : public LogSink {
public:
    explicit DiagnosticLogSink(core::DiagnosticEmitter& emitter);

    void write(const FlushRecord& record) override;

private:
    core::DiagnosticEmitter& emitter_;
};

std::unique_ptr<LogSink> make_log_sink(const core::CaptureSettings& settings,
                                       core::DiagnosticEmitter& diagnostics);

} // namespace netscope::capture
