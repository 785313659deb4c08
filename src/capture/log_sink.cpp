#include <netscope/capture/log_sink.h>

#include <netscope/core/errors.h>

#include <cctype>
#include <ctime>
#include <fstream>
#include <iostream>
#include <system_error>

namespace netscope::capture {

std::string sanitize_test_name(const std::string& name) {
    if (name.empty()) {
        return core::config::kUnknownTestName;
    }
    std::string out = name;
    for (auto& c : out) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) == 0 && c != '.' && c != '_' && c != '-') {
            c = '_';
        }
    }
    return out;
}

std::string format_timestamp(std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);

    char buf[64];
    const std::size_t n = std::strftime(buf, sizeof(buf), core::config::kTimestampFormat, &local);
    return std::string(buf, n);
}

// ---------------------------------------------------------------------------
// FileLogSink
// ---------------------------------------------------------------------------

FileLogSink::FileLogSink(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path FileLogSink::path_for(const FlushRecord& record) const {
    return directory_ / (sanitize_test_name(record.test_name) + "_" +
                         format_timestamp(record.finished_at) +
                         core::config::kLogFileExtension);
}

void FileLogSink::write(const FlushRecord& record) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw core::SinkWriteError("failed to create log directory " +
                                   directory_.string() + ": " + ec.message());
    }

    const auto path = path_for(record);
    std::ofstream file(path, std::ios::out | std::ios::app);
    if (!file.is_open()) {
        throw core::SinkWriteError("failed to open log file " + path.string());
    }
    for (const auto& line : record.lines) {
        file << line << '\n';
    }
    file.flush();
    if (!file) {
        throw core::SinkWriteError("failed to write log file " + path.string());
    }
}

// ---------------------------------------------------------------------------
// ConsoleLogSink
// ---------------------------------------------------------------------------

ConsoleLogSink::ConsoleLogSink() : out_(std::cout) {}

ConsoleLogSink::ConsoleLogSink(std::ostream& out) : out_(out) {}

void ConsoleLogSink::write(const FlushRecord& record) {
    std::lock_guard lock(mutex_);
    for (const auto& line : record.lines) {
        out_ << line << '\n';
    }
    out_.flush();
    if (!out_) {
        out_.clear();
        throw core::SinkWriteError("failed to write network log to console");
    }
}

// ---------------------------------------------------------------------------
// DiagnosticLogSink
// ---------------------------------------------------------------------------

DiagnosticLogSink::DiagnosticLogSink(core::DiagnosticEmitter& emitter)
    : emitter_(emitter) {}

void DiagnosticLogSink::write(const FlushRecord& record) {
    for (const auto& line : record.lines) {
        emitter_.publish(core::Severity::Info, "network", record.test_name, line);
    }
}

std::unique_ptr<LogSink> make_log_sink(const core::CaptureSettings& settings,
                                       core::DiagnosticEmitter& diagnostics) {
    switch (settings.sink_kind) {
        case core::SinkKind::File:
            return std::make_unique<FileLogSink>(settings.log_directory);
        case core::SinkKind::Console:
            return std::make_unique<ConsoleLogSink>();
        case core::SinkKind::Diagnostics:
            return std::make_unique<DiagnosticLogSink>(diagnostics);
    }
    return std::make_unique<FileLogSink>(settings.log_directory);
}

} // namespace netscope::capture
