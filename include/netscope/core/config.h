#pragma once
#include <netscope/core/diagnostics.h>
#include <string>

namespace netscope::core::config {

inline constexpr const char kDefaultLogDirectory[] = "logs";
inline constexpr const char kLogFileExtension[] = ".log";
inline constexpr const char kTimestampFormat[] = "%Y-%m-%d_%H-%M-%S";
inline constexpr const char kUnknownTestName[] = "unknown-test";
inline constexpr const char kNoActivityMarker[] = "No network requests were intercepted.";

inline constexpr const char kLogDirEnv[] = "NETSCOPE_LOG_DIR";
inline constexpr const char kSinkEnv[] = "NETSCOPE_SINK";
inline constexpr const char kLogLevelEnv[] = "NETSCOPE_LOG_LEVEL";

} // namespace netscope::core::config

namespace netscope::core {

enum class SinkKind {
    File,
    Console,
    Diagnostics,
};

const char* sink_kind_name(SinkKind kind);

struct CaptureSettings {
    std::string log_directory = config::kDefaultLogDirectory;
    SinkKind sink_kind = SinkKind::File;
    Severity min_severity = Severity::Info;
};

// Defaults overridden by NETSCOPE_LOG_DIR, NETSCOPE_SINK and NETSCOPE_LOG_LEVEL.
// Unrecognised values keep the default.
CaptureSettings load_settings_from_env();

} // namespace netscope::core
