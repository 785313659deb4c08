#include <netscope/core/config.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace netscope::core {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

const char* non_empty_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return nullptr;
    }
    return value;
}

} // namespace

const char* sink_kind_name(SinkKind kind) {
    switch (kind) {
        case SinkKind::File:        return "file";
        case SinkKind::Console:     return "console";
        case SinkKind::Diagnostics: return "diagnostics";
    }
    return "unknown";
}

CaptureSettings load_settings_from_env() {
    CaptureSettings settings;

    if (const char* dir = non_empty_env(config::kLogDirEnv)) {
        settings.log_directory = dir;
    }

    if (const char* sink = non_empty_env(config::kSinkEnv)) {
        const std::string kind = lowercase(sink);
        if (kind == "file") {
            settings.sink_kind = SinkKind::File;
        } else if (kind == "console") {
            settings.sink_kind = SinkKind::Console;
        } else if (kind == "diagnostics") {
            settings.sink_kind = SinkKind::Diagnostics;
        }
    }

    if (const char* level = non_empty_env(config::kLogLevelEnv)) {
        const std::string name = lowercase(level);
        if (name == "info") {
            settings.min_severity = Severity::Info;
        } else if (name == "warning") {
            settings.min_severity = Severity::Warning;
        } else if (name == "error") {
            settings.min_severity = Severity::Error;
        }
    }

    return settings;
}

} // namespace netscope::core
