#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace netscope::core {

enum class CaptureStage {
    Idle,
    SessionStarting,
    Capturing,
    Flushing,
    Terminated,
};

const char* capture_stage_name(CaptureStage stage);

struct StageTimingEntry {
    CaptureStage stage;
    std::chrono::steady_clock::time_point entered_at;
    double elapsed_since_prev_ms = 0.0;
};

struct LifecycleTrace {
    std::vector<StageTimingEntry> entries;

    void record(CaptureStage stage);
    void clear();

    // Stage sequence only, timings ignored.
    std::vector<CaptureStage> stages() const;
    bool visited(CaptureStage stage) const;
};

} // namespace netscope::core
