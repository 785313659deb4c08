#include <netscope/core/lifecycle.h>

#include <algorithm>

namespace netscope::core {

const char* capture_stage_name(CaptureStage stage) {
    switch (stage) {
        case CaptureStage::Idle:            return "idle";
        case CaptureStage::SessionStarting: return "session-starting";
        case CaptureStage::Capturing:       return "capturing";
        case CaptureStage::Flushing:        return "flushing";
        case CaptureStage::Terminated:      return "terminated";
    }
    return "unknown";
}

void LifecycleTrace::record(CaptureStage stage) {
    StageTimingEntry entry;
    entry.stage = stage;
    entry.entered_at = std::chrono::steady_clock::now();
    entry.elapsed_since_prev_ms = 0.0;

    if (!entries.empty()) {
        const auto delta = entry.entered_at - entries.back().entered_at;
        entry.elapsed_since_prev_ms =
            std::chrono::duration<double, std::milli>(delta).count();
    }

    entries.push_back(entry);
}

void LifecycleTrace::clear() {
    entries.clear();
}

std::vector<CaptureStage> LifecycleTrace::stages() const {
    std::vector<CaptureStage> result;
    result.reserve(entries.size());
    for (const auto& e : entries) {
        result.push_back(e.stage);
    }
    return result;
}

bool LifecycleTrace::visited(CaptureStage stage) const {
    return std::any_of(entries.begin(), entries.end(),
                       [stage](const StageTimingEntry& e) { return e.stage == stage; });
}

} // namespace netscope::core
