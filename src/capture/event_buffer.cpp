#include <netscope/capture/event_buffer.h>

#include <utility>

namespace netscope::capture {

bool EventBuffer::append(devtools::NetworkEvent event) {
    std::lock_guard lock(mutex_);
    if (drained_) {
        ++dropped_;
        return false;
    }
    events_.push_back(std::move(event));
    return true;
}

std::vector<devtools::NetworkEvent> EventBuffer::drain() {
    std::lock_guard lock(mutex_);
    drained_ = true;
    std::vector<devtools::NetworkEvent> out;
    out.swap(events_);
    return out;
}

std::size_t EventBuffer::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

std::size_t EventBuffer::dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
}

} // namespace netscope::capture
