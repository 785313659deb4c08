#pragma once
#include <netscope/devtools/network_event.h>
#include <cstddef>
#include <mutex>
#include <vector>

namespace netscope::capture {

// Append-only record of the network events seen during one test. Appends are
// safe from any thread. drain() hands back everything in arrival order and
// seals the buffer: later appends are dropped and counted.
class EventBuffer {
public:
    // Returns false if the buffer was already drained.
    bool append(devtools::NetworkEvent event);

    // Take all events. A second call returns an empty vector.
    std::vector<devtools::NetworkEvent> drain();

    std::size_t size() const;
    std::size_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::vector<devtools::NetworkEvent> events_;
    std::size_t dropped_ = 0;
    bool drained_ = false;
};

} // namespace netscope::capture
