#pragma once
#include <netscope/devtools/network_event.h>
#include <netscope/driver/session.h>
#include <functional>

namespace netscope::devtools {

// Push-based source of network notifications for a debug channel. Handlers
// may be invoked from any thread, including concurrently with each other.
class EventFeed {
public:
    using RequestHandler = std::function<void(const RequestEvent&)>;
    using ResponseHandler = std::function<void(const ResponseEvent&)>;

    virtual ~EventFeed() = default;

    // Turn on network event delivery for the channel.
    virtual void enable(driver::DebugChannel& channel) = 0;

    virtual void on_request(driver::DebugChannel& channel, RequestHandler handler) = 0;
    virtual void on_response(driver::DebugChannel& channel, ResponseHandler handler) = 0;
};

} // namespace netscope::devtools
