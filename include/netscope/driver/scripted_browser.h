#pragma once
#include <netscope/devtools/event_feed.h>
#include <netscope/driver/session.h>
#include <netscope/platform/serial_dispatcher.h>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace netscope::driver {

// Failure injection for ScriptedBrowser.
struct FailurePlan {
    bool null_session = false;
    bool throw_on_create = false;
    bool null_channel = false;
    bool throw_on_channel = false;
    bool throw_on_enable = false;
    bool throw_on_subscribe = false;
    bool throw_on_close = false;
};

// In-process browser: a SessionFactory and an EventFeed in one object, with
// network notifications injected by the caller instead of a real page load.
// Channels and sessions it hands out must not outlive it.
class ScriptedBrowser : public SessionFactory, public devtools::EventFeed {
public:
    ScriptedBrowser();
    ~ScriptedBrowser() override;

    // SessionFactory
    std::unique_ptr<Session> create_session() override;
    std::unique_ptr<DebugChannel> open_debug_channel(Session& session) override;
    void close_session(Session& session) override;

    // EventFeed
    void enable(DebugChannel& channel) override;
    void on_request(DebugChannel& channel, RequestHandler handler) override;
    void on_response(DebugChannel& channel, ResponseHandler handler) override;

    // Deliver on the calling thread to every open, enabled channel of the
    // session. Returns the number of handlers invoked.
    std::size_t emit(const std::string& session_id, const devtools::NetworkEvent& event);

    // Deliver on the browser's dispatch thread, in posting order.
    void post(const std::string& session_id, devtools::NetworkEvent event);

    // Wait until every posted event has been delivered.
    void wait_idle();

    // Posted deliveries whose handler threw. Later events are still delivered.
    std::size_t delivery_failures() const;
    std::string last_delivery_failure() const;

    void set_failures(const FailurePlan& plan);

    std::size_t sessions_created() const;
    std::size_t sessions_closed() const;
    std::size_t close_calls(const std::string& session_id) const;
    bool is_session_open(const std::string& session_id) const;
    std::string last_session_id() const;

private:
    struct ChannelState {
        std::string session_id;
        bool open = true;
        bool enabled = false;
        std::vector<RequestHandler> request_handlers;
        std::vector<ResponseHandler> response_handlers;
    };

    friend class ScriptedChannel;
    void close_channel(std::uint64_t channel_id);
    ChannelState& channel_state(DebugChannel& channel);

    mutable std::mutex mutex_;
    FailurePlan failures_;
    std::uint64_t next_session_ = 0;
    std::uint64_t next_channel_ = 0;
    std::set<std::string> open_sessions_;
    std::map<std::string, std::size_t> close_calls_;
    std::map<std::uint64_t, ChannelState> channels_;
    std::size_t created_ = 0;
    std::size_t closed_ = 0;
    std::string last_session_id_;
    platform::SerialDispatcher dispatcher_;
};

} // namespace netscope::driver
