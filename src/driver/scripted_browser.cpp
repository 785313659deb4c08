#include <netscope/driver/scripted_browser.h>

#include <stdexcept>
#include <utility>
#include <variant>

namespace netscope::driver {

class ScriptedSession : public Session {
public:
    explicit ScriptedSession(std::string id) : id_(std::move(id)) {}

    const std::string& id() const override { return id_; }

private:
    std::string id_;
};

class ScriptedChannel : public DebugChannel {
public:
    ScriptedChannel(ScriptedBrowser& browser, std::uint64_t id, std::string session_id)
        : browser_(browser), id_(id), session_id_(std::move(session_id)) {}

    ~ScriptedChannel() override {
        if (open_) {
            browser_.close_channel(id_);
        }
    }

    const std::string& session_id() const override { return session_id_; }
    bool is_open() const override { return open_; }

    void close() override {
        if (!open_) return;
        open_ = false;
        browser_.close_channel(id_);
    }

    std::uint64_t id() const { return id_; }

private:
    ScriptedBrowser& browser_;
    std::uint64_t id_;
    std::string session_id_;
    bool open_ = true;
};

ScriptedBrowser::ScriptedBrowser() = default;

ScriptedBrowser::~ScriptedBrowser() {
    dispatcher_.shutdown();
}

std::unique_ptr<Session> ScriptedBrowser::create_session() {
    std::lock_guard lock(mutex_);
    if (failures_.throw_on_create) {
        throw std::runtime_error("browser failed to start");
    }
    if (failures_.null_session) {
        return nullptr;
    }
    std::string id = "scripted-" + std::to_string(++next_session_);
    open_sessions_.insert(id);
    ++created_;
    last_session_id_ = id;
    return std::make_unique<ScriptedSession>(std::move(id));
}

std::unique_ptr<DebugChannel> ScriptedBrowser::open_debug_channel(Session& session) {
    std::lock_guard lock(mutex_);
    if (failures_.throw_on_channel) {
        throw std::runtime_error("devtools endpoint unavailable");
    }
    if (failures_.null_channel) {
        return nullptr;
    }
    if (open_sessions_.count(session.id()) == 0) {
        throw std::runtime_error("session " + session.id() + " is not open");
    }
    const std::uint64_t id = ++next_channel_;
    ChannelState state;
    state.session_id = session.id();
    channels_.emplace(id, std::move(state));
    return std::make_unique<ScriptedChannel>(*this, id, session.id());
}

void ScriptedBrowser::close_session(Session& session) {
    std::lock_guard lock(mutex_);
    ++close_calls_[session.id()];
    if (failures_.throw_on_close) {
        throw std::runtime_error("browser did not quit cleanly");
    }
    if (open_sessions_.erase(session.id()) > 0) {
        ++closed_;
    }
    for (auto& [id, state] : channels_) {
        if (state.session_id == session.id()) {
            state.open = false;
            state.request_handlers.clear();
            state.response_handlers.clear();
        }
    }
}

ScriptedBrowser::ChannelState& ScriptedBrowser::channel_state(DebugChannel& channel) {
    auto* scripted = dynamic_cast<ScriptedChannel*>(&channel);
    if (scripted == nullptr) {
        throw std::invalid_argument("channel was not opened by this browser");
    }
    auto it = channels_.find(scripted->id());
    if (it == channels_.end() || !it->second.open) {
        throw std::runtime_error("debug channel is closed");
    }
    return it->second;
}

void ScriptedBrowser::enable(DebugChannel& channel) {
    std::lock_guard lock(mutex_);
    if (failures_.throw_on_enable) {
        throw std::runtime_error("Network.enable rejected");
    }
    channel_state(channel).enabled = true;
}

void ScriptedBrowser::on_request(DebugChannel& channel, RequestHandler handler) {
    std::lock_guard lock(mutex_);
    if (failures_.throw_on_subscribe) {
        throw std::runtime_error("listener registration rejected");
    }
    channel_state(channel).request_handlers.push_back(std::move(handler));
}

void ScriptedBrowser::on_response(DebugChannel& channel, ResponseHandler handler) {
    std::lock_guard lock(mutex_);
    if (failures_.throw_on_subscribe) {
        throw std::runtime_error("listener registration rejected");
    }
    channel_state(channel).response_handlers.push_back(std::move(handler));
}

void ScriptedBrowser::close_channel(std::uint64_t channel_id) {
    std::lock_guard lock(mutex_);
    channels_.erase(channel_id);
}

std::size_t ScriptedBrowser::emit(const std::string& session_id,
                                  const devtools::NetworkEvent& event) {
    std::vector<RequestHandler> request_handlers;
    std::vector<ResponseHandler> response_handlers;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, state] : channels_) {
            if (state.session_id != session_id || !state.open || !state.enabled) {
                continue;
            }
            request_handlers.insert(request_handlers.end(),
                                    state.request_handlers.begin(), state.request_handlers.end());
            response_handlers.insert(response_handlers.end(),
                                     state.response_handlers.begin(), state.response_handlers.end());
        }
    }

    // Handlers run unlocked so they may call back into the browser.
    std::size_t delivered = 0;
    if (const auto* request = std::get_if<devtools::RequestEvent>(&event)) {
        for (const auto& handler : request_handlers) {
            handler(*request);
            ++delivered;
        }
    } else if (const auto* response = std::get_if<devtools::ResponseEvent>(&event)) {
        for (const auto& handler : response_handlers) {
            handler(*response);
            ++delivered;
        }
    }
    return delivered;
}

void ScriptedBrowser::post(const std::string& session_id, devtools::NetworkEvent event) {
    dispatcher_.post([this, session_id, event = std::move(event)]() {
        emit(session_id, event);
    });
}

void ScriptedBrowser::wait_idle() {
    dispatcher_.wait_idle();
}

std::size_t ScriptedBrowser::delivery_failures() const {
    return dispatcher_.failed_count();
}

std::string ScriptedBrowser::last_delivery_failure() const {
    return dispatcher_.last_failure();
}

void ScriptedBrowser::set_failures(const FailurePlan& plan) {
    std::lock_guard lock(mutex_);
    failures_ = plan;
}

std::size_t ScriptedBrowser::sessions_created() const {
    std::lock_guard lock(mutex_);
    return created_;
}

std::size_t ScriptedBrowser::sessions_closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

std::size_t ScriptedBrowser::close_calls(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    auto it = close_calls_.find(session_id);
    return it == close_calls_.end() ? 0 : it->second;
}

bool ScriptedBrowser::is_session_open(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    return open_sessions_.count(session_id) > 0;
}

std::string ScriptedBrowser::last_session_id() const {
    std::lock_guard lock(mutex_);
    return last_session_id_;
}

} // namespace netscope::driver
