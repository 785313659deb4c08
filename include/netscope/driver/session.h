#pragma once
#include <memory>
#include <string>

namespace netscope::driver {

// One live browser-automation session. Opaque to the capture layer.
class Session {
public:
    virtual ~Session() = default;

    virtual const std::string& id() const = 0;
};

// Debugging-protocol channel opened against a session.
class DebugChannel {
public:
    virtual ~DebugChannel() = default;

    virtual const std::string& session_id() const = 0;
    virtual bool is_open() const = 0;
    virtual void close() = 0;
};

// Starts and stops browser sessions. Implementations may signal failure by
// returning nullptr from create_session() or by throwing.
class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    virtual std::unique_ptr<Session> create_session() = 0;
    virtual std::unique_ptr<DebugChannel> open_debug_channel(Session& session) = 0;
    virtual void close_session(Session& session) = 0;
};

} // namespace netscope::driver
