#include <netscope/session/session_registry.h>

#include <netscope/core/errors.h>

#include <mutex>

namespace netscope::session {

SessionRegistry& SessionRegistry::instance() {
    static SessionRegistry registry;
    return registry;
}

void SessionRegistry::require_key(const std::string& key, const char* operation) {
    if (key.empty()) {
        throw core::InvalidKeyError(std::string("SessionRegistry::") + operation +
                                    ": key must not be empty");
    }
}

void SessionRegistry::put(const std::string& key, driver::Session* session) {
    require_key(key, "put");
    std::unique_lock lock(mutex_);
    sessions_[key] = session;
}

std::optional<driver::Session*> SessionRegistry::get(const std::string& key) const {
    require_key(key, "get");
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(key);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SessionRegistry::remove(const std::string& key) {
    require_key(key, "remove");
    std::unique_lock lock(mutex_);
    sessions_.erase(key);
}

bool SessionRegistry::contains(const std::string& key) const {
    require_key(key, "contains");
    std::shared_lock lock(mutex_);
    return sessions_.find(key) != sessions_.end();
}

std::size_t SessionRegistry::size() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

std::map<std::string, driver::Session*> SessionRegistry::all_entries() const {
    std::shared_lock lock(mutex_);
    return std::map<std::string, driver::Session*>(sessions_.begin(), sessions_.end());
}

void SessionRegistry::clear_all() {
    std::unique_lock lock(mutex_);
    sessions_.clear();
}

void SessionRegistry::set_current(driver::Session* session) {
    std::unique_lock lock(mutex_);
    current_ = session;
}

driver::Session* SessionRegistry::current() const {
    std::shared_lock lock(mutex_);
    return current_;
}

void SessionRegistry::clear_current() {
    std::unique_lock lock(mutex_);
    current_ = nullptr;
}

bool SessionRegistry::clear_current_if(const driver::Session* session) {
    std::unique_lock lock(mutex_);
    if (current_ == nullptr || current_ != session) {
        return false;
    }
    current_ = nullptr;
    return true;
}

} // namespace netscope::session
