#pragma once
#include <netscope/driver/session.h>
#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace netscope::session {

// Process-wide store of live sessions keyed by caller-chosen names, plus a
// single "current" slot that test bodies read. Holds non-owning pointers only;
// the registry never closes a session.
//
// All operations are thread-safe. The keyed map and the current slot share
// one lock.
class SessionRegistry {
public:
    SessionRegistry() = default;

    // Non-copyable, non-movable
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // The shared instance used by tests that do not wire a registry in.
    static SessionRegistry& instance();

    // Insert or overwrite. Throws core::InvalidKeyError on an empty key.
    void put(const std::string& key, driver::Session* session);

    // nullopt when the key is absent. Throws core::InvalidKeyError on an empty key.
    std::optional<driver::Session*> get(const std::string& key) const;

    // Removing an absent key is a no-op. Throws core::InvalidKeyError on an empty key.
    void remove(const std::string& key);

    bool contains(const std::string& key) const;
    std::size_t size() const;

    // Snapshot copy; mutating it does not affect the registry.
    std::map<std::string, driver::Session*> all_entries() const;

    // Empties the keyed map. The current slot is left untouched.
    void clear_all();

    void set_current(driver::Session* session);

    // nullptr when no session is current.
    driver::Session* current() const;

    void clear_current();

    // Clear the slot only if it still holds `session`. Returns true if cleared.
    bool clear_current_if(const driver::Session* session);

private:
    static void require_key(const std::string& key, const char* operation);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, driver::Session*> sessions_;
    driver::Session* current_ = nullptr;
};

} // namespace netscope::session
