#pragma once
#include <stdexcept>
#include <string>

namespace netscope::core {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Registry operation called with an empty key.
class InvalidKeyError : public Error {
public:
    using Error::Error;
};

// Session creation, debug channel open or feed subscription failed.
class SessionInitError : public Error {
public:
    using Error::Error;
};

// A log sink could not persist a flush.
class SinkWriteError : public Error {
public:
    using Error::Error;
};

// Lifecycle hook invoked in a stage that does not accept it.
class LifecycleStateError : public Error {
public:
    using Error::Error;
};

} // namespace netscope::core
