#pragma once
// ═══════════════════════════════════════════════════════════════════
//  sidecar/errors.h — Failure taxonomy of the supervisor
// ═══════════════════════════════════════════════════════════════════
//
//  Everything observed before the first readiness message rejects the
//  future returned by start(); later failures are delivered as
//  std::exception_ptr payloads of the "error" event.
//
// ═══════════════════════════════════════════════════════════════════

#include <boost/system/error_code.hpp>
#include <stdexcept>
#include <string>
#include <cstring>

namespace sidecar {

class SupervisorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Caller bug: start() twice, stop() without a child, unknown event name.
class UsageError : public SupervisorError {
public:
    using SupervisorError::SupervisorError;
};

// The child exited with the invalid-configuration code. Never retried.
class ConfigurationError : public SupervisorError {
public:
    using SupervisorError::SupervisorError;
};

// No readiness message within the startup window.
class TimeoutError : public SupervisorError {
public:
    using SupervisorError::SupervisorError;
};

// Reading or decoding the readiness channel failed.
class ChannelError : public SupervisorError {
public:
    explicit ChannelError(const std::string& what,
                          boost::system::error_code code = {})
        : SupervisorError(code ? what + ": " + code.message() : what)
        , code_(code)
    {}

    const boost::system::error_code& code() const noexcept { return code_; }

private:
    boost::system::error_code code_;
};

// pipe2()/fork() failed, or the binary is not executable.
class SpawnError : public SupervisorError {
public:
    SpawnError(const std::string& what, int err)
        : SupervisorError(err != 0 ? what + ": " + std::strerror(err) : what)
        , errno_(err)
    {}

    int error() const noexcept { return errno_; }

private:
    int errno_;
};

} // namespace sidecar
