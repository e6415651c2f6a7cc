#pragma once

#include <stdexcept>
#include <string>

namespace page_pilot {

// Category carried into ExecutionResult.error so callers can tell failures apart.
enum class ErrorKind {
    Timeout,        // element / navigation / network idle never settled
    StaleSession,   // page or browser went away underneath us
    Protocol,       // CDP returned an error or malformed reply
    Script,         // page-side evaluation threw
    Compositing,    // long capture produced nothing usable
    Upload,         // blob store rejected the write
    Launch,         // browser could not be started
    PauseTimeout,   // nobody resumed a paused task in time
    Cancelled,      // paused task was cancelled externally
    Internal
};

// --------- Browser-side failures ---------
class BrowserError : public std::runtime_error {
public:
    BrowserError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}
    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class TimeoutError : public BrowserError {
public:
    explicit TimeoutError(const std::string& what) : BrowserError(ErrorKind::Timeout, what) {}
};

class SessionClosedError : public BrowserError {
public:
    explicit SessionClosedError(const std::string& what) : BrowserError(ErrorKind::StaleSession, what) {}
};

class ProtocolError : public BrowserError {
public:
    explicit ProtocolError(const std::string& what) : BrowserError(ErrorKind::Protocol, what) {}
};

class ScriptError : public BrowserError {
public:
    explicit ScriptError(const std::string& what) : BrowserError(ErrorKind::Script, what) {}
};

class LaunchError : public BrowserError {
public:
    explicit LaunchError(const std::string& what) : BrowserError(ErrorKind::Launch, what) {}
};

// --------- Non-browser failures ---------
class CompositingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ImageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class UploadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Timeout:      return "timeout";
        case ErrorKind::StaleSession: return "stale_session";
        case ErrorKind::Protocol:     return "protocol";
        case ErrorKind::Script:       return "script";
        case ErrorKind::Compositing:  return "compositing";
        case ErrorKind::Upload:       return "upload";
        case ErrorKind::Launch:       return "launch";
        case ErrorKind::PauseTimeout: return "pause_timeout";
        case ErrorKind::Cancelled:    return "cancelled";
        case ErrorKind::Internal:     return "internal";
    }
    return "internal";
}

} // namespace page_pilot
