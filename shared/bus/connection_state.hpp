#pragma once

#include <functional>
#include <optional>

#include "result.h"

namespace bus {

enum class Status {
    Ready,
    Connecting,
    Connected,
    Reconnecting,
    Offline,
    Closed,
    Error,
};

constexpr const char* to_string(Status status) {
    switch (status) {
        case Status::Ready:        return "READY";
        case Status::Connecting:   return "CONNECTING";
        case Status::Connected:    return "CONNECTED";
        case Status::Reconnecting: return "RECONNECTING";
        case Status::Offline:      return "OFFLINE";
        case Status::Closed:       return "CLOSED";
        case Status::Error:        return "ERROR";
    }
    return "UNKNOWN";
}

using StatusError = Result<void>;
using StatusCallback = std::function<void(Status, const std::optional<StatusError>&)>;

// Connection lifecycle status plus the last observed error.
// The error survives later non-error transitions and is only cleared by reset().
class ConnectionState {
public:
    static constexpr const char* LOG_TAG = "ConnectionState";

    Status status() const noexcept { return status_; }
    const std::optional<StatusError>& lastError() const noexcept { return last_error_; }

    // Single observer slot, last registration wins. Empty callback clears it.
    void setObserver(StatusCallback fn) { observer_ = std::move(fn); }

    // Observer exceptions propagate to the caller.
    void transition(Status next, std::optional<StatusError> error = std::nullopt);
    void reset() noexcept;

    // READY -> CONNECTING -> {CONNECTED, ERROR}, CONNECTED -> {RECONNECTING, OFFLINE, CLOSED, ERROR}, ...
    static bool isExpectedTransition(Status from, Status to) noexcept;

private:
    Status status_ = Status::Ready;
    std::optional<StatusError> last_error_;
    StatusCallback observer_;
};

} // namespace bus
