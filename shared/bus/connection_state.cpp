#include "connection_state.hpp"
#include "logging.hpp"

namespace bus {

void ConnectionState::transition(Status next, std::optional<StatusError> error) {
    if (!isExpectedTransition(status_, next)) {
        LOGD("unexpected transition {} -> {}", to_string(status_), to_string(next));
    }

    status_ = next;
    if (error) {
        last_error_ = error;
        LOGW("status {} ({})", to_string(next), to_string(*error));
    } else {
        LOGD("status {}", to_string(next));
    }

    if (observer_) {
        observer_(next, error);
    }
}

void ConnectionState::reset() noexcept {
    status_ = Status::Ready;
    last_error_.reset();
}

bool ConnectionState::isExpectedTransition(Status from, Status to) noexcept {
    // ERROR is never terminal and any state may report one
    if (to == Status::Error) return true;

    switch (from) {
    case Status::Ready:
        return to == Status::Connecting;
    case Status::Connecting:
        return to == Status::Connected;
    case Status::Connected:
        return to == Status::Reconnecting || to == Status::Offline || to == Status::Closed;
    case Status::Reconnecting:
        return to == Status::Connected || to == Status::Closed;
    case Status::Offline:
        return to == Status::Reconnecting || to == Status::Closed;
    case Status::Closed:
        return to == Status::Connecting;
    case Status::Error:
        return true;
    }
    return false;
}

} // namespace bus
