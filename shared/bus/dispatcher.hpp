#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "result.h"
#include "message.hpp"
#include "label_registry.hpp"

namespace bus {

// Routes an inbound packet to the listeners of the first registered label
// whose pattern matches the topic. Unmatched packets are dropped.
class Dispatcher {
public:
    static constexpr const char* LOG_TAG = "Dispatcher";

    explicit Dispatcher(LabelRegistry& registry) : registry_(registry) {}

    Result<ListenerId> addListener(const std::string& label, Listener fn);
    Result<ListenerId> addOnceListener(const std::string& label, Listener fn);
    Result<void> removeListener(const std::string& label, ListenerId id);
    Result<void> removeAllListeners(const std::string& label);
    void removeAllListeners();

    std::size_t listenerCount(const std::string& label) const;

    // Returns the label that handled the packet.
    std::optional<std::string> dispatch(message::Packet packet);

private:
    Result<ListenerId> add(const std::string& label, Listener fn, bool once);

    LabelRegistry& registry_;
    ListenerId next_id_ = 1;
};

} // namespace bus
