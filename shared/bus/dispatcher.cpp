#include "dispatcher.hpp"
#include "logging.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <memory>
#include <vector>

namespace bus {

Result<ListenerId> Dispatcher::addListener(const std::string& label, Listener fn) {
    return add(label, std::move(fn), false);
}

Result<ListenerId> Dispatcher::addOnceListener(const std::string& label, Listener fn) {
    return add(label, std::move(fn), true);
}

Result<ListenerId> Dispatcher::add(const std::string& label, Listener fn, bool once) {
    auto entry = registry_.find(label);
    if (!entry) {
        return Result<ListenerId>::Error(ResultCode::UnknownLabel, fmt::format("invalid label ({})", label));
    }
    if (!fn) {
        return Result<ListenerId>::Error(ResultCode::InvalidArgument, "listener is empty");
    }

    auto slot = std::make_shared<ListenerSlot>();
    slot->id = next_id_++;
    slot->fn = std::move(fn);
    slot->once = once;
    entry->listeners.push_back(slot);
    return Result<ListenerId>::OK(slot->id);
}

Result<void> Dispatcher::removeListener(const std::string& label, ListenerId id) {
    auto entry = registry_.find(label);
    if (!entry) {
        return Error(ResultCode::UnknownLabel, fmt::format("invalid label ({})", label));
    }
    auto& list = entry->listeners;
    list.erase(std::remove_if(list.begin(), list.end(),
                              [id](const std::shared_ptr<ListenerSlot>& s) { return s->id == id; }),
               list.end());
    return OK();
}

Result<void> Dispatcher::removeAllListeners(const std::string& label) {
    auto entry = registry_.find(label);
    if (!entry) {
        return Error(ResultCode::UnknownLabel, fmt::format("invalid label ({})", label));
    }
    entry->listeners.clear();
    return OK();
}

void Dispatcher::removeAllListeners() {
    for (auto& entry : registry_.entries()) {
        entry.listeners.clear();
    }
}

std::size_t Dispatcher::listenerCount(const std::string& label) const {
    auto entry = registry_.find(label);
    return entry ? entry->listeners.size() : 0;
}

std::optional<std::string> Dispatcher::dispatch(message::Packet packet) {
    for (auto& entry : registry_.entries()) {
        auto match = entry.pattern.match(packet.topic);
        if (!match) continue;

        packet.params = entry.pattern.extractParameters(*match);

        // listeners may add/remove listeners or labels while running
        std::string label = entry.label;
        std::vector<std::shared_ptr<ListenerSlot>> snapshot = entry.listeners;

        for (auto& slot : snapshot) {
            if (slot->once) {
                if (slot->fired) continue;
                slot->fired = true;
                if (auto live = registry_.find(label)) {
                    auto& list = live->listeners;
                    list.erase(std::remove(list.begin(), list.end(), slot), list.end());
                }
            }
            slot->fn(packet);
        }
        return label;
    }

    LOGT("no label matches topic '{}'", packet.topic);
    return std::nullopt;
}

} // namespace bus
