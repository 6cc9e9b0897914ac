#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "result.h"
#include "message.hpp"
#include "pattern.hpp"

namespace bus {

using ListenerId = uint64_t;
using Listener = std::function<void(const message::Packet&)>;

struct ListenerSlot {
    ListenerId id = 0;
    Listener fn;
    bool once = false;
    bool fired = false;
};

struct LabelEntry {
    std::string label;
    pattern::Pattern pattern;
    std::vector<std::shared_ptr<ListenerSlot>> listeners;   // registration order
    bool subscribed = false;
};

// Label -> compiled pattern, kept in registration order.
// Registration order is the dispatch precedence.
class LabelRegistry {
public:
    static constexpr const char* LOG_TAG = "LabelRegistry";

    LabelRegistry() = default;
    LabelRegistry(const LabelRegistry&) = delete;
    LabelRegistry& operator=(const LabelRegistry&) = delete;

    Result<void> add(const std::string& label, std::string_view pattern);
    Result<void> remove(const std::string& label);
    Result<pattern::Pattern> lookup(const std::string& label) const;

    LabelEntry* find(const std::string& label);
    const LabelEntry* find(const std::string& label) const;

    bool contains(const std::string& label) const { return index_.count(label) > 0; }
    std::size_t size() const noexcept { return entries_.size(); }
    std::vector<std::string> labels() const;

    std::list<LabelEntry>& entries() noexcept { return entries_; }
    const std::list<LabelEntry>& entries() const noexcept { return entries_; }

private:
    std::list<LabelEntry> entries_;
    std::unordered_map<std::string, std::list<LabelEntry>::iterator> index_;
};

} // namespace bus
