#include "label_registry.hpp"
#include "logging.hpp"
#include "result_helper.hpp"

#include <fmt/format.h>

namespace bus {

Result<void> LabelRegistry::add(const std::string& label, std::string_view pattern) {
    if (index_.count(label) > 0) {
        return Error(ResultCode::DuplicateLabel, fmt::format("label already in use ({})", label));
    }

    auto compiled = pattern::Pattern::compile(pattern);
    if (!compiled) LOGW("rejected pattern for label '{}': {}", label, to_string(compiled));
    RETURN_IF_ERR(compiled);

    LabelEntry entry;
    entry.label = label;
    entry.pattern = std::move(compiled.value());
    auto it = entries_.insert(entries_.end(), std::move(entry));
    index_.emplace(label, it);

    LOGD("label '{}' -> '{}' (filter '{}', {} params)", label, it->pattern.source(),
         it->pattern.topic(), it->pattern.parameterCount());
    return OK();
}

Result<void> LabelRegistry::remove(const std::string& label) {
    auto it = index_.find(label);
    if (it == index_.end()) {
        return Error(ResultCode::UnknownLabel, fmt::format("unknown label ({})", label));
    }
    entries_.erase(it->second);
    index_.erase(it);
    return OK();
}

Result<pattern::Pattern> LabelRegistry::lookup(const std::string& label) const {
    auto entry = find(label);
    if (!entry) {
        return Result<pattern::Pattern>::Error(ResultCode::UnknownLabel,
                                               fmt::format("unknown label ({})", label));
    }
    return Result<pattern::Pattern>::OK(entry->pattern);
}

LabelEntry* LabelRegistry::find(const std::string& label) {
    auto it = index_.find(label);
    return (it == index_.end()) ? nullptr : &*it->second;
}

const LabelEntry* LabelRegistry::find(const std::string& label) const {
    auto it = index_.find(label);
    return (it == index_.end()) ? nullptr : &*it->second;
}

std::vector<std::string> LabelRegistry::labels() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.label);
    }
    return out;
}

} // namespace bus
