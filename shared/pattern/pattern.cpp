#include "pattern.hpp"
#include "topic_filter.hpp"

#include <fmt/format.h>
#include <unordered_set>

namespace pattern {

namespace {

bool isReservedChar(char ch) {
    return ch == '\0' || ch == SINGLE_LEVEL_CHAR || ch == MULTI_LEVEL_CHAR;
}

bool containsReserved(std::string_view s) {
    for (auto ch : s) {
        if (isReservedChar(ch)) return true;
    }
    return false;
}

// A value substituted into one topic level.
bool isValidLevelValue(std::string_view v) {
    if (v.empty()) return false;
    for (auto ch : v) {
        if (isReservedChar(ch) || ch == LEVEL_SEPARATOR) return false;
    }
    return true;
}

Result<Pattern> invalid(std::string_view source, const std::string& why) {
    return Result<Pattern>::Error(ResultCode::InvalidPattern,
                                  fmt::format("invalid pattern '{}': {}", source, why));
}

} // namespace

Result<Pattern> Pattern::compile(std::string_view source) {
    if (source.empty()) {
        return invalid(source, "pattern is empty");
    }
    if (source.size() > MAX_TOPIC_LENGTH) {
        return invalid(source.substr(0, 32), "pattern exceeds maximum topic length");
    }

    Pattern p;
    p.source_ = std::string(source);

    auto levels = splitLevels(source);
    std::unordered_set<std::string_view> names;
    std::string topic;
    topic.reserve(source.size());

    for (std::size_t i = 0; i < levels.size(); ++i) {
        auto level = levels[i];
        Segment seg;

        if (!level.empty() && (level[0] == SINGLE_LEVEL_CHAR || level[0] == MULTI_LEVEL_CHAR)) {
            auto name = level.substr(1);
            if (name.empty()) {
                return invalid(source, fmt::format("parameter at level {} has no name", i));
            }
            if (containsReserved(name)) {
                return invalid(source, fmt::format("parameter name '{}' contains a reserved character", name));
            }
            if (!names.insert(name).second) {
                return invalid(source, fmt::format("duplicate parameter name '{}'", name));
            }

            if (level[0] == MULTI_LEVEL_CHAR) {
                if (i != levels.size() - 1) {
                    return invalid(source, fmt::format("multi-level parameter '{}' must be the last level", name));
                }
                seg.type = SegmentType::MultiLevel;
                p.multi_level_ = true;
            } else {
                seg.type = SegmentType::SingleLevel;
                ++p.fixed_levels_;
            }
            seg.text = std::string(name);
            ++p.parameter_count_;
            topic.push_back(level[0]);
        } else {
            if (containsReserved(level)) {
                return invalid(source, fmt::format("literal level '{}' contains a wildcard character", level));
            }
            seg.type = SegmentType::Literal;
            seg.text = std::string(level);
            ++p.fixed_levels_;
            topic.append(level);
        }

        if (i + 1 < levels.size()) topic.push_back(LEVEL_SEPARATOR);
        p.segments_.push_back(std::move(seg));
    }

    p.topic_ = std::move(topic);
    return Result<Pattern>::OK(std::move(p));
}

std::optional<MatchResult> Pattern::match(std::string_view topic) const {
    if (segments_.empty()) return std::nullopt;

    auto levels = splitLevels(topic);
    if (multi_level_) {
        if (levels.size() < fixed_levels_ + 1) return std::nullopt;
    } else if (levels.size() != fixed_levels_) {
        return std::nullopt;
    }

    MatchResult result;
    result.captures.reserve(parameter_count_);

    for (std::size_t i = 0; i < segments_.size(); ++i) {
        const auto& seg = segments_[i];
        switch (seg.type) {
        case SegmentType::Literal:
            if (levels[i] != seg.text) return std::nullopt;
            break;
        case SegmentType::SingleLevel:
            if (levels[i].empty()) return std::nullopt;
            result.captures.emplace_back(std::string(levels[i]));
            break;
        case SegmentType::MultiLevel: {
            std::vector<std::string> rest;
            rest.reserve(levels.size() - i);
            // empty levels are kept, the broker delivered them under this filter
            for (std::size_t j = i; j < levels.size(); ++j) rest.emplace_back(levels[j]);
            result.captures.emplace_back(std::move(rest));
            break;
        }
        }
    }
    return result;
}

message::Parameters Pattern::extractParameters(const MatchResult& match) const {
    message::Parameters params;
    std::size_t k = 0;
    for (const auto& seg : segments_) {
        if (seg.type == SegmentType::Literal) continue;
        if (k >= match.captures.size()) break;
        params.emplace(seg.text, match.captures[k++]);
    }
    return params;
}

Result<std::string> Pattern::buildTopic(const message::Parameters& params) const {
    if (params.size() != parameter_count_) {
        return Result<std::string>::Error(ResultCode::ParameterCountMismatch,
            fmt::format("wrong parameter count, got {}, expected {}", params.size(), parameter_count_));
    }

    std::string topic;
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        const auto& seg = segments_[i];
        if (i > 0) topic.push_back(LEVEL_SEPARATOR);

        if (seg.type == SegmentType::Literal) {
            topic.append(seg.text);
            continue;
        }

        auto it = params.find(seg.text);
        if (it == params.end()) {
            return Result<std::string>::Error(ResultCode::MissingParameter,
                fmt::format("missing parameter '{}'", seg.text));
        }

        if (seg.type == SegmentType::SingleLevel) {
            auto value = message::asLevel(it->second);
            if (!value || !isValidLevelValue(*value)) {
                return Result<std::string>::Error(ResultCode::InvalidParameter,
                    fmt::format("parameter '{}' must be a single non-empty topic level", seg.text));
            }
            topic.append(*value);
        } else {
            auto values = message::asLevels(it->second);
            if (!values || values->empty()) {
                return Result<std::string>::Error(ResultCode::InvalidParameter,
                    fmt::format("parameter '{}' must be a sequence of one or more topic levels", seg.text));
            }
            for (std::size_t j = 0; j < values->size(); ++j) {
                if (!isValidLevelValue((*values)[j])) {
                    return Result<std::string>::Error(ResultCode::InvalidParameter,
                        fmt::format("parameter '{}' has an invalid level at index {}", seg.text, j));
                }
                if (j > 0) topic.push_back(LEVEL_SEPARATOR);
                topic.append((*values)[j]);
            }
        }
    }

    if (topic.size() > MAX_TOPIC_LENGTH) {
        return Result<std::string>::Error(ResultCode::InvalidParameter, "built topic exceeds maximum topic length");
    }
    return Result<std::string>::OK(std::move(topic));
}

} // namespace pattern
