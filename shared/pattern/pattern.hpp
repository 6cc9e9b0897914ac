#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "result.h"
#include "message.hpp"

namespace pattern {

// Pattern syntax: levels separated by '/'.
//   "+name"  single-level parameter (exactly one non-empty level)
//   "#name"  multi-level parameter, last level only (one or more levels)
//   other    literal level
// e.g. "devices/+deviceId/config/#keys"

enum class SegmentType {
    Literal,
    SingleLevel,
    MultiLevel,
};

struct Segment {
    SegmentType type = SegmentType::Literal;
    std::string text;               // literal level or parameter name
};

// Captured levels, one entry per parameter segment in pattern order.
struct MatchResult {
    std::vector<message::ParameterValue> captures;
};

class Pattern {
public:
    Pattern() = default;

    static Result<Pattern> compile(std::string_view source);

    [[nodiscard]] std::optional<MatchResult> match(std::string_view topic) const;
    [[nodiscard]] message::Parameters extractParameters(const MatchResult& match) const;
    [[nodiscard]] Result<std::string> buildTopic(const message::Parameters& params) const;

    [[nodiscard]] std::size_t parameterCount() const noexcept { return parameter_count_; }
    [[nodiscard]] bool hasMultiLevel() const noexcept { return multi_level_; }

    // source text as registered
    [[nodiscard]] const std::string& source() const noexcept { return source_; }
    // subscription filter, parameter names stripped ("devices/+/config/#")
    [[nodiscard]] const std::string& topic() const noexcept { return topic_; }
    [[nodiscard]] const std::vector<Segment>& segments() const noexcept { return segments_; }

private:
    std::string source_;
    std::string topic_;
    std::vector<Segment> segments_;
    std::size_t parameter_count_ = 0;
    std::size_t fixed_levels_ = 0;  // literal + single-level segments
    bool multi_level_ = false;
};

} // namespace pattern
