#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace pattern {

inline constexpr char LEVEL_SEPARATOR   = '/';
inline constexpr char SINGLE_LEVEL_CHAR = '+';
inline constexpr char MULTI_LEVEL_CHAR  = '#';
inline constexpr std::size_t MAX_TOPIC_LENGTH = 65535;

// Splits on '/'. Empty levels are kept ("a//b" -> 3 levels, "/a" -> 2).
std::vector<std::string_view> splitLevels(std::string_view topic);

// Topic name used for PUBLISH: non-empty, no wildcard, no NUL.
bool isValidTopicName(std::string_view name) noexcept;

// Topic filter used for SUBSCRIBE: '+' occupies a whole level, '#' only as the last level.
bool isValidTopicFilter(std::string_view filter) noexcept;

// MQTT filter matching. '#' also matches the parent level ("a/#" matches "a").
// Filters starting with a wildcard never match "$"-topics.
bool topicMatches(std::string_view filter, std::string_view name);

bool hasWildcards(std::string_view filter) noexcept;

// Levels before the first wildcard, with trailing separator ("a/b/+/c" -> "a/b/").
std::string literalPrefix(std::string_view filter);

} // namespace pattern
