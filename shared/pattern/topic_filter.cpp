#include "topic_filter.hpp"

namespace pattern {

std::vector<std::string_view> splitLevels(std::string_view topic) {
    std::vector<std::string_view> levels;
    std::size_t start = 0;
    while (true) {
        auto pos = topic.find(LEVEL_SEPARATOR, start);
        if (pos == std::string_view::npos) {
            levels.push_back(topic.substr(start));
            break;
        }
        levels.push_back(topic.substr(start, pos - start));
        start = pos + 1;
    }
    return levels;
}

bool isValidTopicName(std::string_view name) noexcept {
    if (name.empty() || name.size() > MAX_TOPIC_LENGTH) return false;
    for (auto ch : name) {
        if (ch == '\0' || ch == SINGLE_LEVEL_CHAR || ch == MULTI_LEVEL_CHAR) return false;
    }
    return true;
}

bool isValidTopicFilter(std::string_view filter) noexcept {
    if (filter.empty() || filter.size() > MAX_TOPIC_LENGTH) return false;

    for (std::size_t i = 0; i < filter.size(); ++i) {
        auto ch = filter[i];
        if (ch == '\0') return false;

        if (ch == SINGLE_LEVEL_CHAR) {
            if (i > 0 && filter[i - 1] != LEVEL_SEPARATOR) return false;
            if (i + 1 < filter.size() && filter[i + 1] != LEVEL_SEPARATOR) return false;
        }

        if (ch == MULTI_LEVEL_CHAR) {
            if (i != filter.size() - 1) return false;
            if (i > 0 && filter[i - 1] != LEVEL_SEPARATOR) return false;
        }
    }
    return true;
}

bool topicMatches(std::string_view filter, std::string_view name) {
    if (!name.empty() && name[0] == '$') {
        if (!filter.empty() && (filter[0] == MULTI_LEVEL_CHAR || filter[0] == SINGLE_LEVEL_CHAR)) {
            return false;
        }
    }

    auto filter_levels = splitLevels(filter);
    auto name_levels   = splitLevels(name);

    std::size_t fi = 0, ni = 0;
    while (fi < filter_levels.size()) {
        auto fl = filter_levels[fi];

        if (fl.size() == 1 && fl[0] == MULTI_LEVEL_CHAR) {
            return true;
        }
        if (ni >= name_levels.size()) {
            return false;
        }
        if (!(fl.size() == 1 && fl[0] == SINGLE_LEVEL_CHAR) && fl != name_levels[ni]) {
            return false;
        }
        ++fi;
        ++ni;
    }

    return ni == name_levels.size();
}

bool hasWildcards(std::string_view filter) noexcept {
    return filter.find_first_of("+#") != std::string_view::npos;
}

std::string literalPrefix(std::string_view filter) {
    auto pos = filter.find_first_of("+#");
    if (pos == std::string_view::npos) return std::string(filter);
    return std::string(filter.substr(0, pos));
}

} // namespace pattern
