#include "history/section_splitter.hpp"

#include "util/result.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <regex>
#include <string>
#include <vector>

int SectionSplit::size() const {
    return static_cast<int>(fragments.size());
}

std::optional<int> SectionSplit::findFragment(const std::string& fragment) const {
    auto it = std::find(fragments.begin(), fragments.end(), fragment);
    if (it == fragments.end()) {
        return std::nullopt;
    }
    return static_cast<int>(std::distance(fragments.begin(), it));
}

std::optional<int> SectionSplit::nextBoundaryAfter(int index) const {
    auto it = std::upper_bound(boundaries.begin(), boundaries.end(), index);
    if (it == boundaries.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<int> SectionSplit::firstBoundary() const {
    if (boundaries.empty()) {
        return std::nullopt;
    }
    return boundaries.front();
}

std::optional<int> SectionSplit::lastBoundary() const {
    if (boundaries.empty()) {
        return std::nullopt;
    }
    return boundaries.back();
}

Result<std::string> SectionSplit::getFragment(int index) const {
    if (index < 0 || index >= size()) {
        return makeError(ErrorKind::SectionNotFound, "Fragment index is outside of the hand history.", index);
    }
    return fragments[index];
}

SectionSplit splitSections(const std::string& text, const std::regex& delimiter) {
    SectionSplit split;

    auto matchesBegin = std::sregex_iterator(text.begin(), text.end(), delimiter);
    auto matchesEnd = std::sregex_iterator();

    std::size_t fragmentStart = 0;
    for (auto it = matchesBegin; it != matchesEnd; ++it) {
        const std::smatch& match = *it;
        if (match.length(0) == 0) {
            continue;
        }

        std::size_t matchStart = static_cast<std::size_t>(match.position(0));
        split.fragments.push_back(text.substr(fragmentStart, matchStart - fragmentStart));
        fragmentStart = matchStart + static_cast<std::size_t>(match.length(0));
    }
    split.fragments.push_back(text.substr(fragmentStart));

    for (int i = 0; i < split.size(); ++i) {
        if (split.fragments[i].empty()) {
            split.boundaries.push_back(i);
        }
    }

    return split;
}
