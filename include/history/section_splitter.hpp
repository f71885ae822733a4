#ifndef SECTION_SPLITTER_HPP
#define SECTION_SPLITTER_HPP

#include "util/result.hpp"

#include <optional>
#include <regex>
#include <string>
#include <vector>

// Hand history text cut at every delimiter match. Empty fragments mark the
// section boundaries: the first one closes the part before the hole cards,
// the last one opens the summary.
struct SectionSplit {
    std::vector<std::string> fragments;
    std::vector<int> boundaries;

    int size() const;
    std::optional<int> findFragment(const std::string& fragment) const;
    std::optional<int> nextBoundaryAfter(int index) const;
    std::optional<int> firstBoundary() const;
    std::optional<int> lastBoundary() const;
    Result<std::string> getFragment(int index) const;
};

// Never fails, text without any delimiter is a single fragment
SectionSplit splitSections(const std::string& text, const std::regex& delimiter);

#endif // SECTION_SPLITTER_HPP
