#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <optional>
#include <string>
#include <vector>

std::string trim(const std::string& input);
std::string toLowerCase(const std::string& input);
std::string removeCharacter(const std::string& input, char removed);
std::string join(const std::vector<std::string>& inputs, const std::string& connector);

// Empty tokens are dropped, the rest are trimmed
std::vector<std::string> parseTokens(const std::string& input, char delimiter);

// Accepts "\n" and "\r\n" line endings, keeps empty lines
std::vector<std::string> splitLines(const std::string& input);

std::optional<int> parseInt(const std::string& input);

// Chip counts are printed with thousands separators, e.g. "13,587"
std::optional<int> parseChipCount(const std::string& input);

#endif // STRING_UTILS_HPP
