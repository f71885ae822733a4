#include "util/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace {
constexpr const char* Whitespace = " \t\n\r\f\v";
} // namespace

std::string trim(const std::string& input) {
    std::size_t start = input.find_first_not_of(Whitespace);
    if (start == std::string::npos) {
        return "";
    }

    std::size_t end = input.find_last_not_of(Whitespace);
    return input.substr(start, end - start + 1);
}

std::string toLowerCase(const std::string& input) {
    std::string output = input;
    std::transform(output.begin(), output.end(), output.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return output;
}

std::string removeCharacter(const std::string& input, char removed) {
    std::string output = input;
    std::erase(output, removed);
    return output;
}

std::string join(const std::vector<std::string>& inputs, const std::string& connector) {
    std::ostringstream output;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        if (i > 0) output << connector;
        output << inputs[i];
    }
    return output.str();
}

std::vector<std::string> parseTokens(const std::string& input, char delimiter) {
    std::vector<std::string> tokens;

    std::size_t tokenStart = 0;
    while (tokenStart <= input.size()) {
        std::size_t tokenEnd = input.find(delimiter, tokenStart);
        if (tokenEnd == std::string::npos) {
            tokenEnd = input.size();
        }

        std::string token = trim(input.substr(tokenStart, tokenEnd - tokenStart));
        if (!token.empty()) {
            tokens.push_back(token);
        }
        tokenStart = tokenEnd + 1;
    }

    return tokens;
}

std::vector<std::string> splitLines(const std::string& input) {
    std::vector<std::string> lines;
    std::istringstream stream(input);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::optional<int> parseInt(const std::string& input) {
    const char* first = input.data();
    const char* last = input.data() + input.size();
    if (first != last && *first == '+') {
        ++first;
    }

    int value = 0;
    auto [end, error] = std::from_chars(first, last, value);
    if (error != std::errc{} || end != last || first == last) {
        return std::nullopt;
    }
    return value;
}

std::optional<int> parseChipCount(const std::string& input) {
    return parseInt(removeCharacter(trim(input), ','));
}
