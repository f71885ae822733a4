#include "util/decimal.hpp"

#include "util/string_utils.hpp"

#include <cctype>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

std::string Decimal::toString() const {
    std::int64_t magnitude = (m_hundredths < 0) ? -m_hundredths : m_hundredths;
    std::string output = (m_hundredths < 0) ? "-" : "";
    output += std::to_string(magnitude / Scale);

    std::int64_t fraction = magnitude % Scale;
    if (fraction != 0) {
        output += '.';
        output += static_cast<char>('0' + fraction / 10);
        if (fraction % 10 != 0) {
            output += static_cast<char>('0' + fraction % 10);
        }
    }
    return output;
}

std::ostream& operator<<(std::ostream& os, const Decimal& decimal) {
    os << decimal.toString();
    return os;
}

std::optional<Decimal> parseDecimal(const std::string& input) {
    std::string digits = removeCharacter(trim(input), ',');
    if (digits.empty()) {
        return std::nullopt;
    }

    bool isNegative = false;
    std::size_t position = 0;
    if (digits[0] == '-' || digits[0] == '+') {
        isNegative = (digits[0] == '-');
        ++position;
    }

    static constexpr int MaxIntegerDigits = 15;

    std::int64_t whole = 0;
    int numWholeDigits = 0;
    while (position < digits.size() && std::isdigit(static_cast<unsigned char>(digits[position]))) {
        if (++numWholeDigits > MaxIntegerDigits) {
            return std::nullopt;
        }
        whole = whole * 10 + (digits[position] - '0');
        ++position;
    }

    std::int64_t fraction = 0;
    int numFractionDigits = 0;
    if (position < digits.size() && digits[position] == '.') {
        ++position;
        while (position < digits.size() && std::isdigit(static_cast<unsigned char>(digits[position]))) {
            if (++numFractionDigits > 2) {
                return std::nullopt;
            }
            fraction = fraction * 10 + (digits[position] - '0');
            ++position;
        }
        if (numFractionDigits == 1) {
            fraction *= 10;
        }
    }

    if (position != digits.size() || (numWholeDigits == 0 && numFractionDigits == 0)) {
        return std::nullopt;
    }

    std::int64_t hundredths = whole * Decimal::Scale + fraction;
    return Decimal::fromHundredths(isNegative ? -hundredths : hundredths);
}
