#ifndef DECIMAL_HPP
#define DECIMAL_HPP

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

// Money amount with two fractional digits, stored as hundredths
class Decimal {
public:
    static constexpr int Scale = 100;

    constexpr Decimal() : m_hundredths{ 0 } {}

    static constexpr Decimal fromWhole(std::int64_t whole) {
        return fromHundredths(whole * Scale);
    }

    static constexpr Decimal fromHundredths(std::int64_t hundredths) {
        Decimal decimal;
        decimal.m_hundredths = hundredths;
        return decimal;
    }

    constexpr std::int64_t getHundredths() const {
        return m_hundredths;
    }

    constexpr Decimal operator+(Decimal other) const {
        return fromHundredths(m_hundredths + other.m_hundredths);
    }

    constexpr Decimal operator-(Decimal other) const {
        return fromHundredths(m_hundredths - other.m_hundredths);
    }

    constexpr auto operator<=>(const Decimal&) const = default;

    // "230", "0.5" and "12.25" style output, no trailing zeros
    std::string toString() const;

    friend std::ostream& operator<<(std::ostream& os, const Decimal& decimal);

private:
    std::int64_t m_hundredths;
};

// Accepts an optional sign, thousands separators and up to two fractional digits
std::optional<Decimal> parseDecimal(const std::string& input);

#endif // DECIMAL_HPP
