#ifndef CARD_TYPES_HPP
#define CARD_TYPES_HPP

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>

constexpr int NumRanks = 13;
constexpr int NumSuits = 4;
constexpr int StandardDeckSize = NumRanks * NumSuits;

enum class Rank : std::uint8_t {
    Two,
    Three,
    Four,
    Five,
    Six,
    Seven,
    Eight,
    Nine,
    Ten,
    Jack,
    Queen,
    King,
    Ace
};

enum class Suit : std::uint8_t {
    Clubs,
    Diamonds,
    Hearts,
    Spades
};

// Ordered by rank first, suit breaks ties
struct Card {
    Rank rank;
    Suit suit;

    constexpr bool operator==(const Card&) const = default;
    constexpr auto operator<=>(const Card&) const = default;
};

// Hole cards, higher card first
struct Combo {
    Card first;
    Card second;

    constexpr bool operator==(const Combo&) const = default;
};

template <>
struct std::hash<Card> {
    std::size_t operator()(const Card& card) const noexcept {
        return std::hash<int>{}(static_cast<int>(card.rank)) * 31 + std::hash<int>{}(static_cast<int>(card.suit));
    }
};

#endif // CARD_TYPES_HPP
