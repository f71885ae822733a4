#ifndef HAND_TYPES_HPP
#define HAND_TYPES_HPP

#include "cards/card_types.hpp"
#include "history/hand_enums.hpp"
#include "util/decimal.hpp"

#include <array>
#include <cassert>
#include <cstdint>
#include <optional>
#include <string>

enum class Street : std::uint8_t {
    Flop,
    Turn,
    River
};

template <typename T>
class StreetArray {
public:
    constexpr StreetArray() = default;
    constexpr StreetArray(const T& flopValue, const T& turnValue, const T& riverValue) : m_array{ flopValue, turnValue, riverValue } {};

    constexpr const T& operator[](Street street) const {
        return m_array[getStreetID(street)];
    }

    constexpr T& operator[](Street street) {
        return m_array[getStreetID(street)];
    }

    constexpr bool operator==(const StreetArray&) const = default;

private:
    constexpr int getStreetID(Street street) const {
        int streetID = static_cast<int>(street);
        assert(streetID >= 0 && streetID < 3);
        return streetID;
    }

    std::array<T, 3> m_array;
};

struct Player {
    std::string name;
    int stack;
    int seat;
    std::optional<Combo> combo;

    bool operator==(const Player&) const = default;
};

struct PlayerAction {
    std::string name;
    ActionType action;
    std::optional<Decimal> amount;

    bool operator==(const PlayerAction&) const = default;
};

std::string getStreetName(Street street);

#endif // HAND_TYPES_HPP
