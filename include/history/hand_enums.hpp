#ifndef HAND_ENUMS_HPP
#define HAND_ENUMS_HPP

#include "util/result.hpp"

#include <cstdint>
#include <string>

enum class Limit : std::uint8_t {
    NoLimit,
    PotLimit,
    FixedLimit
};

enum class Game : std::uint8_t {
    Holdem,
    Omaha,
    OmahaHiLo,
    Razz,
    Stud,
    StudHiLo
};

enum class GameType : std::uint8_t {
    Cash,
    Tournament,
    SitAndGo
};

enum class Currency : std::uint8_t {
    USD,
    EUR,
    GBP,
    Play
};

enum class ActionType : std::uint8_t {
    Bet,
    Raise,
    Call,
    Check,
    Fold,
    Muck,
    Show,
    Think,
    Return,
    Win
};

// Parsing accepts every spelling the supported rooms print,
// names are the canonical spellings used in output
Result<Limit> getLimitFromName(const std::string& name);
std::string getLimitName(Limit limit);

Result<Game> getGameFromName(const std::string& name);
std::string getGameName(Game game);

std::string getGameTypeName(GameType gameType);

Result<Currency> getCurrencyFromName(const std::string& name);
std::string getCurrencyName(Currency currency);

// Verbs as printed in action lines ("bets", "calls", ...)
Result<ActionType> getActionTypeFromVerb(const std::string& verb);
std::string getActionTypeName(ActionType actionType);

#endif // HAND_ENUMS_HPP
