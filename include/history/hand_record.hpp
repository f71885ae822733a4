#ifndef HAND_RECORD_HPP
#define HAND_RECORD_HPP

#include "cards/card_types.hpp"
#include "history/hand_enums.hpp"
#include "history/hand_types.hpp"
#include "history/street_texture.hpp"
#include "util/date_utils.hpp"
#include "util/decimal.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

// Everything the parse stages learn about one hand
struct HandRecord {
    // Header
    std::string ident;
    std::optional<UtcTime> date;
    Decimal smallBlind;
    Decimal bigBlind;
    std::optional<Limit> limit;
    std::optional<Game> game;
    std::optional<GameType> gameType;
    std::optional<Currency> currency;
    std::optional<Decimal> buyin;
    std::optional<Decimal> rake;
    std::string tournamentIdent;
    std::optional<int> tournamentLevel;
    std::string tableName;

    // Seating, button and hero index into players
    int maxPlayers = 0;
    std::vector<Player> players;
    std::optional<std::size_t> buttonIndex;
    std::optional<std::size_t> heroIndex;

    // Betting rounds, absent streets were never dealt
    std::vector<PlayerAction> preflopActions;
    StreetArray<std::optional<StreetTexture>> streets;

    // Summary
    bool showdown = false;
    std::optional<Decimal> totalPot;
    std::optional<std::vector<Card>> summaryBoard;
    std::set<std::string> winners;

    // Room facts without a typed field
    std::map<std::string, std::string> extra;
};

std::vector<Player> initSeats(int numSeats);
Result<std::size_t> findPlayerIndex(const HandRecord& record, const std::string& name);

// Flop, then turn if there was a flop, then river if there was a turn
std::optional<std::vector<Card>> getBoard(const HandRecord& record);
std::optional<Card> getStreetCard(const HandRecord& record, Street street);

#endif // HAND_RECORD_HPP
