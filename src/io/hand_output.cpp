#include "io/hand_output.hpp"

#include "cards/card_types.hpp"
#include "cards/card_utils.hpp"
#include "history/hand_enums.hpp"
#include "history/hand_history.hpp"
#include "history/hand_record.hpp"
#include "history/hand_types.hpp"
#include "history/street_texture.hpp"
#include "util/date_utils.hpp"
#include "util/decimal.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace {
json buildCardsJSON(const std::vector<Card>& cards) {
    json j = json::array();
    for (const Card& card : cards) {
        j.push_back(getNameFromCard(card));
    }
    return j;
}

json buildAmountJSON(const std::optional<Decimal>& amount) {
    if (!amount) {
        return nullptr;
    }
    return amount->toString();
}

json buildActionsJSON(const std::vector<PlayerAction>& actions) {
    json j = json::array();
    for (const PlayerAction& action : actions) {
        json actionJSON;
        actionJSON["Name"] = action.name;
        actionJSON["Action"] = getActionTypeName(action.action);
        actionJSON["Amount"] = buildAmountJSON(action.amount);
        j.push_back(actionJSON);
    }
    return j;
}

json buildPlayerJSON(const Player& player) {
    json j;
    j["Name"] = player.name;
    j["Seat"] = player.seat;
    j["Stack"] = player.stack;
    j["Combo"] = player.combo ? json(getNameFromCombo(*player.combo)) : json(nullptr);
    return j;
}
} // namespace

json buildStreetJSON(const StreetTexture& street) {
    json j;
    j["Cards"] = buildCardsJSON(street.getCards());
    j["Pot"] = buildAmountJSON(street.getPot());
    j["Players"] = street.getNumPlayers() ? json(*street.getNumPlayers()) : json(nullptr);
    j["Actions"] = buildActionsJSON(street.getActions());

    if (street.getCards().size() >= 2) {
        auto& texture = j["Texture"];
        texture["Rainbow"] = street.isRainbow();
        texture["Monotone"] = street.isMonotone();
        texture["Triplet"] = street.isTriplet();
        texture["Pair"] = street.hasPair();
        texture["Flush Draw"] = street.hasFlushDraw();
        texture["Straight Draw"] = street.hasStraightDraw();
        texture["Gutshot"] = street.hasGutshot();
    }

    return j;
}

json buildHandJSON(const HandHistory& hand) {
    const HandRecord& record = hand.getRecord();

    json j;
    j["Room"] = hand.getRoom().getRoomName();
    j["Ident"] = record.ident;
    j["Date"] = record.date ? json(formatUtcDate(*record.date)) : json(nullptr);
    j["Small Blind"] = record.smallBlind.toString();
    j["Big Blind"] = record.bigBlind.toString();
    j["Limit"] = record.limit ? json(getLimitName(*record.limit)) : json(nullptr);
    j["Game"] = record.game ? json(getGameName(*record.game)) : json(nullptr);
    j["Game Type"] = record.gameType ? json(getGameTypeName(*record.gameType)) : json(nullptr);
    j["Currency"] = record.currency ? json(getCurrencyName(*record.currency)) : json(nullptr);
    j["Buy-in"] = buildAmountJSON(record.buyin);
    j["Rake"] = buildAmountJSON(record.rake);
    j["Tournament"] = record.tournamentIdent;
    j["Table"] = record.tableName;

    if (!hand.isParsed()) {
        return j;
    }

    j["Max Players"] = record.maxPlayers;
    j["Players"] = json::array();
    for (const Player& player : record.players) {
        j["Players"].push_back(buildPlayerJSON(player));
    }

    std::optional<Player> button = hand.getButton();
    std::optional<Player> hero = hand.getHero();
    j["Button"] = button ? json(button->name) : json(nullptr);
    j["Hero"] = hero ? json(hero->name) : json(nullptr);

    j["Preflop"] = buildActionsJSON(record.preflopActions);

    auto& streets = j["Streets"];
    for (Street street : { Street::Flop, Street::Turn, Street::River }) {
        const std::optional<StreetTexture>& streetTexture = record.streets[street];
        streets[getStreetName(street)] = streetTexture ? buildStreetJSON(*streetTexture) : json(nullptr);
    }

    std::optional<std::vector<Card>> board = hand.getBoard();
    j["Board"] = board ? buildCardsJSON(*board) : json(nullptr);
    j["Showdown"] = record.showdown;
    j["Total Pot"] = buildAmountJSON(record.totalPot);
    j["Winners"] = record.winners;
    j["Extra"] = record.extra;

    return j;
}

Result<void> outputHandToJSON(const HandHistory& hand, const std::string& filePath, int indent) {
    std::ofstream file(filePath);
    if (!file.is_open()) {
        return makeError(ErrorKind::FileNotFound, "Could not open " + filePath + " for writing.");
    }

    json j = buildHandJSON(hand);
    file << j.dump(indent) << std::endl;
    return {};
}
