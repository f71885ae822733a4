#include "history/hand_record.hpp"

#include "cards/card_types.hpp"
#include "history/hand_types.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

std::vector<Player> initSeats(int numSeats) {
    std::vector<Player> players;
    players.reserve(numSeats);
    for (int seat = 1; seat <= numSeats; ++seat) {
        players.push_back(Player{ .name = "Empty Seat " + std::to_string(seat), .stack = 0, .seat = seat, .combo = std::nullopt });
    }
    return players;
}

Result<std::size_t> findPlayerIndex(const HandRecord& record, const std::string& name) {
    for (std::size_t i = 0; i < record.players.size(); ++i) {
        if (record.players[i].name == name) {
            return i;
        }
    }
    return makeError(ErrorKind::HeroNotFound, "Player \"" + name + "\" is not seated at the table.");
}

std::optional<Card> getStreetCard(const HandRecord& record, Street street) {
    const std::optional<StreetTexture>& streetTexture = record.streets[street];
    if (!streetTexture || streetTexture->getCards().empty()) {
        return std::nullopt;
    }
    return streetTexture->getCards().back();
}

std::optional<std::vector<Card>> getBoard(const HandRecord& record) {
    const std::optional<StreetTexture>& flop = record.streets[Street::Flop];
    if (!flop || flop->getCards().empty()) {
        return std::nullopt;
    }

    std::vector<Card> board = flop->getCards();

    std::optional<Card> turn = getStreetCard(record, Street::Turn);
    if (turn) {
        board.push_back(*turn);

        std::optional<Card> river = getStreetCard(record, Street::River);
        if (river) {
            board.push_back(*river);
        }
    }

    return board;
}
