#include "history/street_texture.hpp"

#include "cards/card_types.hpp"
#include "cards/card_utils.hpp"
#include "history/hand_types.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

StreetTexture::StreetTexture(const std::vector<Card>& cards, const std::vector<PlayerAction>& actions) : StreetTexture(cards, actions, std::nullopt, std::nullopt) {}

StreetTexture::StreetTexture(const std::vector<Card>& cards, const std::vector<PlayerAction>& actions, std::optional<Decimal> pot, std::optional<int> numPlayers) :
    m_cards{ cards },
    m_actions{ actions },
    m_pot{ pot },
    m_numPlayers{ numPlayers },
    m_isRainbow{ false },
    m_isMonotone{ false },
    m_isTriplet{ false },
    m_hasPair{ false },
    m_hasFlushDraw{ false },
    m_hasStraightDraw{ false },
    m_hasGutshot{ false } {
    evaluateTexture();
    collectPlayers();
}

const std::vector<Card>& StreetTexture::getCards() const {
    return m_cards;
}

const std::vector<PlayerAction>& StreetTexture::getActions() const {
    return m_actions;
}

std::optional<Decimal> StreetTexture::getPot() const {
    return m_pot;
}

std::optional<int> StreetTexture::getNumPlayers() const {
    return m_numPlayers;
}

bool StreetTexture::isRainbow() const {
    return m_isRainbow;
}

bool StreetTexture::isMonotone() const {
    return m_isMonotone;
}

bool StreetTexture::isTriplet() const {
    return m_isTriplet;
}

bool StreetTexture::hasPair() const {
    return m_hasPair;
}

bool StreetTexture::hasFlushDraw() const {
    return m_hasFlushDraw;
}

bool StreetTexture::hasStraightDraw() const {
    return m_hasStraightDraw;
}

bool StreetTexture::hasGutshot() const {
    return m_hasGutshot;
}

const std::optional<std::vector<std::string>>& StreetTexture::getPlayers() const {
    return m_players;
}

void StreetTexture::evaluateTexture() {
    int numCards = static_cast<int>(m_cards.size());
    if (numCards < 2) {
        return;
    }

    bool allSuitsDiffer = true;
    bool allSuitsMatch = true;
    bool allRanksMatch = true;
    bool anyRanksMatch = false;
    bool anySuitsMatch = false;
    bool anyStraightDraw = false;
    bool anyGutshot = false;

    for (int i = 0; i < numCards; ++i) {
        for (int j = i + 1; j < numCards; ++j) {
            const Card& first = m_cards[i];
            const Card& second = m_cards[j];

            bool sameSuit = (first.suit == second.suit);
            bool sameRank = (first.rank == second.rank);
            int difference = rankDifference(first.rank, second.rank);

            allSuitsDiffer &= !sameSuit;
            allSuitsMatch &= sameSuit;
            allRanksMatch &= sameRank;
            anyRanksMatch |= sameRank;
            anySuitsMatch |= sameSuit;
            anyStraightDraw |= (difference >= 1 && difference <= 3);
            anyGutshot |= (difference >= 1 && difference <= 4);
        }
    }

    m_isRainbow = allSuitsDiffer;
    m_isMonotone = allSuitsMatch;
    m_isTriplet = allRanksMatch;
    m_hasPair = anyRanksMatch;
    m_hasFlushDraw = anySuitsMatch;
    m_hasStraightDraw = anyStraightDraw;
    m_hasGutshot = anyGutshot;
}

void StreetTexture::collectPlayers() {
    if (m_actions.empty()) {
        m_players = std::nullopt;
        return;
    }

    std::vector<std::string> playerNames;
    for (const PlayerAction& action : m_actions) {
        if (std::find(playerNames.begin(), playerNames.end(), action.name) == playerNames.end()) {
            playerNames.push_back(action.name);
        }
    }
    m_players = playerNames;
}
