#ifndef STREET_TEXTURE_HPP
#define STREET_TEXTURE_HPP

#include "cards/card_types.hpp"
#include "history/hand_types.hpp"
#include "util/decimal.hpp"

#include <optional>
#include <string>
#include <vector>

// Cards and actions of one betting round. Texture is evaluated over every
// unordered pair of the street's cards, so a single card street has no
// texture and every flag is false.
class StreetTexture {
public:
    StreetTexture(const std::vector<Card>& cards, const std::vector<PlayerAction>& actions);
    StreetTexture(const std::vector<Card>& cards, const std::vector<PlayerAction>& actions, std::optional<Decimal> pot, std::optional<int> numPlayers);

    const std::vector<Card>& getCards() const;
    const std::vector<PlayerAction>& getActions() const;
    std::optional<Decimal> getPot() const;
    std::optional<int> getNumPlayers() const;

    bool isRainbow() const;
    bool isMonotone() const;
    bool isTriplet() const;
    bool hasPair() const;
    bool hasFlushDraw() const;
    bool hasStraightDraw() const;
    bool hasGutshot() const;

    // Acting players in order of first action, std::nullopt when nobody acted
    const std::optional<std::vector<std::string>>& getPlayers() const;

    bool operator==(const StreetTexture&) const = default;

private:
    void evaluateTexture();
    void collectPlayers();

    std::vector<Card> m_cards;
    std::vector<PlayerAction> m_actions;
    std::optional<Decimal> m_pot;
    std::optional<int> m_numPlayers;

    bool m_isRainbow;
    bool m_isMonotone;
    bool m_isTriplet;
    bool m_hasPair;
    bool m_hasFlushDraw;
    bool m_hasStraightDraw;
    bool m_hasGutshot;
    std::optional<std::vector<std::string>> m_players;
};

#endif // STREET_TEXTURE_HPP
