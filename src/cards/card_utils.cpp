#include "cards/card_utils.hpp"

#include "cards/card_types.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <array>
#include <cassert>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <random>
#include <string>
#include <utility>

namespace {
const std::string RankSymbols = "23456789TJQKA";
const std::string SuitCodes = "cdhs";

std::array<Card, StandardDeckSize> buildFullDeck() {
    std::array<Card, StandardDeckSize> deck;
    for (int rank = 0; rank < NumRanks; ++rank) {
        for (int suit = 0; suit < NumSuits; ++suit) {
            deck[(rank * NumSuits) + suit] = Card{ static_cast<Rank>(rank), static_cast<Suit>(suit) };
        }
    }
    return deck;
}
} // namespace

Result<Rank> getRankFromChar(char rankChar) {
    char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(rankChar)));
    std::size_t rank = RankSymbols.find(upper);
    if (rank == std::string::npos) {
        return makeError(ErrorKind::UnknownEnumerationValue, "\"" + std::string{ rankChar } + "\" is not a valid rank.");
    }
    return static_cast<Rank>(rank);
}

char getRankSymbol(Rank rank) {
    int rankID = static_cast<int>(rank);
    assert(rankID < NumRanks);
    return RankSymbols[rankID];
}

std::optional<int> getRankFaceValue(Rank rank) {
    switch (rank) {
        case Rank::Jack:
        case Rank::Queen:
        case Rank::King:
            return std::nullopt;
        case Rank::Ace:
            return 1;
        default:
            return static_cast<int>(rank) + 2;
    }
}

int rankDifference(Rank first, Rank second) {
    return std::abs(static_cast<int>(first) - static_cast<int>(second));
}

Result<int> rankDifference(char first, char second) {
    Result<Rank> firstResult = getRankFromChar(first);
    if (firstResult.isError()) {
        return firstResult.getError();
    }

    Result<Rank> secondResult = getRankFromChar(second);
    if (secondResult.isError()) {
        return secondResult.getError();
    }

    return rankDifference(firstResult.getValue(), secondResult.getValue());
}

Result<Suit> getSuitFromChar(char suitChar) {
    char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(suitChar)));
    std::size_t suit = SuitCodes.find(lower);
    if (suit == std::string::npos) {
        return makeError(ErrorKind::UnknownEnumerationValue, "\"" + std::string{ suitChar } + "\" is not a valid suit.");
    }
    return static_cast<Suit>(suit);
}

char getSuitCode(Suit suit) {
    int suitID = static_cast<int>(suit);
    assert(suitID < NumSuits);
    return SuitCodes[suitID];
}

std::string getSuitGlyph(Suit suit) {
    switch (suit) {
        case Suit::Clubs:
            return "♣";
        case Suit::Diamonds:
            return "♦";
        case Suit::Hearts:
            return "♥";
        case Suit::Spades:
            return "♠";
        default:
            assert(false);
            return "";
    }
}

std::string getSuitName(Suit suit) {
    switch (suit) {
        case Suit::Clubs:
            return "clubs";
        case Suit::Diamonds:
            return "diamonds";
        case Suit::Hearts:
            return "hearts";
        case Suit::Spades:
            return "spades";
        default:
            assert(false);
            return "";
    }
}

Result<Card> getCardFromName(const std::string& cardName) {
    static const std::string ErrorPrefix = "Error parsing card: ";

    if (cardName.size() != 2) {
        return makeError(ErrorKind::InvalidCardFormat, ErrorPrefix + "\"" + cardName + "\" should be two characters long.");
    }

    Result<Rank> rankResult = getRankFromChar(cardName[0]);
    if (rankResult.isError()) {
        return makeError(ErrorKind::InvalidCardFormat, ErrorPrefix + rankResult.getError().message);
    }

    Result<Suit> suitResult = getSuitFromChar(cardName[1]);
    if (suitResult.isError()) {
        return makeError(ErrorKind::InvalidCardFormat, ErrorPrefix + suitResult.getError().message);
    }

    return Card{ rankResult.getValue(), suitResult.getValue() };
}

std::string getNameFromCard(Card card) {
    std::string cardName = { getRankSymbol(card.rank), getSuitCode(card.suit) };
    return cardName;
}

bool isFace(Card card) {
    return (card.rank == Rank::Jack) || (card.rank == Rank::Queen) || (card.rank == Rank::King);
}

bool isBroadway(Card card) {
    return card.rank >= Rank::Ten;
}

const std::array<Card, StandardDeckSize>& getFullDeck() {
    static const std::array<Card, StandardDeckSize> FullDeck = buildFullDeck();
    return FullDeck;
}

Card makeRandomCard(std::mt19937& generator) {
    std::uniform_int_distribution<int> rankDistribution(0, NumRanks - 1);
    std::uniform_int_distribution<int> suitDistribution(0, NumSuits - 1);
    Rank rank = static_cast<Rank>(rankDistribution(generator));
    Suit suit = static_cast<Suit>(suitDistribution(generator));
    return Card{ rank, suit };
}

Result<Combo> makeCombo(Card first, Card second) {
    if (first == second) {
        return makeError(ErrorKind::InvalidCardFormat, "Error building combo: \"" + getNameFromCard(first) + "\" appears twice.");
    }

    if (first < second) std::swap(first, second);
    return Combo{ first, second };
}

Result<Combo> getComboFromName(const std::string& comboName) {
    std::string compact = removeCharacter(trim(comboName), ' ');
    if (compact.size() != 4) {
        return makeError(ErrorKind::InvalidCardFormat, "Error parsing combo: \"" + comboName + "\" should contain exactly two cards.");
    }

    Result<Card> firstResult = getCardFromName(compact.substr(0, 2));
    if (firstResult.isError()) {
        return firstResult.getError();
    }

    Result<Card> secondResult = getCardFromName(compact.substr(2, 2));
    if (secondResult.isError()) {
        return secondResult.getError();
    }

    return makeCombo(firstResult.getValue(), secondResult.getValue());
}

std::string getNameFromCombo(const Combo& combo) {
    return getNameFromCard(combo.first) + getNameFromCard(combo.second);
}
