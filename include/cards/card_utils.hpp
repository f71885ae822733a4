#ifndef CARD_UTILS_HPP
#define CARD_UTILS_HPP

#include "cards/card_types.hpp"
#include "util/result.hpp"

#include <array>
#include <optional>
#include <random>
#include <string>

// Rank functions
Result<Rank> getRankFromChar(char rankChar);
char getRankSymbol(Rank rank);
std::optional<int> getRankFaceValue(Rank rank);
int rankDifference(Rank first, Rank second);
Result<int> rankDifference(char first, char second);

// Suit functions
Result<Suit> getSuitFromChar(char suitChar);
char getSuitCode(Suit suit);
std::string getSuitGlyph(Suit suit);
std::string getSuitName(Suit suit);

// Card functions
Result<Card> getCardFromName(const std::string& cardName);
std::string getNameFromCard(Card card);
bool isFace(Card card);
bool isBroadway(Card card);
const std::array<Card, StandardDeckSize>& getFullDeck();
Card makeRandomCard(std::mt19937& generator);

// Combo functions
Result<Combo> makeCombo(Card first, Card second);
Result<Combo> getComboFromName(const std::string& comboName);
std::string getNameFromCombo(const Combo& combo);

#endif // CARD_UTILS_HPP
