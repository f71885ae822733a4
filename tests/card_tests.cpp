#include <gtest/gtest.h>

#include "cards/card_types.hpp"
#include "cards/card_utils.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <random>
#include <string>
#include <unordered_set>

TEST(CardNameParsingTest, CorrectCardNameParsing) {
    const std::string CardRankNames = "23456789TJQKA";
    const std::string CardSuitNames = "cdhs";

    for (int i = 0; i < StandardDeckSize; ++i) {
        int rankIndex = i / NumSuits;
        int suitIndex = i % NumSuits;
        std::string cardName = { CardRankNames[rankIndex], CardSuitNames[suitIndex] };

        Result<Card> cardResult = getCardFromName(cardName);
        ASSERT_TRUE(cardResult.isValue());
        EXPECT_EQ(static_cast<int>(cardResult.getValue().rank), rankIndex);
        EXPECT_EQ(static_cast<int>(cardResult.getValue().suit), suitIndex);
        EXPECT_EQ(getNameFromCard(cardResult.getValue()), cardName);
    }
}

TEST(CardNameParsingTest, LowercaseRankIsAccepted) {
    Result<Card> cardResult = getCardFromName("ah");
    ASSERT_TRUE(cardResult.isValue());
    EXPECT_EQ(getNameFromCard(cardResult.getValue()), "Ah");

    Result<Card> tenResult = getCardFromName("tc");
    ASSERT_TRUE(tenResult.isValue());
    EXPECT_EQ(tenResult.getValue(), (Card{ Rank::Ten, Suit::Clubs }));
}

TEST(CardNameParsingTest, ErrorsFromInvalidCardNames) {
    for (const std::string& name : { "", "A", "Ahh", "1h", "Ax", "hA", "10h" }) {
        Result<Card> cardResult = getCardFromName(name);
        ASSERT_TRUE(cardResult.isError()) << name;
        EXPECT_EQ(cardResult.getError().kind, ErrorKind::InvalidCardFormat) << name;
    }
}

TEST(CardNameParsingTest, UnknownRankAndSuitCharacters) {
    Result<Rank> rankResult = getRankFromChar('X');
    ASSERT_TRUE(rankResult.isError());
    EXPECT_EQ(rankResult.getError().kind, ErrorKind::UnknownEnumerationValue);

    Result<Suit> suitResult = getSuitFromChar('x');
    ASSERT_TRUE(suitResult.isError());
    EXPECT_EQ(suitResult.getError().kind, ErrorKind::UnknownEnumerationValue);
}

TEST(CardOrderingTest, RankFirstThenSuit) {
    Card aceOfClubs = getCardFromName("Ac").getValue();
    Card aceOfSpades = getCardFromName("As").getValue();
    Card kingOfSpades = getCardFromName("Ks").getValue();

    EXPECT_LT(kingOfSpades, aceOfClubs);
    EXPECT_LT(aceOfClubs, aceOfSpades);
    EXPECT_LT(kingOfSpades, aceOfSpades);
    EXPECT_NE(aceOfClubs, aceOfSpades);
}

TEST(CardOrderingTest, OrderingIsTotalAndTransitive) {
    const auto& deck = getFullDeck();

    for (const Card& a : deck) {
        for (const Card& b : deck) {
            int relations = (a < b) + (a == b) + (b < a);
            EXPECT_EQ(relations, 1);

            for (const Card& c : { deck[0], deck[17], deck[51] }) {
                if (a < b && b < c) {
                    EXPECT_LT(a, c);
                }
            }
        }
    }
}

TEST(CardOrderingTest, RankDifferenceIsSymmetric) {
    for (int i = 0; i < NumRanks; ++i) {
        for (int j = 0; j < NumRanks; ++j) {
            Rank first = static_cast<Rank>(i);
            Rank second = static_cast<Rank>(j);
            EXPECT_EQ(rankDifference(first, second), rankDifference(second, first));
            EXPECT_EQ(rankDifference(first, second) == 0, i == j);
        }
    }

    Result<int> charDifference = rankDifference('A', 't');
    ASSERT_TRUE(charDifference.isValue());
    EXPECT_EQ(charDifference.getValue(), 4);

    EXPECT_TRUE(rankDifference('Z', '2').isError());
}

TEST(DeckTest, FullDeckHasUniqueCards) {
    const auto& deck = getFullDeck();
    EXPECT_EQ(deck.size(), 52);

    std::unordered_set<Card> uniqueCards(deck.begin(), deck.end());
    EXPECT_EQ(uniqueCards.size(), 52);
    EXPECT_TRUE(std::is_sorted(deck.begin(), deck.end()));

    // Same instance on every call
    EXPECT_EQ(&getFullDeck(), &deck);
}

TEST(DeckTest, RandomCardsComeFromTheDeck) {
    std::mt19937 generator(1234);
    const auto& deck = getFullDeck();

    for (int i = 0; i < 200; ++i) {
        Card card = makeRandomCard(generator);
        EXPECT_NE(std::find(deck.begin(), deck.end(), card), deck.end());
    }
}

TEST(CardPropertiesTest, FaceAndBroadway) {
    EXPECT_TRUE(isFace(getCardFromName("Jd").getValue()));
    EXPECT_TRUE(isFace(getCardFromName("Kc").getValue()));
    EXPECT_FALSE(isFace(getCardFromName("Ah").getValue()));
    EXPECT_FALSE(isFace(getCardFromName("Ts").getValue()));

    EXPECT_TRUE(isBroadway(getCardFromName("Ts").getValue()));
    EXPECT_TRUE(isBroadway(getCardFromName("Ah").getValue()));
    EXPECT_FALSE(isBroadway(getCardFromName("9s").getValue()));

    EXPECT_EQ(getRankFaceValue(Rank::Ace), 1);
    EXPECT_EQ(getRankFaceValue(Rank::Nine), 9);
    EXPECT_EQ(getRankFaceValue(Rank::Ten), 10);
    EXPECT_FALSE(getRankFaceValue(Rank::Queen).has_value());
}

TEST(CardPropertiesTest, SuitNames) {
    EXPECT_EQ(getSuitCode(Suit::Hearts), 'h');
    EXPECT_EQ(getSuitName(Suit::Spades), "spades");
    EXPECT_EQ(getRankSymbol(Rank::Ten), 'T');
}

TEST(ComboTest, HigherCardComesFirst) {
    Result<Combo> comboResult = getComboFromName("9d Ks");
    ASSERT_TRUE(comboResult.isValue());
    EXPECT_EQ(comboResult.getValue().first, getCardFromName("Ks").getValue());
    EXPECT_EQ(comboResult.getValue().second, getCardFromName("9d").getValue());
    EXPECT_EQ(getNameFromCombo(comboResult.getValue()), "Ks9d");

    Result<Combo> compactResult = getComboFromName("Ks9d");
    ASSERT_TRUE(compactResult.isValue());
    EXPECT_EQ(compactResult.getValue(), comboResult.getValue());
}

TEST(ComboTest, ErrorsFromInvalidCombos) {
    EXPECT_TRUE(getComboFromName("Ah").isError());
    EXPECT_TRUE(getComboFromName("Ah Ah").isError());
    EXPECT_TRUE(getComboFromName("Ah Kx").isError());
    EXPECT_TRUE(getComboFromName("AhKdQc").isError());
}
