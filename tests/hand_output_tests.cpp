#include <gtest/gtest.h>

#include "history/hand_history.hpp"
#include "io/hand_file.hpp"
#include "io/hand_output.hpp"
#include "room/full_tilt_poker.hpp"
#include "util/result.hpp"

#include "test_hands.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace {
class HandOutputTest : public ::testing::Test {
protected:
    std::shared_ptr<const IRoomParser> room = std::make_shared<FullTiltPoker>();
};
} // namespace

TEST_F(HandOutputTest, ParsedHandJSON) {
    HandHistory hand(room, ShowdownHand);
    ASSERT_TRUE(hand.parse().isValue());

    json j = buildHandJSON(hand);
    EXPECT_EQ(j["Room"], "Full Tilt Poker");
    EXPECT_EQ(j["Ident"], "26523853401");
    EXPECT_EQ(j["Date"], "2010-12-05T19:05:12Z");
    EXPECT_EQ(j["Small Blind"], "15");
    EXPECT_EQ(j["Limit"], "NL");
    EXPECT_EQ(j["Game Type"], "Sit & Go");
    EXPECT_EQ(j["Currency"], "USD");
    EXPECT_EQ(j["Buy-in"], "10");
    EXPECT_EQ(j["Max Players"], 3);
    ASSERT_EQ(j["Players"].size(), 3);
    EXPECT_EQ(j["Players"][2]["Combo"], "AhAd");
    EXPECT_EQ(j["Button"], "charlie");
    EXPECT_EQ(j["Hero"], "charlie");
    EXPECT_EQ(j["Preflop"].size(), 3);
    EXPECT_EQ(j["Streets"]["flop"]["Texture"]["Monotone"], true);
    EXPECT_FALSE(j["Streets"]["turn"].contains("Texture"));
    EXPECT_EQ(j["Streets"]["river"]["Cards"], json(std::vector<std::string>{ "3c" }));
    EXPECT_EQ(j["Board"], json(std::vector<std::string>{ "Js", "7s", "2s", "7d", "3c" }));
    EXPECT_EQ(j["Showdown"], true);
    EXPECT_EQ(j["Total Pot"], "435");
    EXPECT_EQ(j["Winners"], json(std::vector<std::string>{ "charlie" }));
    EXPECT_EQ(j["Extra"]["big_blind_player"], "bravo");
}

TEST_F(HandOutputTest, MissingStreetsAreNull) {
    HandHistory hand(room, PreflopHand);
    ASSERT_TRUE(hand.parse().isValue());

    json j = buildHandJSON(hand);
    EXPECT_TRUE(j["Streets"]["flop"].is_null());
    EXPECT_TRUE(j["Streets"]["river"].is_null());
    EXPECT_TRUE(j["Board"].is_null());
    EXPECT_EQ(j["Preflop"][4]["Action"], "return");
    EXPECT_EQ(j["Preflop"][4]["Amount"], "40");
    EXPECT_TRUE(j["Preflop"][1]["Amount"].is_null());
}

TEST_F(HandOutputTest, HeaderOnlyJSON) {
    HandHistory hand(room, FlopHand);
    ASSERT_TRUE(hand.parseHeader().isValue());

    json j = buildHandJSON(hand);
    EXPECT_EQ(j["Ident"], "33286946295");
    EXPECT_EQ(j["Table"], "179");
    EXPECT_FALSE(j.contains("Players"));
    EXPECT_FALSE(j.contains("Winners"));
}

TEST_F(HandOutputTest, ExportWritesFile) {
    HandHistory hand(room, FlopHand);
    ASSERT_TRUE(hand.parse().isValue());

    std::filesystem::path path = std::filesystem::temp_directory_path() / "hand_output_test.json";
    ASSERT_TRUE(outputHandToJSON(hand, path.string(), 2).isValue());

    std::ifstream file(path);
    ASSERT_TRUE(file.is_open());
    json j = json::parse(file);
    EXPECT_EQ(j["Ident"], "33286946295");
    EXPECT_EQ(j["Winners"], json(std::vector<std::string>{ "FatalRevange" }));

    file.close();
    std::filesystem::remove(path);
}

TEST_F(HandOutputTest, ExportToMissingDirectory) {
    HandHistory hand(room, FlopHand);
    Result<void> result = outputHandToJSON(hand, "does/not/exist/hand.json", 2);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.getError().kind, ErrorKind::FileNotFound);
}

TEST(HandFileTest, SplitsHandsOnDoubleBlankLines) {
    std::string fileText = FlopHand + "\n\n\n" + ShowdownHand + "\r\n\r\n\r\n" + PreflopHand + "\n\n";
    std::vector<std::string> hands = splitHandHistories(fileText);
    ASSERT_EQ(hands.size(), 3);
    EXPECT_TRUE(hands[0].starts_with("Full Tilt Poker Game #33286946295"));
    EXPECT_TRUE(hands[1].starts_with("Full Tilt Poker Game #26523853401"));
    EXPECT_TRUE(hands[2].starts_with("Full Tilt Poker Game #33286946296"));

    std::shared_ptr<const IRoomParser> room = std::make_shared<FullTiltPoker>();
    for (const std::string& handText : hands) {
        HandHistory hand(room, handText);
        EXPECT_TRUE(hand.parse().isValue());
    }
}

TEST(HandFileTest, SingleBlankLineStaysInsideHand) {
    std::vector<std::string> hands = splitHandHistories("first\n\nsecond\n\n\nthird\n");
    ASSERT_EQ(hands.size(), 2);
    EXPECT_EQ(hands[0], "first\n\nsecond");
    EXPECT_EQ(hands[1], "third");
}

TEST(HandFileTest, EmptyTextHasNoHands) {
    EXPECT_TRUE(splitHandHistories("").empty());
    EXPECT_TRUE(splitHandHistories("\n\n\n").empty());
}
