#include <gtest/gtest.h>

#include "cli/cli_dispatcher.hpp"
#include "cli/history_commands.hpp"

#include "test_hands.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace {
class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string testName = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        m_directory = std::filesystem::temp_directory_path() / ("hand_history_cli_" + testName);
        std::filesystem::create_directories(m_directory);
        ASSERT_TRUE(registerAllCommands(dispatcher, context));
    }

    void TearDown() override {
        std::filesystem::remove_all(m_directory);
    }

    std::string writeFile(const std::string& name, const std::string& contents) const {
        std::filesystem::path path = m_directory / name;
        std::ofstream file(path);
        file << contents;
        return path.string();
    }

    CliDispatcher dispatcher{ "HandHistoryParser", Version{ .major = 1, .minor = 0, .patch = 0 } };
    ParserContext context = makeDefaultParserContext();

private:
    std::filesystem::path m_directory;
};
} // namespace

TEST_F(CliTest, UnknownAndMisusedCommands) {
    EXPECT_FALSE(dispatcher.runCommand("solve"));
    EXPECT_FALSE(dispatcher.runCommand("parse now"));
    EXPECT_FALSE(dispatcher.runCommand("load"));
    EXPECT_TRUE(dispatcher.runCommand("   "));
    EXPECT_TRUE(dispatcher.runCommand("# comment"));
    EXPECT_TRUE(dispatcher.runCommand("help"));
}

TEST_F(CliTest, CommandsNeedALoadedHand) {
    EXPECT_FALSE(dispatcher.runCommand("header"));
    EXPECT_FALSE(dispatcher.runCommand("parse"));
    EXPECT_FALSE(dispatcher.runCommand("summary"));
}

TEST_F(CliTest, LoadParseAndExport) {
    std::string handPath = writeFile("hand.txt", ShowdownHand);
    std::string jsonPath = (std::filesystem::path(handPath).parent_path() / "hand.json").string();

    ASSERT_TRUE(dispatcher.runCommand("load " + handPath));
    ASSERT_TRUE(context.hand.has_value());

    // Summary needs a fully parsed hand
    EXPECT_TRUE(dispatcher.runCommand("header"));
    EXPECT_FALSE(dispatcher.runCommand("summary"));

    EXPECT_TRUE(dispatcher.runCommand("parse"));
    EXPECT_TRUE(context.hand->isParsed());
    EXPECT_TRUE(dispatcher.runCommand("summary"));
    EXPECT_TRUE(dispatcher.runCommand("texture"));
    EXPECT_TRUE(dispatcher.runCommand("export " + jsonPath));
    EXPECT_TRUE(std::filesystem::exists(jsonPath));
}

TEST_F(CliTest, SettingsFile) {
    std::string settingsPath = writeFile("settings.yaml", "room: FTP\nmax-seats: 6\njson-indent: 2\n");
    ASSERT_TRUE(dispatcher.runCommand("settings " + settingsPath));
    EXPECT_EQ(context.roomSettings.maxSeats, 6);
    EXPECT_EQ(context.jsonIndent, 2);
    EXPECT_EQ(context.numThreads, 1);

    // Seat 9 does not exist at a six seat table
    std::string handPath = writeFile("hand.txt", FlopHand);
    ASSERT_TRUE(dispatcher.runCommand("load " + handPath));
    EXPECT_FALSE(dispatcher.runCommand("parse"));
}

TEST_F(CliTest, InvalidSettingsKeepPreviousRoom) {
    std::string missingRoom = writeFile("missing.yaml", "max-seats: 6\n");
    EXPECT_FALSE(dispatcher.runCommand("settings " + missingRoom));

    std::string unknownRoom = writeFile("unknown.yaml", "room: pokerstars\n");
    EXPECT_FALSE(dispatcher.runCommand("settings " + unknownRoom));

    std::string badSeats = writeFile("seats.yaml", "room: fulltilt\nmax-seats: 12\n");
    EXPECT_FALSE(dispatcher.runCommand("settings " + badSeats));

    EXPECT_FALSE(dispatcher.runCommand("settings does/not/exist.yaml"));
    EXPECT_EQ(context.roomSettings.maxSeats, 9);
}

TEST_F(CliTest, BatchReportsFailures) {
    std::string goodBatch = writeFile("good.txt", FlopHand + "\n\n\n" + PreflopHand);
    EXPECT_TRUE(dispatcher.runCommand("batch " + goodBatch));

    std::string brokenHand = ShowdownHand;
    brokenHand.replace(brokenHand.find("Dealt to charlie"), 16, "Dealt to nobody1");
    std::string badBatch = writeFile("bad.txt", FlopHand + "\n\n\n" + brokenHand);
    EXPECT_FALSE(dispatcher.runCommand("batch " + badBatch));
}

TEST_F(CliTest, ScriptStopsAtFirstFailure) {
    std::string handPath = writeFile("hand.txt", PreflopHand);
    std::string goodScript = writeFile("good.cmd", "# parse one hand\nload " + handPath + "\nparse\nsummary\n");
    EXPECT_TRUE(dispatcher.runCommand("source " + goodScript));
    EXPECT_TRUE(context.hand->isParsed());

    std::string badScript = writeFile("bad.cmd", "load " + handPath + "\nsolve\nparse\n");
    EXPECT_FALSE(dispatcher.runCommand("source " + badScript));
    EXPECT_FALSE(context.hand->isParsed());
}
