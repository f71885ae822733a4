#ifndef FULL_TILT_POKER_HPP
#define FULL_TILT_POKER_HPP

#include "history/hand_record.hpp"
#include "history/hand_types.hpp"
#include "history/room_parser.hpp"
#include "history/section_splitter.hpp"
#include "room/room_settings.hpp"
#include "util/date_utils.hpp"
#include "util/result.hpp"

#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace fulltilt {
// Full Tilt does not print the table size, so this many seats are prepared
constexpr int DefaultMaxSeats = 9;

// Player names may contain spaces, the longest seated name that starts the text wins
std::optional<std::string> findLeadingPlayerName(const std::string& text, const std::vector<Player>& players);

Result<PlayerAction> parseActionLine(const std::string& line, const std::vector<Player>& players);
Result<std::vector<PlayerAction>> parseActionLines(const SectionSplit& sections, int start, int stop, const std::vector<Player>& players);

// "Seat 3: charlie (button) showed [Ah Ad] and won (435)" has the outcome
// "(button) showed [Ah Ad] and won (435)"
struct SummarySeatLine {
    std::string name;
    std::string outcome;
};

Result<SummarySeatLine> readSummarySeatLine(const std::string& line, const std::vector<Player>& players, int index);

// Winner lines look different depending on whether cards were shown, other seat lines are skipped
Result<std::set<std::string>> collectWinnersWithoutShowdown(const SectionSplit& sections, int start, const std::vector<Player>& players);
Result<std::set<std::string>> collectWinnersAtShowdown(const SectionSplit& sections, int start, const std::vector<Player>& players);
} // namespace fulltilt

class FullTiltPoker final : public IRoomParser {
public:
    FullTiltPoker();
    explicit FullTiltPoker(const RoomSettings& settings);

    std::string getRoomName() const override;
    const std::regex& getSectionDelimiter() const override;
    std::string getDateFormat() const override;
    TimeZoneRule getTimeZone() const override;

    Result<void> parseHeader(const SectionSplit& sections, HandRecord& record) const override;
    Result<void> parseTable(const SectionSplit& sections, HandRecord& record) const override;
    Result<void> parsePlayers(const SectionSplit& sections, HandRecord& record) const override;
    Result<void> parseButton(const SectionSplit& sections, HandRecord& record) const override;
    Result<void> parseHero(const SectionSplit& sections, HandRecord& record) const override;
    Result<void> parsePreflop(const SectionSplit& sections, HandRecord& record) const override;
    Result<void> parseStreet(Street street, const SectionSplit& sections, HandRecord& record) const override;
    Result<void> parseShowdown(const SectionSplit& sections, HandRecord& record) const override;
    Result<void> parsePot(const SectionSplit& sections, HandRecord& record) const override;
    Result<void> parseBoard(const SectionSplit& sections, HandRecord& record) const override;
    Result<void> parseWinners(const SectionSplit& sections, HandRecord& record) const override;
    Result<void> parseExtra(const SectionSplit& sections, HandRecord& record) const override;

private:
    Result<int> getSummaryStart(const SectionSplit& sections) const;
    bool hasSummaryBoardLine(const SectionSplit& sections, int summaryStart) const;

    RoomSettings m_settings;
    std::regex m_sectionDelimiter;
};

#endif // FULL_TILT_POKER_HPP
