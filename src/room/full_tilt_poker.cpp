#include "room/full_tilt_poker.hpp"

#include "cards/card_types.hpp"
#include "cards/card_utils.hpp"
#include "history/hand_enums.hpp"
#include "history/hand_record.hpp"
#include "history/hand_types.hpp"
#include "history/section_splitter.hpp"
#include "history/street_texture.hpp"
#include "util/date_utils.hpp"
#include "util/decimal.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace {
Error atFragment(Error error, int index) {
    if (!error.fragmentIndex) {
        error.fragmentIndex = index;
    }
    return error;
}

Error malformedLine(const std::string& message, int index) {
    return makeError(ErrorKind::MalformedStageLine, message, index);
}

// A missing fragment here means the document does not follow the room format
Result<std::string> getStageLine(const SectionSplit& sections, int index, const std::string& description) {
    Result<std::string> fragmentResult = sections.getFragment(index);
    if (fragmentResult.isError()) {
        return malformedLine("Expected " + description + " but the hand history ends before it.", index);
    }
    return fragmentResult;
}

Result<std::vector<Card>> parseCardList(const std::string& cardsText, int index) {
    std::vector<Card> cards;
    for (const std::string& cardName : parseTokens(cardsText, ' ')) {
        Result<Card> cardResult = getCardFromName(cardName);
        if (cardResult.isError()) {
            return atFragment(cardResult.getError(), index);
        }
        cards.push_back(cardResult.getValue());
    }
    return cards;
}

std::string getStreetMarker(Street street) {
    switch (street) {
        case Street::Flop:
            return "FLOP";
        case Street::Turn:
            return "TURN";
        case Street::River:
            return "RIVER";
        default:
            assert(false);
            return "";
    }
}

int getStreetCardCount(Street street) {
    return (street == Street::Flop) ? 3 : 1;
}
} // namespace

namespace fulltilt {
std::optional<std::string> findLeadingPlayerName(const std::string& text, const std::vector<Player>& players) {
    std::optional<std::string> found;
    for (const Player& player : players) {
        const std::string& name = player.name;
        bool startsText = text.size() > name.size() && text.starts_with(name) && text[name.size()] == ' ';
        if (startsText && (!found || name.size() > found->size())) {
            found = name;
        }
    }
    return found;
}

Result<PlayerAction> parseActionLine(const std::string& line, const std::vector<Player>& players) {
    static const std::regex UncalledRegex(R"(^Uncalled bet of ([\d,.]+) returned to (.+)$)");
    static const std::regex RaiseRegex(R"(^raises to ([\d,.]+).*$)");
    static const std::regex WinRegex(R"(^wins the pot \(([\d,.]+)\)$)");
    static const std::regex MuckRegex(R"(^mucks.*$)");
    static const std::regex ThinkRegex(R"(^has \d+ seconds left to act$)");
    static const std::regex PlainActionRegex(R"(^(\S+)(?: (.*))?$)");

    auto requireAmount = [&line](const std::string& amountText) -> Result<Decimal> {
        std::optional<Decimal> amount = parseDecimal(amountText);
        if (!amount) {
            return makeError(ErrorKind::MalformedStageLine, "Could not read the amount in action line \"" + line + "\".");
        }
        return *amount;
    };

    std::smatch match;
    if (std::regex_match(line, match, UncalledRegex)) {
        Result<Decimal> amount = requireAmount(match[1].str());
        if (amount.isError()) {
            return amount.getError();
        }
        return PlayerAction{ .name = match[2].str(), .action = ActionType::Return, .amount = amount.getValue() };
    }

    // Players not seated at the table fall back to a one word name
    std::optional<std::string> seatedName = findLeadingPlayerName(line, players);
    std::string name = seatedName ? *seatedName : line.substr(0, line.find(' '));
    if (name.size() + 1 >= line.size()) {
        return makeError(ErrorKind::MalformedStageLine, "Unrecognised action line \"" + line + "\".");
    }
    std::string verbText = line.substr(name.size() + 1);

    if (std::regex_match(verbText, match, RaiseRegex)) {
        Result<Decimal> amount = requireAmount(match[1].str());
        if (amount.isError()) {
            return amount.getError();
        }
        return PlayerAction{ .name = name, .action = ActionType::Raise, .amount = amount.getValue() };
    }

    if (std::regex_match(verbText, match, WinRegex)) {
        Result<Decimal> amount = requireAmount(match[1].str());
        if (amount.isError()) {
            return amount.getError();
        }
        return PlayerAction{ .name = name, .action = ActionType::Win, .amount = amount.getValue() };
    }

    if (std::regex_match(verbText, MuckRegex)) {
        return PlayerAction{ .name = name, .action = ActionType::Muck, .amount = std::nullopt };
    }

    if (std::regex_match(verbText, ThinkRegex)) {
        return PlayerAction{ .name = name, .action = ActionType::Think, .amount = std::nullopt };
    }

    if (std::regex_match(verbText, match, PlainActionRegex)) {
        Result<ActionType> actionResult = getActionTypeFromVerb(match[1].str());
        if (actionResult.isError()) {
            return makeError(ErrorKind::MalformedStageLine, "Unrecognised action line \"" + line + "\".");
        }

        ActionType action = actionResult.getValue();
        std::optional<Decimal> amount;
        if (action == ActionType::Bet || action == ActionType::Call) {
            // "calls 60, and is all in"
            std::vector<std::string> rest = parseTokens(match[2].str(), ' ');
            if (rest.empty()) {
                return makeError(ErrorKind::MalformedStageLine, "Missing amount in action line \"" + line + "\".");
            }
            Result<Decimal> amountResult = requireAmount(removeCharacter(rest[0], ','));
            if (amountResult.isError()) {
                return amountResult.getError();
            }
            amount = amountResult.getValue();
        }

        return PlayerAction{ .name = name, .action = action, .amount = amount };
    }

    return makeError(ErrorKind::MalformedStageLine, "Unrecognised action line \"" + line + "\".");
}

Result<std::vector<PlayerAction>> parseActionLines(const SectionSplit& sections, int start, int stop, const std::vector<Player>& players) {
    std::vector<PlayerAction> actions;
    for (int i = start; i < stop; ++i) {
        Result<std::string> lineResult = getStageLine(sections, i, "an action line");
        if (lineResult.isError()) {
            return lineResult.getError();
        }

        Result<PlayerAction> actionResult = parseActionLine(lineResult.getValue(), players);
        if (actionResult.isError()) {
            return atFragment(actionResult.getError(), i);
        }
        actions.push_back(actionResult.getValue());
    }
    return actions;
}

Result<SummarySeatLine> readSummarySeatLine(const std::string& line, const std::vector<Player>& players, int index) {
    static const std::regex SeatLineRegex(R"(^Seat (\d+): (.*)$)");

    std::smatch match;
    if (!std::regex_match(line, match, SeatLineRegex)) {
        return malformedLine("Expected a summary seat line, found \"" + line + "\".", index);
    }

    std::optional<int> seat = parseInt(match[1].str());
    auto player = std::find_if(players.begin(), players.end(), [&seat](const Player& p) { return seat && p.seat == *seat; });
    if (player == players.end()) {
        return malformedLine("Summary names a seat that was not listed in \"" + line + "\".", index);
    }

    std::string rest = match[2].str();
    const std::string& name = player->name;
    if (!rest.starts_with(name) || (rest.size() > name.size() && rest[name.size()] != ' ')) {
        return malformedLine("Summary seat line does not belong to " + name + ": \"" + line + "\".", index);
    }

    return SummarySeatLine{ .name = name, .outcome = trim(rest.substr(name.size())) };
}

namespace {
Result<std::set<std::string>> collectWinners(const SectionSplit& sections, int start, const std::vector<Player>& players, const std::regex& outcomeRegex) {
    std::set<std::string> winners;
    for (int i = start; i < sections.size(); ++i) {
        const std::string& line = sections.fragments[i];
        if (!line.starts_with("Seat ")) {
            continue;
        }

        Result<SummarySeatLine> seatLineResult = readSummarySeatLine(line, players, i);
        if (seatLineResult.isError()) {
            return seatLineResult.getError();
        }

        const SummarySeatLine& seatLine = seatLineResult.getValue();
        if (std::regex_search(seatLine.outcome, outcomeRegex)) {
            winners.insert(seatLine.name);
        }
    }
    return winners;
}
} // namespace

Result<std::set<std::string>> collectWinnersWithoutShowdown(const SectionSplit& sections, int start, const std::vector<Player>& players) {
    static const std::regex CollectedRegex(R"(collected \([\d,.]+\))");
    return collectWinners(sections, start, players, CollectedRegex);
}

Result<std::set<std::string>> collectWinnersAtShowdown(const SectionSplit& sections, int start, const std::vector<Player>& players) {
    static const std::regex ShowedAndWonRegex(R"(showed \[[^\]]*\] and won)");
    return collectWinners(sections, start, players, ShowedAndWonRegex);
}
} // namespace fulltilt

FullTiltPoker::FullTiltPoker() : FullTiltPoker(RoomSettings{ .maxSeats = fulltilt::DefaultMaxSeats }) {}

FullTiltPoker::FullTiltPoker(const RoomSettings& settings) : m_settings{ settings }, m_sectionDelimiter{ R"( ?\*\*\* ?\n?|\n)" } {
    assert(m_settings.maxSeats > 0);
}

std::string FullTiltPoker::getRoomName() const {
    return "Full Tilt Poker";
}

const std::regex& FullTiltPoker::getSectionDelimiter() const {
    return m_sectionDelimiter;
}

std::string FullTiltPoker::getDateFormat() const {
    return "%H:%M:%S ET - %Y/%m/%d";
}

TimeZoneRule FullTiltPoker::getTimeZone() const {
    return getUsEasternTimeZone();
}

Result<void> FullTiltPoker::parseHeader(const SectionSplit& sections, HandRecord& record) const {
    static const std::regex HeaderRegex(
        R"(^Full Tilt Poker Game #(\d+): )"                   // Hand id
        R"((\$?([\d,.]*).*) \((\d+)\), )"                     // Tournament name with optional buy-in, tournament id
        R"(Table (\d+) - )"                                   // Table
        R"((NL|PL|FL|No Limit|Pot Limit|Fix Limit) (.*?) - )" // Limit and game
        R"(([\d,.]+)/([\d,.]+) - .*)"                         // Blinds
        R"(\[(.*)\]$)"                                        // Date in ET
    );

    static constexpr int HeaderIndex = 0;

    Result<std::string> lineResult = getStageLine(sections, HeaderIndex, "the header line");
    if (lineResult.isError()) {
        return lineResult.getError();
    }
    const std::string& headerLine = lineResult.getValue();

    std::smatch match;
    if (!std::regex_match(headerLine, match, HeaderRegex)) {
        return makeError(ErrorKind::MalformedHeader, "Header line does not match the Full Tilt Poker format.", HeaderIndex);
    }

    std::optional<Decimal> smallBlind = parseDecimal(match[8].str());
    std::optional<Decimal> bigBlind = parseDecimal(match[9].str());
    if (!smallBlind || !bigBlind) {
        return makeError(ErrorKind::MalformedHeader, "Could not read the blinds.", HeaderIndex);
    }

    Result<Limit> limitResult = getLimitFromName(match[6].str());
    if (limitResult.isError()) {
        return atFragment(limitResult.getError(), HeaderIndex);
    }

    Result<Game> gameResult = getGameFromName(match[7].str());
    if (gameResult.isError()) {
        return atFragment(gameResult.getError(), HeaderIndex);
    }

    Result<UtcTime> dateResult = parseLocalDateToUtc(match[10].str(), getDateFormat(), getTimeZone());
    if (dateResult.isError()) {
        return atFragment(dateResult.getError(), HeaderIndex);
    }

    std::string tournamentName = match[2].str();
    std::string buyinText = match[3].str();

    record.ident = match[1].str();
    record.smallBlind = *smallBlind;
    record.bigBlind = *bigBlind;
    record.limit = limitResult.getValue();
    record.game = gameResult.getValue();
    record.date = dateResult.getValue();
    record.gameType = (tournamentName.find("Sit & Go") != std::string::npos) ? GameType::SitAndGo : GameType::Tournament;
    record.currency = (tournamentName.find('$') != std::string::npos) ? std::optional<Currency>{ Currency::USD } : std::nullopt;
    record.buyin = buyinText.empty() ? std::nullopt : parseDecimal(buyinText);
    record.rake = std::nullopt;
    record.tournamentIdent = match[4].str();
    record.tournamentLevel = std::nullopt;
    record.tableName = match[5].str();
    record.extra["tournament_name"] = tournamentName;

    return {};
}

Result<void> FullTiltPoker::parseTable(const SectionSplit&, HandRecord& record) const {
    // The table is part of the header line
    if (record.tableName.empty()) {
        return makeError(ErrorKind::MalformedHeader, "Header did not name the table.", 0);
    }
    return {};
}

Result<void> FullTiltPoker::parsePlayers(const SectionSplit& sections, HandRecord& record) const {
    static const std::regex SeatRegex(R"(^Seat (\d+): (.*) \(([\d,]+)\)$)");

    std::vector<Player> players = initSeats(m_settings.maxSeats);
    int lastSeat = 0;

    for (int i = 1; i < sections.size(); ++i) {
        const std::string& line = sections.fragments[i];

        std::smatch match;
        if (!std::regex_match(line, match, SeatRegex)) {
            break;
        }

        std::optional<int> seat = parseInt(match[1].str());
        if (!seat || *seat < 1 || *seat > m_settings.maxSeats) {
            return malformedLine("Seat number in \"" + line + "\" is outside of the table.", i);
        }

        std::optional<int> stack = parseChipCount(match[3].str());
        if (!stack) {
            return malformedLine("Could not read the stack in \"" + line + "\".", i);
        }

        players[*seat - 1] = Player{ .name = match[2].str(), .stack = *stack, .seat = *seat, .combo = std::nullopt };
        lastSeat = *seat;
    }

    if (lastSeat == 0) {
        return malformedLine("No seat lines follow the header.", 1);
    }

    // Seats after the last listed one do not exist at this table
    players.resize(lastSeat);
    record.maxPlayers = lastSeat;
    record.players = players;
    return {};
}

Result<void> FullTiltPoker::parseButton(const SectionSplit& sections, HandRecord& record) const {
    static const std::regex ButtonRegex(R"(^The button is in seat #(\d+)$)");

    std::optional<int> holeCardsBoundary = sections.firstBoundary();
    if (!holeCardsBoundary || *holeCardsBoundary < 1) {
        return malformedLine("Hand history has no hole cards section.", 0);
    }

    int index = *holeCardsBoundary - 1;
    Result<std::string> lineResult = getStageLine(sections, index, "the button line");
    if (lineResult.isError()) {
        return lineResult.getError();
    }
    const std::string& line = lineResult.getValue();

    std::smatch match;
    if (!std::regex_match(line, match, ButtonRegex)) {
        return malformedLine("Expected the button line, found \"" + line + "\".", index);
    }

    std::optional<int> buttonSeat = parseInt(match[1].str());
    for (std::size_t i = 0; i < record.players.size(); ++i) {
        if (buttonSeat && record.players[i].seat == *buttonSeat) {
            record.buttonIndex = i;
            return {};
        }
    }

    return malformedLine("The button is on a seat that was not listed.", index);
}

Result<void> FullTiltPoker::parseHero(const SectionSplit& sections, HandRecord& record) const {
    static const std::regex HeroRegex(R"(^Dealt to (.+) \[(\S\S) (\S\S)\]$)");

    std::optional<int> holeCardsBoundary = sections.firstBoundary();
    if (!holeCardsBoundary) {
        return malformedLine("Hand history has no hole cards section.", 0);
    }

    int index = *holeCardsBoundary + 2;
    Result<std::string> lineResult = getStageLine(sections, index, "the hole cards line");
    if (lineResult.isError()) {
        return lineResult.getError();
    }
    const std::string& line = lineResult.getValue();

    std::smatch match;
    if (!std::regex_match(line, match, HeroRegex)) {
        return malformedLine("Expected the hole cards line, found \"" + line + "\".", index);
    }

    Result<std::size_t> heroResult = findPlayerIndex(record, match[1].str());
    if (heroResult.isError()) {
        return atFragment(heroResult.getError(), index);
    }

    Result<Combo> comboResult = getComboFromName(match[2].str() + match[3].str());
    if (comboResult.isError()) {
        return atFragment(comboResult.getError(), index);
    }

    // The button is an index into the same list, so it sees the combo too
    std::size_t heroIndex = heroResult.getValue();
    record.players[heroIndex].combo = comboResult.getValue();
    record.heroIndex = heroIndex;
    return {};
}

Result<void> FullTiltPoker::parsePreflop(const SectionSplit& sections, HandRecord& record) const {
    std::optional<int> holeCardsBoundary = sections.firstBoundary();
    if (!holeCardsBoundary) {
        return malformedLine("Hand history has no hole cards section.", 0);
    }

    std::optional<int> stop = sections.nextBoundaryAfter(*holeCardsBoundary);
    if (!stop) {
        return malformedLine("Preflop actions are not followed by another section.", *holeCardsBoundary);
    }

    Result<std::vector<PlayerAction>> actionsResult = fulltilt::parseActionLines(sections, *holeCardsBoundary + 3, *stop, record.players);
    if (actionsResult.isError()) {
        return actionsResult.getError();
    }

    record.preflopActions = actionsResult.getValue();
    return {};
}

Result<void> FullTiltPoker::parseStreet(Street street, const SectionSplit& sections, HandRecord& record) const {
    static const std::regex StreetLineRegex(R"(\[([^\]]*)\] \(Total Pot: ([\d,.]+), (\d+) Players?)");

    std::optional<int> markerIndex = sections.findFragment(getStreetMarker(street));
    if (!markerIndex) {
        // Hand ended before this street
        record.streets[street] = std::nullopt;
        return {};
    }

    int lineIndex = *markerIndex + 1;
    Result<std::string> lineResult = getStageLine(sections, lineIndex, "the " + getStreetName(street) + " line");
    if (lineResult.isError()) {
        return lineResult.getError();
    }
    const std::string& line = lineResult.getValue();

    std::smatch match;
    if (!std::regex_search(line, match, StreetLineRegex)) {
        return malformedLine("Expected the " + getStreetName(street) + " cards and pot, found \"" + line + "\".", lineIndex);
    }

    Result<std::vector<Card>> cardsResult = parseCardList(match[1].str(), lineIndex);
    if (cardsResult.isError()) {
        return cardsResult.getError();
    }

    const std::vector<Card>& cards = cardsResult.getValue();
    if (static_cast<int>(cards.size()) != getStreetCardCount(street)) {
        return malformedLine("Wrong number of cards dealt on the " + getStreetName(street) + ".", lineIndex);
    }

    std::optional<Decimal> pot = parseDecimal(match[2].str());
    std::optional<int> numPlayers = parseInt(match[3].str());
    if (!pot || !numPlayers) {
        return malformedLine("Could not read the pot or the number of players.", lineIndex);
    }

    std::optional<int> stop = sections.nextBoundaryAfter(lineIndex);
    if (!stop) {
        return malformedLine("The " + getStreetName(street) + " is not followed by another section.", lineIndex);
    }

    Result<std::vector<PlayerAction>> actionsResult = fulltilt::parseActionLines(sections, lineIndex + 1, *stop, record.players);
    if (actionsResult.isError()) {
        return actionsResult.getError();
    }

    record.streets[street] = StreetTexture(cards, actionsResult.getValue(), pot, numPlayers);
    return {};
}

Result<void> FullTiltPoker::parseShowdown(const SectionSplit& sections, HandRecord& record) const {
    record.showdown = sections.findFragment("SHOW DOWN").has_value();
    return {};
}

Result<int> FullTiltPoker::getSummaryStart(const SectionSplit& sections) const {
    std::optional<int> summaryBoundary = sections.lastBoundary();
    if (!summaryBoundary) {
        return malformedLine("Hand history has no summary section.", 0);
    }

    int markerIndex = *summaryBoundary + 1;
    if (markerIndex >= sections.size() || sections.fragments[markerIndex] != "SUMMARY") {
        return malformedLine("Expected the summary marker.", markerIndex);
    }

    return *summaryBoundary;
}

bool FullTiltPoker::hasSummaryBoardLine(const SectionSplit& sections, int summaryStart) const {
    int index = summaryStart + 3;
    return (index < sections.size()) && sections.fragments[index].starts_with("Board");
}

Result<void> FullTiltPoker::parsePot(const SectionSplit& sections, HandRecord& record) const {
    static const std::regex PotRegex(R"(^Total pot ([\d,.]+) .*\| Rake ([\d,.]+)$)");

    Result<int> summaryResult = getSummaryStart(sections);
    if (summaryResult.isError()) {
        return summaryResult.getError();
    }

    int index = summaryResult.getValue() + 2;
    Result<std::string> lineResult = getStageLine(sections, index, "the total pot line");
    if (lineResult.isError()) {
        return lineResult.getError();
    }
    const std::string& line = lineResult.getValue();

    std::smatch match;
    if (!std::regex_match(line, match, PotRegex)) {
        return malformedLine("Expected the total pot line, found \"" + line + "\".", index);
    }

    std::optional<Decimal> totalPot = parseDecimal(match[1].str());
    std::optional<Decimal> rake = parseDecimal(match[2].str());
    if (!totalPot || !rake) {
        return malformedLine("Could not read the total pot or the rake.", index);
    }

    record.totalPot = *totalPot;
    record.rake = *rake;
    return {};
}

Result<void> FullTiltPoker::parseBoard(const SectionSplit& sections, HandRecord& record) const {
    Result<int> summaryResult = getSummaryStart(sections);
    if (summaryResult.isError()) {
        return summaryResult.getError();
    }

    int summaryStart = summaryResult.getValue();
    if (!hasSummaryBoardLine(sections, summaryStart)) {
        record.summaryBoard = std::nullopt;
        return {};
    }

    int index = summaryStart + 3;
    const std::string& line = sections.fragments[index];
    std::size_t open = line.find('[');
    std::size_t close = line.find(']', open);
    if (open == std::string::npos || close == std::string::npos) {
        return malformedLine("Expected the board cards in \"" + line + "\".", index);
    }

    Result<std::vector<Card>> cardsResult = parseCardList(line.substr(open + 1, close - open - 1), index);
    if (cardsResult.isError()) {
        return cardsResult.getError();
    }

    // The board itself is derived from the streets, the summary must agree with it
    std::optional<std::vector<Card>> dealtBoard = getBoard(record);
    if (!dealtBoard || *dealtBoard != cardsResult.getValue()) {
        return malformedLine("Summary board does not match the cards dealt on the streets.", index);
    }

    record.summaryBoard = cardsResult.getValue();
    return {};
}

Result<void> FullTiltPoker::parseWinners(const SectionSplit& sections, HandRecord& record) const {
    Result<int> summaryResult = getSummaryStart(sections);
    if (summaryResult.isError()) {
        return summaryResult.getError();
    }

    int summaryStart = summaryResult.getValue();
    int start = summaryStart + (hasSummaryBoardLine(sections, summaryStart) ? 4 : 3);

    Result<std::set<std::string>> winnersResult = record.showdown
        ? fulltilt::collectWinnersAtShowdown(sections, start, record.players)
        : fulltilt::collectWinnersWithoutShowdown(sections, start, record.players);
    if (winnersResult.isError()) {
        return winnersResult.getError();
    }

    record.winners = winnersResult.getValue();
    return {};
}

Result<void> FullTiltPoker::parseExtra(const SectionSplit& sections, HandRecord& record) const {
    static const std::regex PostRegex(R"(^(.+) posts (?:the )?(small blind|big blind|an ante) of ([\d,.]+)$)");

    std::optional<int> holeCardsBoundary = sections.firstBoundary();
    if (!holeCardsBoundary) {
        return malformedLine("Hand history has no hole cards section.", 0);
    }

    // Blind and ante posts sit between the seats and the button line
    for (int i = 1; i < *holeCardsBoundary; ++i) {
        const std::string& line = sections.fragments[i];

        std::smatch match;
        if (!std::regex_match(line, match, PostRegex)) {
            continue;
        }

        std::string postType = match[2].str();
        if (postType == "small blind") {
            record.extra["small_blind_player"] = match[1].str();
        }
        else if (postType == "big blind") {
            record.extra["big_blind_player"] = match[1].str();
        }
        else {
            record.extra["ante"] = match[3].str();
        }
    }

    return {};
}
