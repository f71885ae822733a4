#include "history/hand_history.hpp"

#include "history/hand_record.hpp"
#include "history/room_parser.hpp"
#include "history/section_splitter.hpp"
#include "io/hand_file.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cassert>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

std::string getParseStageName(ParseStage stage) {
    switch (stage) {
        case ParseStage::Unparsed:
            return "unparsed";
        case ParseStage::HeaderParsed:
            return "header";
        case ParseStage::Table:
            return "table";
        case ParseStage::Players:
            return "players";
        case ParseStage::Button:
            return "button";
        case ParseStage::Hero:
            return "hero";
        case ParseStage::Preflop:
            return "preflop";
        case ParseStage::Flop:
            return "flop";
        case ParseStage::Turn:
            return "turn";
        case ParseStage::River:
            return "river";
        case ParseStage::Showdown:
            return "showdown";
        case ParseStage::Pot:
            return "pot";
        case ParseStage::Board:
            return "board";
        case ParseStage::Winners:
            return "winners";
        case ParseStage::Extra:
            return "extra";
        case ParseStage::Parsed:
            return "parsed";
        default:
            assert(false);
            return "";
    }
}

HandHistory::HandHistory(std::shared_ptr<const IRoomParser> room, const std::string& handText) :
    m_room{ std::move(room) },
    m_rawText{ trim(removeCharacter(handText, '\r')) },
    m_stage{ ParseStage::Unparsed } {
    assert(m_room != nullptr);
    m_sections = splitSections(m_rawText, m_room->getSectionDelimiter());
}

Result<HandHistory> HandHistory::fromFile(std::shared_ptr<const IRoomParser> room, const std::string& filePath) {
    Result<std::string> textResult = readTextFile(filePath);
    if (textResult.isError()) {
        return textResult.getError();
    }
    return HandHistory(std::move(room), textResult.getValue());
}

Result<void> HandHistory::parseHeader() {
    if (m_failure) {
        return *m_failure;
    }

    if (isHeaderParsed()) {
        return {};
    }

    return runStage(ParseStage::HeaderParsed, [this]() { return m_room->parseHeader(m_sections, m_record); });
}

Result<void> HandHistory::parse() {
    if (m_failure) {
        return *m_failure;
    }

    if (isParsed()) {
        return {};
    }

    Result<void> headerResult = parseHeader();
    if (headerResult.isError()) {
        return headerResult;
    }

    const IRoomParser& room = *m_room;
    const SectionSplit& sections = m_sections;
    HandRecord& record = m_record;

    struct StageStep {
        ParseStage stage;
        std::function<Result<void>()> function;
    };

    const std::vector<StageStep> steps = {
        { ParseStage::Table, [&]() { return room.parseTable(sections, record); } },
        { ParseStage::Players, [&]() { return room.parsePlayers(sections, record); } },
        { ParseStage::Button, [&]() { return room.parseButton(sections, record); } },
        { ParseStage::Hero, [&]() { return room.parseHero(sections, record); } },
        { ParseStage::Preflop, [&]() { return room.parsePreflop(sections, record); } },
        { ParseStage::Flop, [&]() { return room.parseStreet(Street::Flop, sections, record); } },
        { ParseStage::Turn, [&]() { return room.parseStreet(Street::Turn, sections, record); } },
        { ParseStage::River, [&]() { return room.parseStreet(Street::River, sections, record); } },
        { ParseStage::Showdown, [&]() { return room.parseShowdown(sections, record); } },
        { ParseStage::Pot, [&]() { return room.parsePot(sections, record); } },
        { ParseStage::Board, [&]() { return room.parseBoard(sections, record); } },
        { ParseStage::Winners, [&]() { return room.parseWinners(sections, record); } },
        { ParseStage::Extra, [&]() { return room.parseExtra(sections, record); } }
    };

    for (const StageStep& step : steps) {
        Result<void> stageResult = runStage(step.stage, step.function);
        if (stageResult.isError()) {
            return stageResult;
        }
    }

    // Fragments are not needed once every stage has run
    m_sections = SectionSplit{};
    m_stage = ParseStage::Parsed;
    return {};
}

Result<void> HandHistory::runStage(ParseStage stage, const std::function<Result<void>()>& stageFunction) {
    Result<void> stageResult = stageFunction();
    if (stageResult.isError()) {
        Error error = stageResult.getError();
        if (error.stage.empty()) {
            error.stage = getParseStageName(stage);
        }
        m_failure = error;
        return error;
    }

    m_stage = stage;
    return {};
}

ParseStage HandHistory::getStage() const {
    return m_stage;
}

bool HandHistory::isHeaderParsed() const {
    return m_stage >= ParseStage::HeaderParsed;
}

bool HandHistory::isParsed() const {
    return m_stage == ParseStage::Parsed;
}

bool HandHistory::hasFailed() const {
    return m_failure.has_value();
}

const IRoomParser& HandHistory::getRoom() const {
    return *m_room;
}

const std::string& HandHistory::getRawText() const {
    return m_rawText;
}

const SectionSplit& HandHistory::getSections() const {
    return m_sections;
}

const HandRecord& HandHistory::getRecord() const {
    return m_record;
}

std::optional<Player> HandHistory::getPlayerAt(std::optional<std::size_t> index) const {
    if (!index || *index >= m_record.players.size()) {
        return std::nullopt;
    }
    return m_record.players[*index];
}

std::optional<Player> HandHistory::getButton() const {
    return getPlayerAt(m_record.buttonIndex);
}

std::optional<Player> HandHistory::getHero() const {
    return getPlayerAt(m_record.heroIndex);
}

const std::optional<StreetTexture>& HandHistory::getFlop() const {
    return m_record.streets[Street::Flop];
}

std::optional<Card> HandHistory::getTurn() const {
    return getStreetCard(m_record, Street::Turn);
}

std::optional<Card> HandHistory::getRiver() const {
    return getStreetCard(m_record, Street::River);
}

std::optional<std::vector<Card>> HandHistory::getBoard() const {
    return ::getBoard(m_record);
}
