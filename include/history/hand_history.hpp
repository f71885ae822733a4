#ifndef HAND_HISTORY_HPP
#define HAND_HISTORY_HPP

#include "cards/card_types.hpp"
#include "history/hand_record.hpp"
#include "history/hand_types.hpp"
#include "history/room_parser.hpp"
#include "history/section_splitter.hpp"
#include "history/street_texture.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class ParseStage : std::uint8_t {
    Unparsed,
    HeaderParsed,
    Table,
    Players,
    Button,
    Hero,
    Preflop,
    Flop,
    Turn,
    River,
    Showdown,
    Pot,
    Board,
    Winners,
    Extra,
    Parsed
};

std::string getParseStageName(ParseStage stage);

class HandHistory {
public:
    HandHistory(std::shared_ptr<const IRoomParser> room, const std::string& handText);

    static Result<HandHistory> fromFile(std::shared_ptr<const IRoomParser> room, const std::string& filePath);

    // Both are idempotent. After a failure they keep returning that failure.
    Result<void> parseHeader();
    Result<void> parse();

    ParseStage getStage() const;
    bool isHeaderParsed() const;
    bool isParsed() const;
    bool hasFailed() const;

    const IRoomParser& getRoom() const;
    const std::string& getRawText() const;
    const SectionSplit& getSections() const;
    const HandRecord& getRecord() const;

    std::optional<Player> getButton() const;
    std::optional<Player> getHero() const;
    const std::optional<StreetTexture>& getFlop() const;
    std::optional<Card> getTurn() const;
    std::optional<Card> getRiver() const;
    std::optional<std::vector<Card>> getBoard() const;

private:
    Result<void> runStage(ParseStage stage, const std::function<Result<void>()>& stageFunction);
    std::optional<Player> getPlayerAt(std::optional<std::size_t> index) const;

    std::shared_ptr<const IRoomParser> m_room;
    std::string m_rawText;
    SectionSplit m_sections;
    HandRecord m_record;
    ParseStage m_stage;
    std::optional<Error> m_failure;
};

#endif // HAND_HISTORY_HPP
