#ifndef ROOM_PARSER_HPP
#define ROOM_PARSER_HPP

#include "history/hand_record.hpp"
#include "history/hand_types.hpp"
#include "history/section_splitter.hpp"
#include "util/date_utils.hpp"
#include "util/result.hpp"

#include <regex>
#include <string>

// Grammar of one poker room. Every stage reads the split text and fills in
// its part of the record. Implementations hold no per-hand state, so one
// instance can serve any number of hands.
class IRoomParser {
public:
    virtual ~IRoomParser() = default;

    // Room description
    virtual std::string getRoomName() const = 0;
    virtual const std::regex& getSectionDelimiter() const = 0;
    virtual std::string getDateFormat() const = 0;
    virtual TimeZoneRule getTimeZone() const = 0;

    // Header only, usable without parsing the rest of the hand
    virtual Result<void> parseHeader(const SectionSplit& sections, HandRecord& record) const = 0;

    // Body stages, called in this order
    virtual Result<void> parseTable(const SectionSplit& sections, HandRecord& record) const = 0;
    virtual Result<void> parsePlayers(const SectionSplit& sections, HandRecord& record) const = 0;
    virtual Result<void> parseButton(const SectionSplit& sections, HandRecord& record) const = 0;
    virtual Result<void> parseHero(const SectionSplit& sections, HandRecord& record) const = 0;
    virtual Result<void> parsePreflop(const SectionSplit& sections, HandRecord& record) const = 0;
    virtual Result<void> parseStreet(Street street, const SectionSplit& sections, HandRecord& record) const = 0;
    virtual Result<void> parseShowdown(const SectionSplit& sections, HandRecord& record) const = 0;
    virtual Result<void> parsePot(const SectionSplit& sections, HandRecord& record) const = 0;
    virtual Result<void> parseBoard(const SectionSplit& sections, HandRecord& record) const = 0;
    virtual Result<void> parseWinners(const SectionSplit& sections, HandRecord& record) const = 0;
    virtual Result<void> parseExtra(const SectionSplit& sections, HandRecord& record) const = 0;
};

#endif // ROOM_PARSER_HPP
