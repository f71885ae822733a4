#ifndef HISTORY_COMMANDS_HPP
#define HISTORY_COMMANDS_HPP

#include "cli/cli_dispatcher.hpp"
#include "history/hand_history.hpp"
#include "history/room_parser.hpp"
#include "room/room_settings.hpp"

#include <memory>
#include <optional>
#include <string>

struct ParserContext {
    std::string roomName;
    RoomSettings roomSettings;
    std::shared_ptr<const IRoomParser> room;
    std::optional<HandHistory> hand;
    int jsonIndent;
    int numThreads;
};

// Full Tilt with its default seat count, used until a settings file is loaded
ParserContext makeDefaultParserContext();

bool registerAllCommands(CliDispatcher& dispatcher, ParserContext& context);

#endif // HISTORY_COMMANDS_HPP
