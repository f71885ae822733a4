#ifndef ROOM_SETTINGS_HPP
#define ROOM_SETTINGS_HPP

#include "history/room_parser.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>

struct RoomSettings {
    int maxSeats;
};

// Accepts "fulltilt", "ftp" and "full-tilt-poker"
Result<std::shared_ptr<const IRoomParser>> makeRoomParser(const std::string& roomName, const RoomSettings& settings);

#endif // ROOM_SETTINGS_HPP
