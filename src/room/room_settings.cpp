#include "room/room_settings.hpp"

#include "history/room_parser.hpp"
#include "room/full_tilt_poker.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <memory>
#include <string>

Result<std::shared_ptr<const IRoomParser>> makeRoomParser(const std::string& roomName, const RoomSettings& settings) {
    std::string normalized = toLowerCase(trim(roomName));

    if (settings.maxSeats < 2 || settings.maxSeats > 10) {
        return makeError(ErrorKind::InvalidState, "Maximum seat count must be between 2 and 10.");
    }

    if (normalized == "fulltilt" || normalized == "ftp" || normalized == "full-tilt-poker") {
        std::shared_ptr<const IRoomParser> room = std::make_shared<FullTiltPoker>(settings);
        return room;
    }

    return makeError(ErrorKind::UnknownEnumerationValue, "\"" + roomName + "\" is not a supported poker room.");
}
