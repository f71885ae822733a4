#include "history/hand_types.hpp"

#include <cassert>
#include <string>

std::string getStreetName(Street street) {
    switch (street) {
        case Street::Flop:
            return "flop";
        case Street::Turn:
            return "turn";
        case Street::River:
            return "river";
        default:
            assert(false);
            return "";
    }
}
