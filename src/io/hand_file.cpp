#include "io/hand_file.hpp"

#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

Result<std::string> readTextFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return makeError(ErrorKind::FileNotFound, "Could not open " + filePath + ".");
    }

    std::stringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

std::vector<std::string> splitHandHistories(const std::string& fileText) {
    std::vector<std::string> hands;
    std::string currentHand;
    int blankLinesInRow = 0;

    auto finishHand = [&hands, &currentHand]() {
        std::string hand = trim(currentHand);
        if (!hand.empty()) {
            hands.push_back(hand);
        }
        currentHand.clear();
    };

    for (const std::string& line : splitLines(fileText)) {
        if (trim(line).empty()) {
            ++blankLinesInRow;
            continue;
        }

        // Two blank lines end a hand, a single one can appear inside it
        if (blankLinesInRow >= 2) {
            finishHand();
        }
        else if (blankLinesInRow == 1) {
            currentHand += "\n";
        }
        blankLinesInRow = 0;

        currentHand += line;
        currentHand += "\n";
    }
    finishHand();

    return hands;
}
