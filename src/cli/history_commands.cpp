#include "cli/history_commands.hpp"

#include "cards/card_utils.hpp"
#include "cli/cli_dispatcher.hpp"
#include "history/hand_enums.hpp"
#include "history/hand_history.hpp"
#include "history/hand_types.hpp"
#include "history/street_texture.hpp"
#include "io/hand_file.hpp"
#include "io/hand_output.hpp"
#include "room/full_tilt_poker.hpp"
#include "room/room_settings.hpp"
#include "util/date_utils.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace {
constexpr int DefaultJsonIndent = 4;
constexpr int MaxNumThreads = 64;

bool isHandLoaded(const ParserContext& context) {
    return context.hand.has_value();
}

void printNoHandError() {
    std::cerr << "Error: No hand history loaded. Please run \"load <file>\" first.\n";
}

template <typename T>
bool loadField(T& field, const YAML::Node& node, const std::vector<std::string>& indices, std::size_t depth) {
    if (!node.IsDefined() || node.IsNull()) {
        return false;
    }

    if (depth == indices.size()) {
        try {
            field = node.as<T>();
            std::cout << "Successfully loaded field " << join(indices, "::") << ".\n";
            return true;
        }
        catch (const YAML::Exception&) {
            return false;
        }
    }

    return loadField(field, node[indices[depth]], indices, depth + 1);
}

template <typename T>
bool loadFieldRequired(T& field, const YAML::Node& root, const std::vector<std::string>& indices) {
    bool success = loadField(field, root, indices, 0);
    if (!success) {
        std::cerr << "Error: Could not load field " << join(indices, "::") << ".\n";
        return false;
    }

    return true;
}

template <typename T>
void loadFieldOptional(T& field, const YAML::Node& root, const std::vector<std::string>& indices, const T& defaultValue) {
    bool success = loadField(field, root, indices, 0);
    if (!success) {
        std::cout << "Could not load field " << join(indices, "::") << ", using default.\n";
        field = defaultValue;
    }
}

void printError(const Error& error) {
    std::cerr << "Error: " << error.describe() << "\n";
}

std::string formatCards(const std::vector<Card>& cards) {
    std::vector<std::string> names;
    for (Card card : cards) {
        names.push_back(getNameFromCard(card));
    }
    return join(names, " ");
}

void printHeader(const HandHistory& hand) {
    const HandRecord& record = hand.getRecord();

    std::cout << "Room: " << hand.getRoom().getRoomName() << "\n";
    std::cout << "Hand: #" << record.ident << "\n";
    if (record.date) {
        std::cout << "Date: " << formatUtcDate(*record.date) << "\n";
    }
    std::cout << "Stakes: " << record.smallBlind << "/" << record.bigBlind << "\n";
    if (record.limit && record.game) {
        std::cout << "Game: " << getLimitName(*record.limit) << " " << getGameName(*record.game) << "\n";
    }
    if (record.gameType) {
        std::cout << "Type: " << getGameTypeName(*record.gameType);
        if (!record.tournamentIdent.empty()) {
            std::cout << " #" << record.tournamentIdent;
        }
        std::cout << "\n";
    }
    if (record.buyin) {
        std::cout << "Buy-in: " << *record.buyin;
        if (record.currency) {
            std::cout << " " << getCurrencyName(*record.currency);
        }
        std::cout << "\n";
    }
    std::cout << "Table: " << record.tableName << "\n";
}

void printActions(const std::vector<PlayerAction>& actions) {
    for (const PlayerAction& action : actions) {
        std::cout << "    " << action.name << " " << getActionTypeName(action.action);
        if (action.amount) {
            std::cout << " " << *action.amount;
        }
        std::cout << "\n";
    }
}

bool handleSettings(ParserContext& context, const std::string& argument) {
    YAML::Node input;

    try {
        input = YAML::LoadFile(argument);
    }
    catch (const YAML::Exception& e) {
        std::cerr << "Error: Could not load settings file. " << e.what() << "\n";
        return false;
    }

    std::cout << "Loading parser settings from " << argument << ":\n";

    std::string roomName;
    if (!loadFieldRequired(roomName, input, { "room" })) {
        return false;
    }

    RoomSettings roomSettings;
    loadFieldOptional(roomSettings.maxSeats, input, { "max-seats" }, fulltilt::DefaultMaxSeats);

    int jsonIndent;
    loadFieldOptional(jsonIndent, input, { "json-indent" }, DefaultJsonIndent);
    if (jsonIndent < 0) {
        std::cerr << "Error: JSON indent must not be negative.\n";
        return false;
    }

    int numThreads;
    loadFieldOptional(numThreads, input, { "num-threads" }, 1);
    if (numThreads < 1 || numThreads > MaxNumThreads) {
        std::cerr << "Error: Thread count must be between 1 and " << MaxNumThreads << ".\n";
        return false;
    }
    #ifndef _OPENMP
    if (numThreads != 1) {
        std::cout << "OpenMP is not enabled, batch parsing will use a single thread.\n";
        numThreads = 1;
    }
    #endif

    Result<std::shared_ptr<const IRoomParser>> roomResult = makeRoomParser(roomName, roomSettings);
    if (roomResult.isError()) {
        printError(roomResult.getError());
        return false;
    }

    // A loaded hand keeps the room it was loaded with
    context.roomName = roomName;
    context.roomSettings = roomSettings;
    context.room = roomResult.getValue();
    context.jsonIndent = jsonIndent;
    context.numThreads = numThreads;

    std::cout << "Successfully loaded settings for " << context.room->getRoomName() << ".\n";
    return true;
}

bool handleLoad(ParserContext& context, const std::string& argument) {
    assert(context.room != nullptr);

    Result<HandHistory> handResult = HandHistory::fromFile(context.room, argument);
    if (handResult.isError()) {
        printError(handResult.getError());
        return false;
    }

    context.hand = std::move(handResult.getValue());
    std::cout << "Loaded hand history from " << argument << " (" << context.hand->getSections().size() << " fragments).\n";
    return true;
}

bool handleHeader(ParserContext& context) {
    if (!isHandLoaded(context)) {
        printNoHandError();
        return false;
    }

    Result<void> result = context.hand->parseHeader();
    if (result.isError()) {
        printError(result.getError());
        return false;
    }

    printHeader(*context.hand);
    return true;
}

bool handleParse(ParserContext& context) {
    if (!isHandLoaded(context)) {
        printNoHandError();
        return false;
    }

    Result<void> result = context.hand->parse();
    if (result.isError()) {
        printError(result.getError());
        return false;
    }

    std::cout << "Successfully parsed hand #" << context.hand->getRecord().ident << ".\n";
    return true;
}

bool handleSummary(ParserContext& context) {
    if (!isHandLoaded(context)) {
        printNoHandError();
        return false;
    }
    if (!context.hand->isParsed()) {
        std::cerr << "Error: Hand is not parsed. Please run \"parse\" first.\n";
        return false;
    }

    const HandHistory& hand = *context.hand;
    const HandRecord& record = hand.getRecord();
    printHeader(hand);

    std::cout << "\nSeats (" << record.maxPlayers << "):\n";
    for (std::size_t i = 0; i < record.players.size(); ++i) {
        const Player& player = record.players[i];
        if (player.name.starts_with("Empty Seat")) continue;

        std::cout << "  " << player.seat << ": " << player.name << " (" << player.stack << ")";
        if (player.combo) {
            std::cout << " [" << getNameFromCombo(*player.combo) << "]";
        }
        if (record.buttonIndex == i) {
            std::cout << " button";
        }
        if (record.heroIndex == i) {
            std::cout << " hero";
        }
        std::cout << "\n";
    }

    std::cout << "\nPreflop:\n";
    printActions(record.preflopActions);

    for (Street street : { Street::Flop, Street::Turn, Street::River }) {
        const std::optional<StreetTexture>& texture = record.streets[street];
        if (!texture) continue;

        std::cout << "\n" << getStreetName(street) << " [" << formatCards(texture->getCards()) << "]";
        if (texture->getPot()) {
            std::cout << " pot " << *texture->getPot();
        }
        std::cout << ":\n";
        printActions(texture->getActions());
    }

    std::cout << "\n";
    if (std::optional<std::vector<Card>> board = hand.getBoard()) {
        std::cout << "Board: " << formatCards(*board) << "\n";
    }
    if (record.totalPot) {
        std::cout << "Total pot: " << *record.totalPot;
        if (record.rake) {
            std::cout << " (rake " << *record.rake << ")";
        }
        std::cout << "\n";
    }
    std::cout << "Showdown: " << (record.showdown ? "yes" : "no") << "\n";
    std::cout << "Winners: " << join(std::vector<std::string>(record.winners.begin(), record.winners.end()), ", ") << "\n";
    return true;
}

bool handleTexture(ParserContext& context) {
    if (!isHandLoaded(context)) {
        printNoHandError();
        return false;
    }
    if (!context.hand->isParsed()) {
        std::cerr << "Error: Hand is not parsed. Please run \"parse\" first.\n";
        return false;
    }

    const HandRecord& record = context.hand->getRecord();
    bool printedAny = false;
    for (Street street : { Street::Flop, Street::Turn, Street::River }) {
        const std::optional<StreetTexture>& texture = record.streets[street];
        if (!texture) continue;
        printedAny = true;

        auto flag = [](bool value) { return value ? "yes" : "no"; };
        std::cout << getStreetName(street) << " [" << formatCards(texture->getCards()) << "]\n";
        std::cout << "  rainbow: " << flag(texture->isRainbow()) << ", monotone: " << flag(texture->isMonotone())
            << ", triplet: " << flag(texture->isTriplet()) << ", pair: " << flag(texture->hasPair()) << "\n";
        std::cout << "  flush draw: " << flag(texture->hasFlushDraw()) << ", straight draw: " << flag(texture->hasStraightDraw())
            << ", gutshot: " << flag(texture->hasGutshot()) << "\n";
        if (texture->getPlayers()) {
            std::cout << "  players: " << join(*texture->getPlayers(), ", ") << "\n";
        }
    }

    if (!printedAny) {
        std::cout << "No flop was dealt.\n";
    }
    return true;
}

bool handleExport(ParserContext& context, const std::string& argument) {
    if (!isHandLoaded(context)) {
        printNoHandError();
        return false;
    }

    Result<void> result = outputHandToJSON(*context.hand, argument, context.jsonIndent);
    if (result.isError()) {
        printError(result.getError());
        return false;
    }

    std::cout << "Successfully exported hand to " << argument << ".\n";
    return true;
}

bool handleBatch(ParserContext& context, const std::string& argument) {
    assert(context.room != nullptr);

    Result<std::string> textResult = readTextFile(argument);
    if (textResult.isError()) {
        printError(textResult.getError());
        return false;
    }

    std::vector<std::string> handTexts = splitHandHistories(textResult.getValue());
    int numHands = static_cast<int>(handTexts.size());
    std::vector<std::optional<Error>> failures(handTexts.size());

    // Each hand owns its state, only the stateless room is shared
    #ifdef _OPENMP
    omp_set_num_threads(context.numThreads);
    std::cout << "Parsing " << numHands << " hands with " << context.numThreads << " threads...\n" << std::flush;
    #pragma omp parallel for schedule(dynamic)
    #else
    std::cout << "Parsing " << numHands << " hands...\n" << std::flush;
    #endif
    for (int i = 0; i < numHands; ++i) {
        HandHistory hand(context.room, handTexts[i]);
        Result<void> result = hand.parse();
        if (result.isError()) {
            failures[i] = result.getError();
        }
    }

    int numFailed = 0;
    for (int i = 0; i < numHands; ++i) {
        if (failures[i]) {
            ++numFailed;
            std::cerr << "Error: Hand " << (i + 1) << ": " << failures[i]->describe() << "\n";
        }
    }

    std::cout << "Parsed " << (numHands - numFailed) << " of " << numHands << " hands.\n";
    return numFailed == 0;
}

bool handleSetNumThreads(ParserContext& context, const std::string& argument) {
    #ifdef _OPENMP
    std::optional<int> numThreadsOption = parseInt(argument);
    if (!numThreadsOption) {
        std::cerr << "Error: Thread count must be an integer.\n";
        return false;
    }

    int numThreads = *numThreadsOption;
    if (numThreads < 1 || numThreads > MaxNumThreads) {
        std::cerr << "Error: Thread count must be between 1 and " << MaxNumThreads << ".\n";
        return false;
    }

    context.numThreads = numThreads;
    std::cout << "Successfully set number of threads to " << numThreads << ".\n";
    return true;
    #else
    (void)argument;
    context.numThreads = 1;
    std::cerr << "Error: OpenMP is not enabled, ignoring. Only single-threaded mode is supported.\n";
    return false;
    #endif
}
} // namespace

ParserContext makeDefaultParserContext() {
    static const std::string DefaultRoomName = "fulltilt";
    RoomSettings roomSettings{ .maxSeats = fulltilt::DefaultMaxSeats };

    Result<std::shared_ptr<const IRoomParser>> roomResult = makeRoomParser(DefaultRoomName, roomSettings);
    assert(roomResult.isValue());

    return {
        .roomName = DefaultRoomName,
        .roomSettings = roomSettings,
        .room = roomResult.getValue(),
        .hand = std::nullopt,
        .jsonIndent = DefaultJsonIndent,
        .numThreads = 1
    };
}

bool registerAllCommands(CliDispatcher& dispatcher, ParserContext& context) {
    bool success = true;

    success &= dispatcher.registerCommand(
        "settings",
        "file",
        "Loads parser settings (room, seats, JSON indent, threads) from a YAML file.",
        [&context](const std::string& argument) { return handleSettings(context, argument); }
    );

    success &= dispatcher.registerCommand(
        "load",
        "file",
        "Loads a single hand history from a text file.",
        [&context](const std::string& argument) { return handleLoad(context, argument); }
    );

    success &= dispatcher.registerCommand(
        "header",
        "Parses and prints the header of the loaded hand.",
        [&context]() { return handleHeader(context); }
    );

    success &= dispatcher.registerCommand(
        "parse",
        "Parses the loaded hand completely.",
        [&context]() { return handleParse(context); }
    );

    success &= dispatcher.registerCommand(
        "summary",
        "Prints seats, actions, board, pot and winners of the parsed hand.",
        [&context]() { return handleSummary(context); }
    );

    success &= dispatcher.registerCommand(
        "texture",
        "Prints the board texture of every dealt street.",
        [&context]() { return handleTexture(context); }
    );

    success &= dispatcher.registerCommand(
        "export",
        "file",
        "Writes the loaded hand to a JSON file.",
        [&context](const std::string& argument) { return handleExport(context, argument); }
    );

    success &= dispatcher.registerCommand(
        "batch",
        "file",
        "Parses every hand in a multi-hand file and reports failures.",
        [&context](const std::string& argument) { return handleBatch(context, argument); }
    );

    success &= dispatcher.registerCommand(
        "threads",
        "count",
        "Sets the number of threads used by batch parsing.",
        [&context](const std::string& argument) { return handleSetNumThreads(context, argument); }
    );

    return success;
}
