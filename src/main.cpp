#include "cli/cli_dispatcher.hpp"
#include "cli/history_commands.hpp"

#include <iostream>

int main(int argc, char** argv) {
    CliDispatcher dispatcher("HandHistoryParser", Version{ .major = 1, .minor = 0, .patch = 0 });
    ParserContext context = makeDefaultParserContext();
    if (!registerAllCommands(dispatcher, context)) {
        std::cerr << "Error: Could not register the parser commands.\n";
        return 1;
    }

    // Each argument is one command, e.g. HandHistoryParser "load hand.txt" parse summary
    if (argc > 1) {
        for (int i = 1; i < argc; ++i) {
            if (!dispatcher.runCommand(argv[i])) {
                return 1;
            }
        }
        return 0;
    }

    dispatcher.run(std::cin);

    return 0;
}
