#ifndef CLI_DISPATCHER_HPP
#define CLI_DISPATCHER_HPP

#include <functional>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using HandlerWithoutArgument = std::function<bool()>;
using HandlerWithArgument = std::function<bool(const std::string&)>;

struct Version {
    int major;
    int minor;
    int patch;
};

class CliDispatcher {
public:
    CliDispatcher(const std::string& programName, const Version& version);

    bool registerCommand(const std::string& name, const std::string& description, const HandlerWithoutArgument& handler);
    bool registerCommand(const std::string& name, const std::string& argument, const std::string& description, const HandlerWithArgument& handler);

    // Prompts until "exit" or the end of the input
    void run(std::istream& input);

    // Returns false if the command is unknown, misused or fails
    bool runCommand(const std::string& commandLine);

    // Runs commands from a file, stopping at the first failing one
    bool runScript(const std::string& filePath);

private:
    struct Command {
        std::string description;
        std::optional<std::string> argument;
        std::variant<HandlerWithoutArgument, HandlerWithArgument> handler;
    };

    bool addCommand(const std::string& name, Command command);
    bool handleHelp() const;
    bool handleExit();

    std::string m_programName;
    Version m_version;
    bool m_isRunning;
    int m_scriptDepth;
    std::vector<std::string> m_commandOrder;
    std::map<std::string, Command> m_commands;
};

#endif // CLI_DISPATCHER_HPP
