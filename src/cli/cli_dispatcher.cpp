#include "cli/cli_dispatcher.hpp"

#include "util/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {
constexpr int MaxScriptDepth = 8;

bool isVisibleName(const std::string& name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), [](char c) { return std::isgraph(static_cast<unsigned char>(c)); });
}
} // namespace

CliDispatcher::CliDispatcher(const std::string& programName, const Version& version) :
    m_programName{ programName },
    m_version{ version },
    m_isRunning{ false },
    m_scriptDepth{ 0 } {
    registerCommand("help", "Prints this help page.", [this]() { return handleHelp(); });
    registerCommand("source", "file", "Runs the commands listed in a file, one per line.", [this](const std::string& filePath) { return runScript(filePath); });
    registerCommand("exit", "Exits the program.", [this]() { return handleExit(); });
}

bool CliDispatcher::addCommand(const std::string& name, Command command) {
    if (!isVisibleName(name) || m_commands.contains(name)) {
        return false;
    }

    m_commandOrder.push_back(name);
    m_commands.emplace(name, std::move(command));
    return true;
}

bool CliDispatcher::registerCommand(const std::string& name, const std::string& description, const HandlerWithoutArgument& handler) {
    return addCommand(name, Command{ .description = description, .argument = std::nullopt, .handler = handler });
}

bool CliDispatcher::registerCommand(const std::string& name, const std::string& argument, const std::string& description, const HandlerWithArgument& handler) {
    return addCommand(name, Command{ .description = description, .argument = argument, .handler = handler });
}

void CliDispatcher::run(std::istream& input) {
    m_isRunning = true;

    std::cout << m_programName << " " << m_version.major << "." << m_version.minor << "." << m_version.patch << "\n";
    std::cout << "Type \"help\" for more information.\n";

    std::string line;
    while (m_isRunning) {
        std::cout << "> " << std::flush;
        if (!std::getline(input, line)) {
            std::cout << "\n";
            break;
        }
        runCommand(line);
    }

    m_isRunning = false;
}

bool CliDispatcher::runCommand(const std::string& commandLine) {
    std::string trimmed = trim(commandLine);
    if (trimmed.empty() || trimmed.starts_with('#')) {
        return true;
    }

    // Paths may contain spaces, so the argument is the rest of the line
    std::size_t nameEnd = trimmed.find(' ');
    std::string name = trimmed.substr(0, nameEnd);
    std::string argument = (nameEnd == std::string::npos) ? "" : trim(trimmed.substr(nameEnd + 1));

    auto it = m_commands.find(name);
    if (it == m_commands.end()) {
        std::cerr << "Error: Unknown command \"" << name << "\". Type \"help\" for a list of commands.\n";
        return false;
    }

    const Command& command = it->second;
    if (const auto* handler = std::get_if<HandlerWithoutArgument>(&command.handler)) {
        if (!argument.empty()) {
            std::cerr << "Error: " << name << " does not take an argument.\n";
            return false;
        }
        return (*handler)();
    }

    if (argument.empty()) {
        std::cerr << "Error: " << name << " expects <" << command.argument.value_or("argument") << ">.\n";
        return false;
    }
    return std::get<HandlerWithArgument>(command.handler)(argument);
}

bool CliDispatcher::runScript(const std::string& filePath) {
    if (m_scriptDepth >= MaxScriptDepth) {
        std::cerr << "Error: Scripts are nested too deeply, stopping at " << filePath << ".\n";
        return false;
    }

    std::ifstream file(filePath);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open script " << filePath << ".\n";
        return false;
    }

    ++m_scriptDepth;
    bool success = true;
    int lineNumber = 0;
    std::string line;
    while (success && std::getline(file, line)) {
        ++lineNumber;
        success = runCommand(removeCharacter(line, '\r'));
        if (!success) {
            std::cerr << "Error: Script " << filePath << " stopped at line " << lineNumber << ".\n";
        }
    }
    --m_scriptDepth;

    return success;
}

bool CliDispatcher::handleHelp() const {
    std::vector<std::string> usages;
    std::size_t width = 0;
    for (const std::string& name : m_commandOrder) {
        const Command& command = m_commands.at(name);
        std::string usage = command.argument ? (name + " <" + *command.argument + ">") : name;
        width = std::max(width, usage.size());
        usages.push_back(usage);
    }

    std::cout << m_programName << " commands:\n";
    for (std::size_t i = 0; i < m_commandOrder.size(); ++i) {
        std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << usages[i]
            << "  " << m_commands.at(m_commandOrder[i]).description << "\n";
    }
    return true;
}

bool CliDispatcher::handleExit() {
    m_isRunning = false;
    return true;
}
