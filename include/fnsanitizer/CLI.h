#ifndef FNSANITIZER_CLI_H
#define FNSANITIZER_CLI_H

#include "fnsanitizer/Types.h"
#include <string>
#include <vector>
#include <functional>
#include <map>

namespace fns {

/**
 * Command-line interface handler for fnsanitizer
 */
class CLI {
public:
    // Command handler function type
    using CommandHandler = std::function<int(const std::vector<std::string>& args)>;

    CLI();
    ~CLI() = default;

    /**
     * Run the CLI with command-line arguments
     * @param argc Argument count
     * @param argv Argument values
     * @return Exit code (0 = success)
     */
    int run(int argc, char* argv[]);

    /**
     * Parse and execute a command
     * @param args Command arguments (including command name)
     * @return Exit code
     */
    int execute(const std::vector<std::string>& args);

    /**
     * Register a command handler
     * @param command Command name
     * @param handler Handler function
     * @param description Brief description
     * @param usage Usage string
     */
    void registerCommand(const std::string& command,
                        CommandHandler handler,
                        const std::string& description,
                        const std::string& usage);

    void printVersion() const;
    void printHelp() const;
    void printCommandHelp(const std::string& command) const;

    void setVerbose(bool verbose) { m_verbose = verbose; }
    bool isVerbose() const { return m_verbose; }

    void setQuiet(bool quiet) { m_quiet = quiet; }
    bool isQuiet() const { return m_quiet; }

private:
    // Command information structure
    struct CommandInfo {
        CommandHandler handler;
        std::string description;
        std::string usage;
    };

    // Registered commands
    std::map<std::string, CommandInfo> m_commands;

    // Global options
    bool m_verbose = false;
    bool m_quiet = false;

    // Built-in command handlers
    int cmdRename(const std::vector<std::string>& args);
    int cmdName(const std::vector<std::string>& args);
    int cmdExt(const std::vector<std::string>& args);
    int cmdLongPaths(const std::vector<std::string>& args);
    int cmdCompare(const std::vector<std::string>& args);

    // Initialize built-in commands
    void initCommands();

    // Parse global options, return remaining args
    std::vector<std::string> parseGlobalOptions(const std::vector<std::string>& args);

    // Ask before running with a name budget most real names exceed
    bool confirmShortBudget(int64_t maxNameLength) const;

    void printRenameSummary(const RenameReport& report) const;

    // Utility functions
    static void printError(const std::string& message);
    static void printWarning(const std::string& message);
    void printStatus(const std::string& message) const;
    void printInfo(const std::string& message) const;
};

} // namespace fns

#endif // FNSANITIZER_CLI_H
