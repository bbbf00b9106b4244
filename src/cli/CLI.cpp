#include "fnsanitizer/CLI.h"
#include "fnsanitizer/Exceptions.h"
#include "fnsanitizer/Version.h"
#include "fnsanitizer/core/Renamer.h"
#include "fnsanitizer/naming/NameSanitizer.h"
#include "fnsanitizer/utils/CommandOptions.h"
#include "fnsanitizer/utils/DirectoryUtils.h"
#include "fnsanitizer/utils/FileSystemProbe.h"
#include "fnsanitizer/utils/RandomSource.h"
#include "fnsanitizer/utils/SanityChecks.h"
#include <iostream>
#include <iomanip>
#include <limits>

namespace fns {

namespace {

constexpr int64_t MAX_BUDGET = std::numeric_limits<int32_t>::max();

} // anonymous namespace

CLI::CLI() {
    initCommands();
}

void CLI::initCommands() {
    registerCommand("rename",
        [this](const std::vector<std::string>& args) { return cmdRename(args); },
        "Sanitize all names in a directory tree",
        "rename --path <dir> --max-name-len <n> --max-path-len <n>\n"
        "       [--rename] [--in-place | --where-to-copy <dir>] [--symlinks]\n"
        "       [--max-ext-len <n>] [--logs-dir <dir>] [--yes]");

    registerCommand("name",
        [this](const std::vector<std::string>& args) { return cmdName(args); },
        "Print the sanitized form of a name",
        "name <name> [--max-len <n>]");

    registerCommand("ext",
        [this](const std::vector<std::string>& args) { return cmdExt(args); },
        "Print the sanitized form of an extension",
        "ext <ext> [--max-ext-len <n>]");

    registerCommand("long-paths",
        [this](const std::vector<std::string>& args) { return cmdLongPaths(args); },
        "List paths longer than a limit",
        "long-paths <dir> --max-path-len <n>");

    registerCommand("compare",
        [this](const std::vector<std::string>& args) { return cmdCompare(args); },
        "Check that two directory trees are identical",
        "compare <dir_a> <dir_b>");
}

void CLI::registerCommand(const std::string& command,
                          CommandHandler handler,
                          const std::string& description,
                          const std::string& usage) {
    m_commands[command] = {std::move(handler), description, usage};
}

int CLI::run(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    // Parse global options
    args = parseGlobalOptions(args);

    if (args.empty()) {
        printHelp();
        return 0;
    }

    return execute(args);
}

int CLI::execute(const std::vector<std::string>& args) {
    if (args.empty()) {
        printHelp();
        return 0;
    }

    const std::string& command = args[0];

    if (command == "help" || command == "--help" || command == "-h") {
        if (args.size() > 1) {
            printCommandHelp(args[1]);
        } else {
            printHelp();
        }
        return 0;
    }

    if (command == "version" || command == "--version" || command == "-V") {
        printVersion();
        return 0;
    }

    auto it = m_commands.find(command);
    if (it == m_commands.end()) {
        printError("Unknown command: " + command);
        std::cerr << "Run '" FNSANITIZER_NAME " help' for usage.\n";
        return 1;
    }

    try {
        std::vector<std::string> cmdArgs(args.begin() + 1, args.end());
        return it->second.handler(cmdArgs);
    } catch (const SanitizerException& e) {
        printError(e.what());
        return 1;
    } catch (const std::exception& e) {
        printError(e.what());
        return 1;
    }
}

std::vector<std::string> CLI::parseGlobalOptions(const std::vector<std::string>& args) {
    std::vector<std::string> remaining;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        // Only options in front of the command are global
        if (!remaining.empty()) {
            remaining.push_back(arg);
        } else if (arg == "-v" || arg == "--verbose") {
            m_verbose = true;
            m_quiet = false;
        } else if (arg == "-q" || arg == "--quiet") {
            m_quiet = true;
            m_verbose = false;
        } else {
            remaining.push_back(arg);
        }
    }

    return remaining;
}

void CLI::printVersion() const {
    std::cout << FNSANITIZER_FULL_NAME << " v" << FNSANITIZER_VERSION << "\n";
}

void CLI::printHelp() const {
    printVersion();
    std::cout << "\nUsage: " FNSANITIZER_NAME " [options] <command> [arguments]\n\n";

    std::cout << "Global Options:\n";
    std::cout << "  -v, --verbose    Enable verbose output\n";
    std::cout << "  -q, --quiet      Suppress non-essential output\n";
    std::cout << "  -h, --help       Show help message\n";
    std::cout << "  -V, --version    Show version information\n";
    std::cout << "\n";

    std::cout << "Commands:\n";
    for (const auto& [name, info] : m_commands) {
        std::cout << "  " << std::left << std::setw(12) << name
                  << " " << info.description << "\n";
    }
    std::cout << "\n";

    std::cout << "Renaming is a dry run unless --rename is given.\n";
    std::cout << "Run '" FNSANITIZER_NAME " help <command>' for detailed command help.\n";
}

void CLI::printCommandHelp(const std::string& command) const {
    auto it = m_commands.find(command);
    if (it == m_commands.end()) {
        printError("Unknown command: " + command);
        return;
    }

    const auto& info = it->second;
    std::cout << "Usage: " FNSANITIZER_NAME " " << info.usage << "\n\n";
    std::cout << info.description << "\n";
}

void CLI::printError(const std::string& message) {
    std::cerr << "Error: " << message << "\n";
}

void CLI::printWarning(const std::string& message) {
    std::cerr << "Warning: " << message << "\n";
}

void CLI::printStatus(const std::string& message) const {
    if (!m_quiet) {
        std::cout << message << "\n";
    }
}

void CLI::printInfo(const std::string& message) const {
    if (m_verbose) {
        std::cout << message << "\n";
    }
}

bool CLI::confirmShortBudget(int64_t maxNameLength) const {
    const size_t practical = SanityChecks::practicalNameLength();
    if (maxNameLength >= static_cast<int64_t>(practical)) {
        printInfo("The max name length you selected is passing the sanity check");
        return true;
    }

    printWarning("The max name length you selected is shorter than the practical length (" +
                 std::to_string(practical) + ").");
    std::cerr << "For example, this one will have to be shortened if you proceed: '"
              << SanityChecks::PRACTICAL_EXAMPLE_NAME << "'.\n"
              << "Do you want to continue? (y/n) " << std::flush;

    std::string answer;
    std::getline(std::cin, answer);
    if (answer != "y" && answer != "Y") {
        std::cerr << "Exiting...\n";
        return false;
    }
    return true;
}

void CLI::printRenameSummary(const RenameReport& report) const {
    if (!report.logsDir.empty()) {
        printStatus("Logs: " + report.logsDir);
    }
    for (const auto* kind : {&report.files, &report.dirs}) {
        if (!*kind) {
            continue;
        }
        const KindReport& k = **kind;
        printInfo("Proposed changes: " + std::to_string(k.changesCount) + " (" + k.logPath + ")");
        printInfo("Execution: " + k.execution.status + ", attempted " +
                  std::to_string(k.execution.attempted));
        for (const auto& failed : k.execution.failed) {
            printWarning("Failed to rename " + failed.oldPath + " -> " + failed.newPath);
        }
    }
    if (report.longPathsRemain) {
        printWarning(std::to_string(report.longPaths.size()) +
                     " paths are still too long, see " + report.longPathsLogPath);
    }
}

//=============================================================================
// Command Implementations
//=============================================================================

int CLI::cmdRename(const std::vector<std::string>& args) {
    fnsanitizer::CommandOptions opts;
    opts.addValue("path", {"-p", "--path"}, "", true);
    opts.addValue("max-name-len", {"--max-name-len"}, "", true);
    opts.addValue("max-path-len", {"--max-path-len"}, "", true);
    opts.addValue("max-ext-len", {"--max-ext-len"}, "4");
    opts.addValue("where-to-copy", {"--where-to-copy"});
    opts.addValue("logs-dir", {"--logs-dir"}, "results");
    opts.addFlag("rename", {"--rename"});
    opts.addFlag("in-place", {"--in-place"});
    opts.addFlag("symlinks", {"--symlinks"});
    opts.addFlag("yes", {"-y", "--yes"});

    std::string error;
    if (!opts.parse(args, &error)) {
        printError(error);
        printCommandHelp("rename");
        return 1;
    }

    auto maxNameLen = opts.getInt("max-name-len", 1, MAX_BUDGET, &error);
    auto maxPathLen = maxNameLen ? opts.getInt("max-path-len", 1, MAX_BUDGET, &error) : std::nullopt;
    auto maxExtLen = maxPathLen ? opts.getInt("max-ext-len", 1, MAX_BUDGET, &error) : std::nullopt;
    if (!maxExtLen) {
        printError(error);
        return 1;
    }

    RenameOptions options;
    options.directoryPath = opts.getValue("path");
    options.whereToCopy = opts.getOptional("where-to-copy");
    options.logsBaseDir = opts.getValue("logs-dir");
    options.maxFullNameLength = *maxNameLen;
    options.maxPathLength = *maxPathLen;
    options.maxExtLength = *maxExtLen;
    options.actuallyRename = opts.hasFlag("rename");
    options.inPlace = opts.hasFlag("in-place");
    options.replaceSymlinks = opts.hasFlag("symlinks");
    options.verbose = m_verbose;

    if (options.inPlace && options.whereToCopy) {
        printError("Cannot use both --in-place and --where-to-copy");
        return 1;
    }
    if (options.actuallyRename && !options.inPlace && !options.whereToCopy) {
        printError("Must specify either --in-place or --where-to-copy when using --rename");
        return 1;
    }

    SanityChecks::checkParentExists(options.directoryPath);
    if (options.whereToCopy) {
        SanityChecks::checkParentExists(*options.whereToCopy);
    }

    if (!opts.hasFlag("yes") && !confirmShortBudget(options.maxFullNameLength)) {
        return 1;
    }

    LocalFileSystemProbe probe;
    DefaultRandomSource random;
    Renamer renamer(options, probe, random, LocalFileSystemProbe::hostPolicy(),
                    [this](const std::string& message) { printStatus(message); },
                    [this](const std::string& message) { printInfo(message); });

    RenameReport report = renamer.run();
    printRenameSummary(report);

    if (!report.copySuccess) {
        printError(report.notRenamingReason);
    }
    return report.success ? 0 : 1;
}

int CLI::cmdName(const std::vector<std::string>& args) {
    fnsanitizer::CommandOptions opts;
    opts.addValue("max-len", {"-m", "--max-len"}, "255");

    std::string error;
    if (!opts.parse(args, &error)) {
        printError(error);
        printCommandHelp("name");
        return 1;
    }
    if (opts.positionalCount() != 1) {
        printError("Expected exactly one name");
        printCommandHelp("name");
        return 1;
    }

    auto maxLen = opts.getInt("max-len", 1, MAX_BUDGET, &error);
    if (!maxLen) {
        printError(error);
        return 1;
    }

    DefaultRandomSource random;
    NameSanitizer sanitizer(CharacterTables::defaults(), random);
    std::cout << sanitizer.sanitizeName(opts.getPositional(0), static_cast<size_t>(*maxLen)) << "\n";
    return 0;
}

int CLI::cmdExt(const std::vector<std::string>& args) {
    fnsanitizer::CommandOptions opts;
    opts.addValue("max-ext-len", {"-m", "--max-ext-len"}, "4");

    std::string error;
    if (!opts.parse(args, &error)) {
        printError(error);
        printCommandHelp("ext");
        return 1;
    }
    if (opts.positionalCount() != 1) {
        printError("Expected exactly one extension");
        printCommandHelp("ext");
        return 1;
    }

    auto maxLen = opts.getInt("max-ext-len", 1, MAX_BUDGET, &error);
    if (!maxLen) {
        printError(error);
        return 1;
    }

    DefaultRandomSource random;
    NameSanitizer sanitizer(CharacterTables::defaults(), random);
    std::cout << sanitizer.sanitizeExt(opts.getPositional(0), static_cast<size_t>(*maxLen)) << "\n";
    return 0;
}

int CLI::cmdLongPaths(const std::vector<std::string>& args) {
    fnsanitizer::CommandOptions opts;
    opts.addValue("max-path-len", {"--max-path-len"}, "", true);

    std::string error;
    if (!opts.parse(args, &error)) {
        printError(error);
        printCommandHelp("long-paths");
        return 1;
    }
    if (opts.positionalCount() != 1) {
        printError("Missing directory argument");
        printCommandHelp("long-paths");
        return 1;
    }

    auto maxLen = opts.getInt("max-path-len", 1, MAX_BUDGET, &error);
    if (!maxLen) {
        printError(error);
        return 1;
    }

    auto longPaths = DirectoryUtils::findLongPaths(opts.getPositional(0), static_cast<size_t>(*maxLen));
    for (const auto& path : longPaths) {
        std::cout << path << "\n";
    }

    if (longPaths.empty()) {
        printStatus("Good news! All paths are within the limits");
    } else {
        printInfo(std::to_string(longPaths.size()) + " paths are longer than " +
                  std::to_string(*maxLen) + " characters");
    }
    return 0;
}

int CLI::cmdCompare(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        printError("Expected two directories");
        printCommandHelp("compare");
        return 1;
    }

    DirectoryComparison comparison = DirectoryUtils::compareDirectories(args[0], args[1]);
    if (comparison.identical) {
        printStatus("Directories are identical");
        return 0;
    }

    for (const auto& mismatch : comparison.mismatches) {
        std::cout << mismatch << "\n";
    }
    return 1;
}

} // namespace fns
