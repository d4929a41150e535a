#ifndef ARCHNAME_CLI_H
#define ARCHNAME_CLI_H

#include "archname/NamingConfig.h"
#include "archname/Types.h"
#include <string>
#include <vector>
#include <functional>
#include <map>

namespace arn {

class FilenameEngine;
struct RenameOperation;

/**
 * Command-line interface handler for archname
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

    /**
     * Print help for a specific command
     */
    void printCommandHelp(const std::string& command) const;

    void setVerbose(bool verbose) { m_verbose = verbose; }
    bool isVerbose() const { return m_verbose; }

    void setQuiet(bool quiet) { m_quiet = quiet; }
    bool isQuiet() const { return m_quiet; }

    /**
     * Configuration built from the global options
     */
    const NamingConfig& config() const { return m_config; }

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
    NamingConfig m_config;

    // Built-in command handlers
    int cmdName(const std::vector<std::string>& args);
    int cmdBatch(const std::vector<std::string>& args);
    int cmdDerive(const std::vector<std::string>& args);
    int cmdPlan(const std::vector<std::string>& args);
    int cmdRename(const std::vector<std::string>& args);

    // Initialize built-in commands
    void initCommands();

    /**
     * Parse global options in front of the command
     * @param args All arguments
     * @param remaining Receives the command and its arguments
     * @return false if an option was malformed (already reported)
     */
    bool parseGlobalOptions(const std::vector<std::string>& args,
                            std::vector<std::string>& remaining);

    // Shared by plan and rename
    std::vector<RenameOperation> planDirectory(const FilenameEngine& engine,
                                               const std::string& directory,
                                               const std::vector<std::string>& extensions) const;
    void printPlan(const std::vector<RenameOperation>& operations) const;

    // Utility functions
    static void printError(const std::string& message);
    static void printWarning(const std::string& message);
    void printInfo(const std::string& message) const;
    void printOutput(const std::string& message) const;
};

} // namespace arn

#endif // ARCHNAME_CLI_H
