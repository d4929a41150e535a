#include "archname/CLI.h"
#include "archname/Exceptions.h"
#include "archname/Version.h"
#include "archname/batch/RenamePlanner.h"
#include "archname/batch/TitleSources.h"
#include "archname/naming/FilenameEngine.h"
#include "archname/utils/CommandOptions.h"
#include "archname/utils/FileUtils.h"
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <sstream>
#include <utility>

namespace arn {

namespace fs = std::filesystem;

using archname::CommandOptions;

namespace {

const char* const DEFAULT_EXTENSIONS = ".html,.htm";

} // anonymous namespace

CLI::CLI() {
    initCommands();
}

void CLI::initCommands() {
    registerCommand("name",
        [this](const std::vector<std::string>& args) { return cmdName(args); },
        "Print the filename for one title",
        "name <title> [--url <url>]");

    registerCommand("batch",
        [this](const std::vector<std::string>& args) { return cmdBatch(args); },
        "Name every title of a file against one registry",
        "batch <titles_file> [--existing <dir>] [--output <file>]");

    registerCommand("derive",
        [this](const std::vector<std::string>& args) { return cmdDerive(args); },
        "Name an archived HTML capture",
        "derive <html_file> [--url <url>] [--output-dir <dir>]");

    registerCommand("plan",
        [this](const std::vector<std::string>& args) { return cmdPlan(args); },
        "Preview renames of archived pages in a directory",
        "plan <directory> [--ext <list>]");

    registerCommand("rename",
        [this](const std::vector<std::string>& args) { return cmdRename(args); },
        "Rename archived pages in a directory",
        "rename <directory> [--ext <list>] [--force]");
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

    std::vector<std::string> remaining;
    if (!parseGlobalOptions(args, remaining)) {
        return 1;
    }

    if (remaining.empty()) {
        printHelp();
        return 0;
    }

    return execute(remaining);
}

int CLI::execute(const std::vector<std::string>& args) {
    if (args.empty()) {
        printHelp();
        return 0;
    }

    const std::string& command = args[0];

    // Check for help or version
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

    // Find and execute command
    auto it = m_commands.find(command);
    if (it == m_commands.end()) {
        printError("Unknown command: " + command);
        std::cerr << "Run 'archname help' for usage.\n";
        return 1;
    }

    try {
        std::vector<std::string> cmdArgs(args.begin() + 1, args.end());
        return it->second.handler(cmdArgs);
    } catch (const NamingException& e) {
        printError(e.what());
        return 1;
    } catch (const std::exception& e) {
        printError(std::string("Error: ") + e.what());
        return 1;
    }
}

bool CLI::parseGlobalOptions(const std::vector<std::string>& args,
                             std::vector<std::string>& remaining) {
    CommandOptions opts;
    opts.addFlag("verbose", {"-v", "--verbose"});
    opts.addFlag("quiet", {"-q", "--quiet"});
    opts.addFlag("no-url-branch", {"--no-url-branch"});
    opts.addValue("budget", {"--budget"});
    opts.addValue("ceiling", {"--ceiling"});
    opts.addValue("min-content", {"--min-content"});
    opts.addValue("ext", {"--ext"});

    std::string error;
    if (!opts.parseKnown(args, remaining, &error)) {
        printError(error);
        return false;
    }

    if (opts.hasFlag("verbose")) {
        m_verbose = true;
    }
    if (opts.hasFlag("quiet")) {
        m_verbose = false;
        m_quiet = true;
    }

    m_config.targetBudget = opts.getSize("budget", m_config.targetBudget, &error);
    m_config.hardCeiling = opts.getSize("ceiling", m_config.hardCeiling, &error);
    m_config.minContentBytes = opts.getSize("min-content", m_config.minContentBytes, &error);
    if (!error.empty()) {
        printError(error);
        return false;
    }

    if (opts.hasValue("ext")) {
        std::string ext = opts.getValue("ext");
        if (!ext.empty() && ext[0] != '.') {
            ext = "." + ext;
        }
        m_config.extension = ext;
    }
    if (opts.hasFlag("no-url-branch")) {
        m_config.urlBranchEnabled = false;
    }

    try {
        m_config.validate();
    } catch (const NamingException& e) {
        printError(e.what());
        return false;
    }
    return true;
}

void CLI::printVersion() const {
    std::cout << ARCHNAME_FULL_NAME << " v" << ARCHNAME_VERSION << "\n";
}

void CLI::printHelp() const {
    printVersion();
    std::cout << "\nUsage: archname [options] <command> [arguments]\n\n";

    std::cout << "Global Options:\n";
    std::cout << "  -v, --verbose          Enable verbose output\n";
    std::cout << "  -q, --quiet            Suppress non-essential output\n";
    std::cout << "  -h, --help             Show help message\n";
    std::cout << "  -V, --version          Show version information\n";
    std::cout << "  --budget <bytes>       Target filename size including extension (default 150)\n";
    std::cout << "  --ceiling <bytes>      Hard filename size limit (default 255)\n";
    std::cout << "  --min-content <bytes>  Smallest content segment worth keeping (default 20)\n";
    std::cout << "  --ext <extension>      Extension appended to names (default .html)\n";
    std::cout << "  --no-url-branch        Never embed the source URL in a name\n";
    std::cout << "\n";

    std::cout << "Commands:\n";
    for (const auto& [name, info] : m_commands) {
        std::cout << "  " << std::left << std::setw(12) << name
                  << " " << info.description << "\n";
    }
    std::cout << "\n";

    std::cout << "Global options go before the command.\n";
    std::cout << "Run 'archname help <command>' for detailed command help.\n";
}

void CLI::printCommandHelp(const std::string& command) const {
    auto it = m_commands.find(command);
    if (it == m_commands.end()) {
        printError("Unknown command: " + command);
        return;
    }

    const auto& info = it->second;
    std::cout << "Usage: archname " << info.usage << "\n\n";
    std::cout << info.description << "\n";
}

void CLI::printError(const std::string& message) {
    std::cerr << "Error: " << message << "\n";
}

void CLI::printWarning(const std::string& message) {
    std::cerr << "Warning: " << message << "\n";
}

void CLI::printInfo(const std::string& message) const {
    if (m_verbose) {
        std::cout << message << "\n";
    }
}

void CLI::printOutput(const std::string& message) const {
    if (!m_quiet) {
        std::cout << message << "\n";
    }
}

//=============================================================================
// Command Implementations
//=============================================================================

int CLI::cmdName(const std::vector<std::string>& args) {
    CommandOptions opts;
    opts.addValue("url", {"-u", "--url"});

    std::string error;
    if (!opts.parse(args, &error)) {
        printError(error);
        printCommandHelp("name");
        return 1;
    }

    if (opts.positionalCount() == 0) {
        printError("Missing title argument");
        printCommandHelp("name");
        return 1;
    }

    // Unquoted titles arrive as several words
    std::string title;
    for (const auto& part : opts.getPositional()) {
        if (!title.empty()) {
            title += ' ';
        }
        title += part;
    }

    FilenameEngine engine(m_config);
    NameRegistry registry;
    NamingResult result = engine.assignDetailed(title, opts.getValue("url"), registry);

    std::cout << result.filename << "\n";

    if (result.title.isStructured()) {
        printInfo("Platform: " + result.title.platformLabel +
                  " (" + platformToString(*result.title.platform) + ")");
        printInfo("User: " + result.title.user.value_or("-"));
        printInfo("Rule: " + result.title.rule);
    }
    printInfo("Branch: " + std::string(branchToString(result.branch)));
    printInfo("Strategy: " + std::string(strategyToString(result.strategy)));
    printInfo("Size: " + std::to_string(result.filename.size()) + " of " +
              std::to_string(result.budget) + " bytes");
    return 0;
}

int CLI::cmdBatch(const std::vector<std::string>& args) {
    CommandOptions opts;
    opts.addValue("existing", {"-e", "--existing"});
    opts.addValue("output", {"-o", "--output"});

    std::string error;
    if (!opts.parse(args, &error)) {
        printError(error);
        printCommandHelp("batch");
        return 1;
    }

    if (opts.positionalCount() < 1) {
        printError("Missing titles file argument");
        printCommandHelp("batch");
        return 1;
    }

    const std::string titlesPath = opts.getPositional(0);

    std::vector<std::string> lines;
    if (titlesPath == "-") {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines.push_back(line);
        }
    } else {
        lines = FileUtils::readLines(titlesPath);
    }

    NameRegistry registry;
    if (opts.hasValue("existing")) {
        registry = NameRegistry(FileUtils::listStems(opts.getValue("existing")));
        printInfo("Existing names: " + std::to_string(registry.size()));
    }

    FilenameEngine engine(m_config);
    std::ostringstream out;
    size_t count = 0;

    for (const auto& line : lines) {
        if (line.empty()) {
            continue;
        }

        std::string title = line;
        std::string url;
        size_t tab = line.find('\t');
        if (tab != std::string::npos) {
            title = line.substr(0, tab);
            url = line.substr(tab + 1);
        }

        NamingResult result = engine.assignDetailed(title, url, registry);
        out << result.filename << "\n";
        ++count;

        if (result.strategy != ResolveStrategy::AsIs) {
            printInfo("Disambiguated (" + std::string(strategyToString(result.strategy)) +
                      "): " + result.filename);
        }
    }

    if (opts.hasValue("output")) {
        const fs::path outputPath = opts.getValue("output");
        FileUtils::ensureParentExists(outputPath);
        FileUtils::writeTextFile(outputPath, out.str());
        printOutput("Named " + std::to_string(count) + " title(s) -> " + outputPath.string());
    } else {
        std::cout << out.str();
    }
    return 0;
}

int CLI::cmdDerive(const std::vector<std::string>& args) {
    CommandOptions opts;
    opts.addValue("url", {"-u", "--url"});
    opts.addValue("output-dir", {"-d", "--output-dir"});

    std::string error;
    if (!opts.parse(args, &error)) {
        printError(error);
        printCommandHelp("derive");
        return 1;
    }

    if (opts.positionalCount() < 1) {
        printError("Missing HTML file argument");
        printCommandHelp("derive");
        return 1;
    }

    const std::string html = FileUtils::readTextFile(opts.getPositional(0));
    const std::string url = opts.getValue("url");
    const std::string title = TitleSources::derive(html, url);
    printInfo("Title: " + title);

    NameRegistry registry;
    fs::path outputDir;
    if (opts.hasValue("output-dir")) {
        outputDir = opts.getValue("output-dir");
        std::error_code ec;
        if (fs::is_directory(outputDir, ec)) {
            registry = NameRegistry(FileUtils::listStems(outputDir));
        } else {
            printInfo("Output directory does not exist yet: " + outputDir.string());
        }
    }

    FilenameEngine engine(m_config);
    const std::string stem = engine.assign(title, url, registry);
    const std::string name = engine.filename(stem);

    if (outputDir.empty()) {
        std::cout << name << "\n";
    } else {
        std::cout << (outputDir / name).string() << "\n";
    }
    return 0;
}

std::vector<RenameOperation> CLI::planDirectory(const FilenameEngine& engine,
                                                const std::string& directory,
                                                const std::vector<std::string>& extensions) const {
    std::vector<fs::path> files = RenamePlanner::scan(directory, extensions);
    printInfo("Found " + std::to_string(files.size()) + " file(s) in " + directory);

    RenamePlanner planner(engine);
    return planner.plan(files);
}

void CLI::printPlan(const std::vector<RenameOperation>& operations) const {
    std::cout << std::left << std::setw(50) << "Current Name"
              << std::setw(50) << "New Name" << "Status\n";
    std::cout << std::string(112, '-') << "\n";

    for (const auto& op : operations) {
        std::string status;
        if (op.unchanged()) {
            if (!m_verbose) {
                continue;
            }
            status = "No change";
        } else if (op.conflict) {
            status = "Conflict: " + op.reason;
        } else {
            status = "Rename";
        }

        std::cout << std::left << std::setw(50) << op.oldName
                  << std::setw(50) << op.newName << status << "\n";
    }

    std::cout << std::string(112, '-') << "\n";
}

int CLI::cmdPlan(const std::vector<std::string>& args) {
    CommandOptions opts;
    opts.addValue("ext", {"--ext"}, DEFAULT_EXTENSIONS);

    std::string error;
    if (!opts.parse(args, &error)) {
        printError(error);
        printCommandHelp("plan");
        return 1;
    }

    if (opts.positionalCount() < 1) {
        printError("Missing directory argument");
        printCommandHelp("plan");
        return 1;
    }

    FilenameEngine engine(m_config);
    auto operations = planDirectory(engine, opts.getPositional(0), opts.getList("ext"));

    if (operations.empty()) {
        printOutput("No matching files found");
        return 0;
    }

    printPlan(operations);

    const size_t pending = RenamePlanner::countPending(operations);
    const size_t conflicts = RenamePlanner::countConflicts(operations);
    std::cout << operations.size() << " file(s), " << pending << " to rename, "
              << conflicts << " conflict(s)\n";
    if (pending > 0) {
        printOutput("Run 'archname rename' to apply.");
    }
    return 0;
}

int CLI::cmdRename(const std::vector<std::string>& args) {
    CommandOptions opts;
    opts.addValue("ext", {"--ext"}, DEFAULT_EXTENSIONS);
    opts.addFlag("force", {"-f", "--force"});

    std::string error;
    if (!opts.parse(args, &error)) {
        printError(error);
        printCommandHelp("rename");
        return 1;
    }

    if (opts.positionalCount() < 1) {
        printError("Missing directory argument");
        printCommandHelp("rename");
        return 1;
    }

    FilenameEngine engine(m_config);
    auto operations = planDirectory(engine, opts.getPositional(0), opts.getList("ext"));

    if (operations.empty()) {
        printOutput("No matching files found");
        return 0;
    }

    const bool force = opts.hasFlag("force");
    if (force && RenamePlanner::countConflicts(operations) > 0) {
        printWarning("Existing targets will be replaced (--force)");
    }

    ApplySummary summary = RenamePlanner::apply(operations, force);

    for (const auto& message : summary.messages) {
        if (message.rfind("Skipping", 0) == 0) {
            printWarning(message);
        } else if (message.rfind("Failed", 0) == 0) {
            printError(message);
        } else {
            printOutput(message);
        }
    }

    printOutput("Renamed " + std::to_string(summary.renamed) + ", skipped " +
                std::to_string(summary.skipped) + ", failed " +
                std::to_string(summary.failed));
    return summary.failed > 0 ? 1 : 0;
}

} // namespace arn
