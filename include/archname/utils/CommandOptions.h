#ifndef ARCHNAME_COMMAND_OPTIONS_H
#define ARCHNAME_COMMAND_OPTIONS_H

#include <cstddef>
#include <string>
#include <vector>
#include <map>
#include <set>

namespace archname {

/**
 * Command-line option parser shared by the global option pass and the
 * individual commands
 *
 * Usage:
 *   CommandOptions opts;
 *   opts.addFlag("force", {"-f", "--force"});
 *   opts.addValue("url", {"-u", "--url"});
 *   opts.addValue("ext", {"--ext"}, ".html,.htm");
 *
 *   std::string error;
 *   if (!opts.parse(args, &error)) {
 *       // Handle error
 *   }
 *
 *   bool force = opts.hasFlag("force");
 *   std::string url = opts.getValue("url");
 *   auto positional = opts.getPositional();
 *
 * Long options also accept the "--name=value" spelling.
 */
class CommandOptions {
public:
    /**
     * Define a boolean flag option (no value)
     * @param name Internal name for the option
     * @param aliases Command-line aliases (e.g., {"-f", "--force"})
     */
    void addFlag(const std::string& name,
                 const std::vector<std::string>& aliases);

    /**
     * Define a value option (requires an argument)
     * @param name Internal name for the option
     * @param aliases Command-line aliases
     * @param defaultValue Default value if not specified
     */
    void addValue(const std::string& name,
                  const std::vector<std::string>& aliases,
                  const std::string& defaultValue = "");

    /**
     * Parse command-line arguments
     * @param args Arguments to parse
     * @param error Optional pointer to receive error message
     * @return true if parsing succeeded
     */
    bool parse(const std::vector<std::string>& args, std::string* error = nullptr);

    /**
     * Parse the leading options this parser knows and stop at the first
     * argument that is not one of them
     * @param args Arguments to scan
     * @param remaining Receives the first unconsumed argument and everything after it
     * @param error Optional pointer to receive error message
     * @return true if every consumed option was well formed
     */
    bool parseKnown(const std::vector<std::string>& args,
                    std::vector<std::string>& remaining,
                    std::string* error = nullptr);

    bool hasFlag(const std::string& name) const;

    /**
     * Get a value option
     * @param name Option name
     * @return Value, default, or empty string if neither is set
     */
    std::string getValue(const std::string& name) const;

    std::string getValue(const std::string& name, const std::string& defaultVal) const;

    /**
     * Get a value option as an unsigned size
     * @param name Option name
     * @param defaultVal Returned when the option was not given
     * @param error Receives a message when the value is not a decimal number
     * @return Parsed value, or defaultVal on absence or error
     */
    size_t getSize(const std::string& name, size_t defaultVal, std::string* error = nullptr) const;

    /**
     * Check if a value option was given on the command line
     * Defaults do not count.
     */
    bool hasValue(const std::string& name) const;

    /**
     * Split a comma-separated value into its non-empty items
     */
    std::vector<std::string> getList(const std::string& name) const;

    const std::vector<std::string>& getPositional() const;

    size_t positionalCount() const { return m_positional.size(); }

    /**
     * Get a positional argument by index
     * @param index Index (0-based)
     * @return Argument or empty string if out of range
     */
    std::string getPositional(size_t index) const;

    /**
     * Clear all parsed values and reset for reuse
     */
    void reset();

private:
    struct OptionDef {
        bool isFlag;
        std::string defaultValue;
    };

    // Returns false on a malformed known option; sets consumed when args[i] was ours
    bool consume(const std::vector<std::string>& args, size_t& i,
                 bool& consumed, std::string* error);

    std::map<std::string, OptionDef> m_definitions;    // name -> definition
    std::map<std::string, std::string> m_aliasToName;  // alias -> name
    std::set<std::string> m_flags;                      // set flags
    std::map<std::string, std::string> m_values;        // name -> value
    std::set<std::string> m_explicit;                   // values given on the command line
    std::vector<std::string> m_positional;              // positional args
};

} // namespace archname

#endif // ARCHNAME_COMMAND_OPTIONS_H
