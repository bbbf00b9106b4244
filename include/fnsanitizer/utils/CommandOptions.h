#ifndef FNSANITIZER_COMMAND_OPTIONS_H
#define FNSANITIZER_COMMAND_OPTIONS_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fnsanitizer {

/**
 * Command-line option parser shared by all subcommands
 *
 * Usage:
 *   CommandOptions opts;
 *   opts.addFlag("rename", {"--rename"});
 *   opts.addValue("path", {"-p", "--path"}, "", true);
 *   opts.addValue("max-name-len", {"--max-name-len"}, "30");
 *
 *   std::string error;
 *   if (!opts.parse(args, &error)) {
 *       // Handle error
 *   }
 *
 *   auto maxLen = opts.getInt("max-name-len", 1, 4096, &error);
 *
 * Value options accept both "--name value" and "--name=value".
 */
class CommandOptions {
public:
    /**
     * Define a boolean flag option (no value)
     * @param name Internal name for the option
     * @param aliases Command-line aliases (e.g., {"-q", "--quiet"})
     */
    void addFlag(const std::string& name,
                 const std::vector<std::string>& aliases);

    /**
     * Define a value option
     * @param name Internal name for the option
     * @param aliases Command-line aliases
     * @param defaultValue Value used when the option is absent
     * @param required parse() fails when the option is absent
     */
    void addValue(const std::string& name,
                  const std::vector<std::string>& aliases,
                  const std::string& defaultValue = "",
                  bool required = false);

    /**
     * Parse command-line arguments
     * @param args Arguments to parse
     * @param error Optional pointer to receive error message
     * @return true if parsing succeeded
     */
    bool parse(const std::vector<std::string>& args, std::string* error = nullptr);

    bool hasFlag(const std::string& name) const;

    /**
     * Value of an option, its default, or empty
     */
    std::string getValue(const std::string& name) const;

    /**
     * True only if the option was given on the command line
     */
    bool hasValue(const std::string& name) const;

    /**
     * Value of an explicitly given option
     */
    std::optional<std::string> getOptional(const std::string& name) const;

    /**
     * Value as a decimal integer within [minValue, maxValue]
     * @return Empty, with @p error set, if missing, malformed or out of range
     */
    std::optional<int64_t> getInt(const std::string& name, int64_t minValue, int64_t maxValue,
                                  std::string* error = nullptr) const;

    const std::vector<std::string>& getPositional() const;

    size_t positionalCount() const { return m_positional.size(); }

    /**
     * Get a positional argument by index
     * @return Argument or empty string if out of range
     */
    std::string getPositional(size_t index) const;

    /**
     * Clear all parsed values and reset for reuse
     */
    void reset();

private:
    struct OptionDef {
        bool isFlag = false;
        bool required = false;
        std::string defaultValue;
        std::string primaryAlias;
    };

    std::map<std::string, OptionDef> m_definitions;    // name -> definition
    std::map<std::string, std::string> m_aliasToName;  // alias -> name
    std::set<std::string> m_flags;                      // set flags
    std::map<std::string, std::string> m_values;        // name -> value given
    std::vector<std::string> m_positional;              // positional args

    void addAliases(const std::string& name, const std::vector<std::string>& aliases);
};

} // namespace fnsanitizer

#endif // FNSANITIZER_COMMAND_OPTIONS_H
