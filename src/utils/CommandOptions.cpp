#include "fnsanitizer/utils/CommandOptions.h"

#include <cerrno>
#include <cstdlib>

namespace fnsanitizer {

void CommandOptions::addAliases(const std::string& name, const std::vector<std::string>& aliases) {
    for (const auto& alias : aliases) {
        m_aliasToName[alias] = name;
    }
    if (!aliases.empty()) {
        // Longest alias is the one quoted in error messages
        std::string& primary = m_definitions[name].primaryAlias;
        for (const auto& alias : aliases) {
            if (alias.size() > primary.size()) {
                primary = alias;
            }
        }
    }
}

void CommandOptions::addFlag(const std::string& name,
                             const std::vector<std::string>& aliases) {
    OptionDef def;
    def.isFlag = true;
    m_definitions[name] = def;
    addAliases(name, aliases);
}

void CommandOptions::addValue(const std::string& name,
                              const std::vector<std::string>& aliases,
                              const std::string& defaultValue,
                              bool required) {
    OptionDef def;
    def.isFlag = false;
    def.required = required;
    def.defaultValue = defaultValue;
    m_definitions[name] = def;
    addAliases(name, aliases);
}

bool CommandOptions::parse(const std::vector<std::string>& args, std::string* error) {
    reset();

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        // A lone "-" is positional (stdin by convention)
        if (arg.size() < 2 || arg[0] != '-') {
            m_positional.push_back(arg);
            continue;
        }

        // Check for -- which means end of options
        if (arg == "--") {
            for (size_t j = i + 1; j < args.size(); ++j) {
                m_positional.push_back(args[j]);
            }
            break;
        }

        std::string key = arg;
        std::optional<std::string> inlineValue;
        size_t eq = arg.find('=');
        if (arg.compare(0, 2, "--") == 0 && eq != std::string::npos) {
            key = arg.substr(0, eq);
            inlineValue = arg.substr(eq + 1);
        }

        auto it = m_aliasToName.find(key);
        if (it == m_aliasToName.end()) {
            if (error) {
                *error = "Unknown option: " + key;
            }
            return false;
        }

        const std::string& name = it->second;
        const OptionDef& def = m_definitions.at(name);

        if (def.isFlag) {
            if (inlineValue) {
                if (error) {
                    *error = "Option " + key + " does not take a value";
                }
                return false;
            }
            m_flags.insert(name);
        } else if (inlineValue) {
            m_values[name] = *inlineValue;
        } else {
            if (i + 1 >= args.size()) {
                if (error) {
                    *error = "Option " + key + " requires a value";
                }
                return false;
            }
            ++i;
            m_values[name] = args[i];
        }
    }

    for (const auto& [name, def] : m_definitions) {
        if (def.required && m_values.find(name) == m_values.end()) {
            if (error) {
                *error = "Missing required option: " + def.primaryAlias;
            }
            return false;
        }
    }

    return true;
}

bool CommandOptions::hasFlag(const std::string& name) const {
    return m_flags.find(name) != m_flags.end();
}

std::string CommandOptions::getValue(const std::string& name) const {
    auto it = m_values.find(name);
    if (it != m_values.end()) {
        return it->second;
    }

    auto defIt = m_definitions.find(name);
    if (defIt != m_definitions.end()) {
        return defIt->second.defaultValue;
    }
    return "";
}

bool CommandOptions::hasValue(const std::string& name) const {
    return m_values.find(name) != m_values.end();
}

std::optional<std::string> CommandOptions::getOptional(const std::string& name) const {
    auto it = m_values.find(name);
    if (it == m_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int64_t> CommandOptions::getInt(const std::string& name, int64_t minValue,
                                              int64_t maxValue, std::string* error) const {
    auto defIt = m_definitions.find(name);
    std::string label = (defIt != m_definitions.end() && !defIt->second.primaryAlias.empty())
                            ? defIt->second.primaryAlias : name;

    std::string text = getValue(name);
    if (text.empty()) {
        if (error) {
            *error = "Option " + label + " requires a value";
        }
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end == text.c_str() || *end != '\0') {
        if (error) {
            *error = "Invalid integer for " + label + ": " + text;
        }
        return std::nullopt;
    }

    if (value < minValue || value > maxValue) {
        if (error) {
            *error = "Value for " + label + " must be between " + std::to_string(minValue) +
                     " and " + std::to_string(maxValue) + ": " + text;
        }
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

const std::vector<std::string>& CommandOptions::getPositional() const {
    return m_positional;
}

std::string CommandOptions::getPositional(size_t index) const {
    if (index < m_positional.size()) {
        return m_positional[index];
    }
    return "";
}

void CommandOptions::reset() {
    m_flags.clear();
    m_values.clear();
    m_positional.clear();
}

} // namespace fnsanitizer
