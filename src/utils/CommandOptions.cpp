#include "archname/utils/CommandOptions.h"

namespace archname {

void CommandOptions::addFlag(const std::string& name,
                             const std::vector<std::string>& aliases) {
    OptionDef def;
    def.isFlag = true;
    m_definitions[name] = def;

    for (const auto& alias : aliases) {
        m_aliasToName[alias] = name;
    }
}

void CommandOptions::addValue(const std::string& name,
                              const std::vector<std::string>& aliases,
                              const std::string& defaultValue) {
    OptionDef def;
    def.isFlag = false;
    def.defaultValue = defaultValue;
    m_definitions[name] = def;

    for (const auto& alias : aliases) {
        m_aliasToName[alias] = name;
    }

    if (!defaultValue.empty()) {
        m_values[name] = defaultValue;
    }
}

bool CommandOptions::consume(const std::vector<std::string>& args, size_t& i,
                             bool& consumed, std::string* error) {
    consumed = false;
    const std::string& arg = args[i];

    std::string key = arg;
    std::string inlineValue;
    bool hasInline = false;

    // --name=value
    size_t eq = arg.find('=');
    if (arg.size() > 2 && arg[0] == '-' && arg[1] == '-' && eq != std::string::npos) {
        key = arg.substr(0, eq);
        inlineValue = arg.substr(eq + 1);
        hasInline = true;
    }

    auto it = m_aliasToName.find(key);
    if (it == m_aliasToName.end()) {
        return true;
    }

    consumed = true;
    const std::string& name = it->second;
    const OptionDef& def = m_definitions.at(name);

    if (def.isFlag) {
        if (hasInline) {
            if (error) {
                *error = "Option " + key + " does not take a value";
            }
            return false;
        }
        m_flags.insert(name);
        return true;
    }

    if (hasInline) {
        m_values[name] = inlineValue;
    } else {
        if (i + 1 >= args.size()) {
            if (error) {
                *error = "Option " + arg + " requires a value";
            }
            return false;
        }
        ++i;
        m_values[name] = args[i];
    }
    m_explicit.insert(name);
    return true;
}

bool CommandOptions::parse(const std::vector<std::string>& args, std::string* error) {
    reset();

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg.size() > 1 && arg[0] == '-') {
            if (arg == "--") {
                for (size_t j = i + 1; j < args.size(); ++j) {
                    m_positional.push_back(args[j]);
                }
                break;
            }

            bool consumed = false;
            if (!consume(args, i, consumed, error)) {
                return false;
            }
            if (!consumed) {
                if (error) {
                    *error = "Unknown option: " + arg;
                }
                return false;
            }
        } else {
            // A lone "-" is positional (stdin)
            m_positional.push_back(arg);
        }
    }

    return true;
}

bool CommandOptions::parseKnown(const std::vector<std::string>& args,
                                std::vector<std::string>& remaining,
                                std::string* error) {
    reset();
    remaining.clear();

    size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.size() < 2 || arg[0] != '-' || arg == "--") {
            break;
        }

        bool consumed = false;
        if (!consume(args, i, consumed, error)) {
            return false;
        }
        if (!consumed) {
            break;
        }
    }

    remaining.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
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
    return "";
}

std::string CommandOptions::getValue(const std::string& name, const std::string& defaultVal) const {
    auto it = m_values.find(name);
    if (it != m_values.end()) {
        return it->second;
    }
    return defaultVal;
}

size_t CommandOptions::getSize(const std::string& name, size_t defaultVal,
                               std::string* error) const {
    auto it = m_values.find(name);
    if (it == m_values.end() || it->second.empty()) {
        return defaultVal;
    }

    const std::string& text = it->second;
    size_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9' || value > 1000000000) {
            if (error) {
                *error = "Invalid number for " + name + ": " + text;
            }
            return defaultVal;
        }
        value = value * 10 + static_cast<size_t>(c - '0');
    }
    return value;
}

bool CommandOptions::hasValue(const std::string& name) const {
    return m_explicit.find(name) != m_explicit.end();
}

std::vector<std::string> CommandOptions::getList(const std::string& name) const {
    std::vector<std::string> items;
    std::string value = getValue(name);

    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) {
            comma = value.size();
        }
        std::string item = value.substr(start, comma - start);
        if (!item.empty()) {
            items.push_back(item);
        }
        start = comma + 1;
    }
    return items;
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
    m_explicit.clear();
    m_positional.clear();

    for (const auto& [name, def] : m_definitions) {
        if (!def.isFlag && !def.defaultValue.empty()) {
            m_values[name] = def.defaultValue;
        }
    }
}

} // namespace archname
