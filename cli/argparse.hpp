#pragma once

#include <algorithm>
#include <charconv>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace argparse {
    enum ARGTYPE { POSITIONAL, NAMED, BOTH };

    using VALUE_TYPE = std::variant<bool, int, long, std::string, std::vector<std::string>>;

    template<typename T>
    concept ValidValueType =
        std::same_as<T, bool> || std::same_as<T, int> || std::same_as<T, long> ||
        std::same_as<T, std::string> || std::same_as<T, std::vector<std::string>>;

    // Every misuse of the parser or bad command line surfaces as this
    class ArgparseError: public std::runtime_error {
        public:
            explicit ArgparseError(const std::string &message):
                std::runtime_error("Argparse Error: " + message) {}
    };

    // Helper to print variant directly to outputstream
    inline std::ostream &operator<<(std::ostream &oss, const VALUE_TYPE &val) {
        std::visit([&oss](const auto &arg) {
            if constexpr (std::is_same_v<std::decay_t<decltype(arg)>, std::vector<std::string>>) {
                oss << '{';
                for (std::size_t i {0}; i < arg.size(); ++i)
                    oss << (i > 0? ",": "") << arg[i];
                oss << '}';
            } else if constexpr (std::is_same_v<std::decay_t<decltype(arg)>, bool>) {
                oss << (arg? "true": "false");
            } else {
                oss << arg;
            }
        }, val);
        return oss;
    }

    class Argument {
        private:
            const std::string _name;
            const ARGTYPE _type;
            bool _required {false}, _valueSet {false}, _defaultValueSet {false};
            std::string _alias, _helpStr;
            std::vector<std::string> _choices;
            VALUE_TYPE _value {std::string{}};
            std::optional<VALUE_TYPE> _default, _implicit;

            template<typename T>
            T parse(const std::string &arg) const {
                if constexpr (std::is_same_v<T, bool>) {
                    return arg != "" && arg != "0" && arg != "false";
                }

                else if constexpr (std::is_same_v<T, std::string>) {
                    return arg;
                }

                // Comma separated, single or double quotes protect commas
                else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
                    std::vector<std::string> values;
                    std::string acc; char insideQuote {0};
                    for (const char &ch: arg) {
                        if (ch == ',' && !insideQuote) {
                            values.emplace_back(acc);
                            acc.clear();
                        } else if (insideQuote && ch == insideQuote) {
                            insideQuote = 0;
                        } else if (!insideQuote && (ch == '\'' || ch == '"')) {
                            insideQuote = ch;
                        } else {
                            acc += ch;
                        }
                    }
                    if (insideQuote)
                        throw ArgparseError("Unterminated quote in value for '" + _name + "': " + arg);
                    values.emplace_back(acc);
                    return values;
                }

                else {
                    T value;
                    std::from_chars_result result {std::from_chars(arg.data(), arg.data() + arg.size(), value)};
                    if (result.ec != std::errc() || result.ptr != arg.data() + arg.size())
                        throw ArgparseError("Invalid value passed to '" + _name + "': " + arg);
                    return value;
                }
            }

        public:
            Argument(const std::string &name, const ARGTYPE &type = ARGTYPE::BOTH):
                _name(name), _type(type)
            {
                if (name.empty())
                    throw ArgparseError("Argument name cannot be empty");
                else if (name.starts_with('-'))
                    throw ArgparseError("Parameter names must not start with a hyphen: " + name);
                else if (name.find('=') != std::string::npos)
                    throw ArgparseError("Invalid parameter name: " + name);
            }

            bool           ok() const { return !_required || _valueSet || _defaultValueSet; }
            bool   isOptional() const { return !_required || _defaultValueSet; }
            bool   isValueSet() const { return _valueSet; }
            bool isDefaultSet() const { return _defaultValueSet; }
            bool       isFlag() const { return _implicit && std::holds_alternative<bool>(*_implicit); }

            const std::string &getAlias() const { return _alias; }
            const std::string &getName() const { return _name; }
            ARGTYPE getArgType() const { return _type; }

            template<typename T>
            T get() const {
                if (!_valueSet && !_defaultValueSet)
                    throw ArgparseError("Argument '" + _name + "' was not set");
                else if (!std::holds_alternative<T>(_value))
                    throw ArgparseError("Type mismatch (get): " + _name);
                return std::get<T>(_value);
            }

            std::string getHelp(int width) const {
                std::ostringstream oss, part;
                if (_type == ARGTYPE::POSITIONAL) part << _name;
                else part << "--" << _name;
                if (!_alias.empty()) part << ", -" << _alias;

                oss << std::left << std::setw(width) << part.str() << "\t" << _helpStr;
                if (!_choices.empty()) {
                    oss << " {";
                    for (std::size_t i {0}; i < _choices.size(); i++)
                        oss << (i > 0? ",": "") << _choices[i];
                    oss << '}';
                }
                if (_required) oss << " (REQUIRED)";
                if (_defaultValueSet) oss << " (default=" << *_default << ")";
                return oss.str();
            }

            Argument &alias(const std::string &name) {
                if (_type == ARGTYPE::POSITIONAL)
                    throw ArgparseError("Alias being set for a positional argument: " + _name);
                _alias = name; return *this;
            }

            Argument &required() { _required = true; return *this; }
            Argument &help(const std::string &msg) { _helpStr = msg; return *this; }

            // Restrict string values to a fixed set
            Argument &choices(const std::vector<std::string> &allowed) {
                if (!std::holds_alternative<std::string>(_value))
                    throw ArgparseError("Choices only apply to string arguments: " + _name);
                _choices = allowed; return *this;
            }

            // Flag used without a value
            Argument &set() {
                if (!_implicit)
                    throw ArgparseError("Argument '" + _name + "' expects a value");
                _value = *_implicit; _valueSet = true; return *this;
            }

            Argument &set(const std::string &val) {
                if (!_choices.empty() && std::find(_choices.begin(), _choices.end(), val) == _choices.end())
                    throw ArgparseError("Invalid choice for '" + _name + "': " + val);
                std::visit([&](auto &arg) {
                    arg = parse<std::decay_t<decltype(arg)>>(val);
                }, _value);
                _valueSet = true; return *this;
            }

            template <ValidValueType T>
            Argument &scan() { _value = T{}; return *this; }

            template<ValidValueType T>
            Argument &defaultValue(const T &val) {
                _defaultValueSet = true;
                _default = _value = val; return *this;
            }

            template<ValidValueType T>
            Argument &implicitValue(const T &val) {
                _implicit = val;
                if (!_defaultValueSet) _value = T{};
                return *this;
            }

            // Auto cast char* to std::string
            Argument  &defaultValue(const char *val) { return  defaultValue<std::string>(val); }
            Argument &implicitValue(const char *val) { return implicitValue<std::string>(val); }
    };

    class ArgumentParser {
        private:
            int maxArgLen {15}, maxSubCmdLen {15};
            std::string name;
            std::optional<std::string> _description, _epilog;

            // Ordered so help text & positional slots are stable
            std::map<std::string, Argument> allArgs;
            std::vector<std::string> positionalOrder;
            std::map<std::string, ArgumentParser> subcommands;

            // Check if the parser was called at all, required in the context of subcommands
            bool touched {false};

            static std::pair<std::string, std::string> splitArg(const std::string &arg) {
                std::size_t pos {arg.find('=')};
                if (pos == std::string::npos) return {arg, ""};
                return {arg.substr(0, pos), arg.substr(pos + 1)};
            }

            Argument &named(const std::string &key) {
                auto it {allArgs.find(key)};
                if (it == allArgs.end() || it->second.getArgType() == ARGTYPE::POSITIONAL)
                    throw ArgparseError("Unknown named argument passed: " + key);
                return it->second;
            }

            Argument &aliased(const std::string &key) {
                for (auto &[_, arg]: allArgs)
                    if (arg.getAlias() == key) return arg;
                throw ArgparseError("Unknown aliased argument passed: " + key);
            }

            // A named arg without `=`: consume the next token unless it is a flag
            // or the next token looks like another option
            static std::size_t setFromTokens(Argument &arg, const std::vector<std::string> &tokens, std::size_t i) {
                if (arg.isFlag() || i + 1 >= tokens.size() || tokens[i + 1].starts_with('-')) {
                    arg.set();
                    return i;
                }
                arg.set(tokens[i + 1]);
                return i + 1;
            }

            bool helpRequested() const {
                const Argument &help {allArgs.at("help")};
                return help.isValueSet() && help.get<bool>();
            }

        public:
            explicit ArgumentParser(const std::string &name): name(name) {
                addArgument("help", ARGTYPE::NAMED).alias("h")
                    .help("Display this help text and exit")
                    .implicitValue(true).defaultValue(false);
            }

            // Name of the first argument that is not satisfied, empty if all are.
            // Does not check the child parsers
            std::string check() const {
                for (const auto &[_, arg]: allArgs)
                    if (!arg.ok()) return arg.getName();
                return "";
            }

            // Whether this parser (subcommand) was invoked & satisfied
            bool ok() const { return touched && check().empty(); }

            ArgumentParser &description(const std::string &message) { _description = message; return *this; }
            ArgumentParser &epilog(const std::string &message) { _epilog = message; return *this; }

            template<ValidValueType T=std::string>
            T get(const std::string &key) const {
                auto it {allArgs.find(key)};
                if (it == allArgs.end())
                    throw ArgparseError("Argument with name '" + key + "' does not exist");
                return it->second.get<T>();
            }

            ArgumentParser &getChildParser(const std::string &key) {
                auto it {subcommands.find(key)};
                if (it == subcommands.end())
                    throw ArgparseError("Subcommand with name '" + key + "' does not exist");
                return it->second;
            }

            bool exists(const std::string &key) const noexcept {
                auto it {allArgs.find(key)};
                return it != allArgs.end() && (it->second.isValueSet() || it->second.isDefaultSet());
            }

            bool isSet(const std::string &key) const noexcept {
                auto it {allArgs.find(key)};
                return it != allArgs.end() && it->second.isValueSet();
            }

            // Recurse into a subcommand once one is found, the parent is not validated then.
            // Returns false if help was requested (and printed to `helpOut`) so the caller can stop
            bool parseArgs(int argc, char **argv, std::ostream &helpOut = std::cout) {
                return parseTokens(std::vector<std::string>(argv, argv + argc), 0, helpOut);
            }

            bool parseTokens(const std::vector<std::string> &tokens, std::size_t startIdx, std::ostream &helpOut) {
                touched = true;

                std::size_t position {0}; bool positionalOnly {false};
                for (std::size_t i {startIdx + 1}; i < tokens.size(); i++) {
                    const std::string &token {tokens[i]};

                    if (!positionalOnly && token == "--") {
                        positionalOnly = true;
                    }

                    // "--name=value" (or) "--name value"
                    else if (!positionalOnly && token.starts_with("--")) {
                        auto [key, value] = splitArg(token.substr(2));
                        Argument &arg {named(key)};
                        if (token.find('=') != std::string::npos) arg.set(value);
                        else i = setFromTokens(arg, tokens, i);
                    }

                    // "-a value"
                    else if (!positionalOnly && token.starts_with('-') && token.size() > 1) {
                        i = setFromTokens(aliased(token.substr(1)), tokens, i);
                    }

                    else if (!positionalOnly && position == 0 && subcommands.find(token) != subcommands.end()) {
                        if (helpRequested()) break;
                        return subcommands.at(token).parseTokens(tokens, i, helpOut);
                    }

                    else {
                        while (position < positionalOrder.size() && allArgs.at(positionalOrder[position]).isValueSet())
                            position++;
                        if (position >= positionalOrder.size())
                            throw ArgparseError("Unknown positional argument passed: " + token);
                        allArgs.at(positionalOrder[position++]).set(token);
                    }

                    if (helpRequested()) break;
                }

                if (helpRequested()) {
                    helpOut << getHelp() << '\n';
                    return false;
                }

                const std::string missingArg {check()};
                if (!missingArg.empty())
                    throw ArgparseError("Missing value for argument: " + missingArg);
                return true;
            }

            Argument &addArgument(const std::string &argName, const ARGTYPE &type = ARGTYPE::BOTH) {
                if (allArgs.find(argName) != allArgs.end())
                    throw ArgparseError("Duplicate argument with name: " + argName);
                if (subcommands.find(argName) != subcommands.end())
                    throw ArgparseError("Argument name conflicts with subcommand: " + argName);

                if (type != ARGTYPE::NAMED) positionalOrder.emplace_back(argName);
                maxArgLen = std::max(maxArgLen, static_cast<int>(argName.size() + 10));
                return allArgs.emplace(argName, Argument{argName, type}).first->second;
            }

            ArgumentParser &addSubcommand(const std::string &cmdName) {
                if (allArgs.find(cmdName) != allArgs.end())
                    throw ArgparseError("Subcommand conflict with argument: " + cmdName);
                if (subcommands.find(cmdName) != subcommands.end())
                    throw ArgparseError("Duplicate subcommand with name: " + cmdName);

                maxSubCmdLen = std::max(maxSubCmdLen, static_cast<int>(cmdName.size() + 10));
                return subcommands.emplace(cmdName, ArgumentParser{cmdName}).first->second;
            }

            std::string getHelp() const {
                std::ostringstream oss;
                oss << "Usage: " << name << " [OPTIONS] ";

                if (!subcommands.empty()) {
                    oss << '{';
                    bool first {true};
                    for (const auto &[cmdName, _]: subcommands) {
                        oss << (first? "": ",") << cmdName;
                        first = false;
                    }
                    oss << "} ";
                }

                for (const std::string &argName: positionalOrder)
                    oss << (allArgs.at(argName).isOptional()? '[' + argName + ']': argName) << ' ';

                if (_description) oss << "\n\n" << *_description;

                if (!subcommands.empty()) {
                    oss << "\n\nSubcommands:";
                    for (const auto &[cmdName, command]: subcommands) {
                        oss << "\n " << std::left << std::setw(maxSubCmdLen) << cmdName << "\t"
                            << command._description.value_or("The '" + cmdName + "' subcommand");
                    }
                }

                oss << "\n\nArguments:\n";
                for (const auto &[_, arg]: allArgs)
                    oss << ' ' << arg.getHelp(maxArgLen) << '\n';

                if (_epilog) oss << '\n' << *_epilog << '\n';
                return oss.str();
            }
    };
}
