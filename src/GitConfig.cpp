#include "../include/GitConfig.hpp"
#include "../include/Errors.hpp"
#include "../include/utils.hpp"

#include <cctype>
#include <sstream>

std::string GitConfig::normalizeSection(const std::string &section) {
    std::size_t dot {section.find('.')};
    if (dot == std::string::npos) return toLower(section);
    return toLower(section.substr(0, dot)) + section.substr(dot);
}

std::string GitConfig::parseSectionHeader(const std::string &line, std::size_t lineNo) {
    std::size_t close {line.rfind(']')};
    if (close == std::string::npos)
        throw ConfigError("Line #: " + std::to_string(lineNo) + ": Unterminated section header: " + line);

    std::string rest {trim(line.substr(close + 1))};
    if (!rest.empty() && rest[0] != '#' && rest[0] != ';')
        throw ConfigError("Line #: " + std::to_string(lineNo) + ": Unexpected content after section header: " + line);

    std::string inner {line.substr(1, close - 1)};
    std::size_t quote {inner.find('"')};

    // Legacy `[section.subsection]`, lowercased entirely
    if (quote == std::string::npos) {
        inner = trim(inner);
        if (inner.empty())
            throw ConfigError("Line #: " + std::to_string(lineNo) + ": Empty section name");
        return toLower(inner);
    }

    // `[section "subsection"]`, subsection keeps its case & supports \" and \\ escapes
    std::string name {trim(inner.substr(0, quote))};
    if (name.empty() || inner.back() != '"' || inner.size() - quote < 2)
        throw ConfigError("Line #: " + std::to_string(lineNo) + ": Malformed section header: " + line);

    std::string subsection;
    for (std::size_t i {quote + 1}; i + 1 < inner.size(); i++) {
        if (inner[i] == '\\' && i + 2 < inner.size()) subsection.push_back(inner[++i]);
        else subsection.push_back(inner[i]);
    }
    return toLower(name) + '.' + subsection;
}

std::string GitConfig::parseValue(const std::string &raw, std::size_t lineNo) {
    std::string value;
    bool insideQuote {false};

    // Everything up to `keep` survives, trailing unquoted whitespace gets cut
    std::size_t keep {0};
    for (std::size_t i {0}; i < raw.size(); i++) {
        char ch {raw[i]};
        if (ch == '"') {
            insideQuote = !insideQuote;
            keep = value.size();
        } else if (ch == '\\') {
            if (i + 1 >= raw.size())
                throw ConfigError("Line #: " + std::to_string(lineNo) + ": Dangling escape in value: " + raw);
            char next {raw[++i]};
            switch (next) {
                case 'n': value.push_back('\n'); break;
                case 't': value.push_back('\t'); break;
                case 'b': value.push_back('\b'); break;
                case '"': case '\\': value.push_back(next); break;
                default:
                    throw ConfigError("Line #: " + std::to_string(lineNo) + ": Invalid escape '\\" + next + "' in value");
            }
            keep = value.size();
        } else if (!insideQuote && (ch == '#' || ch == ';')) {
            break;
        } else if (!insideQuote && std::isspace(static_cast<unsigned char>(ch))) {
            // Leading whitespace never makes it in
            if (!value.empty()) value.push_back(ch);
        } else {
            value.push_back(ch);
            keep = value.size();
        }
    }

    if (insideQuote)
        throw ConfigError("Line #: " + std::to_string(lineNo) + ": Unterminated quote in value: " + raw);

    value.resize(keep);
    return value;
}

void GitConfig::reads(const std::string &raw) {
    std::istringstream iss {raw};
    std::string currSection, line;
    std::size_t lineNo {0};

    while (std::getline(iss, line)) {
        lineNo++;
        std::size_t startLine {lineNo};

        // Join continuation lines: an odd number of trailing backslashes
        auto continues {[](const std::string &str) {
            std::size_t count {0};
            for (auto it {str.rbegin()}; it != str.rend() && *it == '\\'; ++it) count++;
            return count % 2 == 1;
        }};
        std::string next;
        while (continues(line) && std::getline(iss, next)) {
            line.pop_back(); line += next; lineNo++;
        }

        std::string trimmed {trim(line)};
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';')
            continue;

        if (trimmed[0] == '[') {
            currSection = parseSectionHeader(trimmed, startLine);
            data[currSection];
            continue;
        }

        if (currSection.empty())
            throw ConfigError("Line #: " + std::to_string(startLine) + ": Key outside of any section: " + trimmed);

        // Key names: alphanumerics & '-', must start with a letter
        std::size_t keyEnd {0};
        while (keyEnd < trimmed.size() && (std::isalnum(static_cast<unsigned char>(trimmed[keyEnd])) || trimmed[keyEnd] == '-'))
            keyEnd++;
        std::string key {toLower(trimmed.substr(0, keyEnd))};
        if (key.empty() || !std::isalpha(static_cast<unsigned char>(key[0])))
            throw ConfigError("Line #: " + std::to_string(startLine) + ": Invalid key: " + trimmed);

        std::string rest {trim(trimmed.substr(keyEnd))};

        // A bare key is a boolean set to true
        if (rest.empty() || rest[0] == '#' || rest[0] == ';')
            data[currSection][key].emplace_back("true");
        else if (rest[0] == '=')
            data[currSection][key].emplace_back(parseValue(rest.substr(1), startLine));
        else
            throw ConfigError("Line #: " + std::to_string(startLine) + ": Error parsing line: " + trimmed);
    }
}

GitConfig GitConfig::readFromFile(const fs::path &path) {
    GitConfig conf;
    if (fs::exists(path))
        conf.reads(readTextFile(path));
    return conf;
}

bool GitConfig::exists(const std::string &section) const {
    return data.find(normalizeSection(section)) != data.end();
}

bool GitConfig::exists(const std::string &section, const std::string &key) const {
    auto it {data.find(normalizeSection(section))};
    return it != data.end() && it->second.find(toLower(key)) != it->second.end();
}

std::optional<std::string> GitConfig::get(const std::string &section, const std::string &key) const {
    std::vector<std::string> values {getAll(section, key)};
    if (values.empty()) return std::nullopt;
    return values.back();
}

std::vector<std::string> GitConfig::getAll(const std::string &section, const std::string &key) const {
    auto it {data.find(normalizeSection(section))};
    if (it == data.end()) return {};
    auto kv {it->second.find(toLower(key))};
    if (kv == it->second.end()) return {};
    return kv->second;
}

bool GitConfig::getBool(const std::string &section, const std::string &key, bool defaultValue) const {
    std::optional<std::string> value {get(section, key)};
    if (!value) return defaultValue;

    std::string lowered {toLower(*value)};
    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1")
        return true;
    else if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0" || lowered.empty())
        return false;
    else
        throw ConfigError("Bad boolean config value '" + *value + "' for " + section + '.' + key);
}
