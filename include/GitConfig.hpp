#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Read only view of a git config file (`.git/config`).
// Sections are addressed as "core" or "remote.origin" for `[remote "origin"]`,
// section & key names are case insensitive, subsection names are not.
class GitConfig {
    private:
        // section -> key -> every value in file order (git allows multivars)
        std::map<std::string, std::map<std::string, std::vector<std::string>>> data;

        // Lowercase the section part, leave the subsection part untouched
        static std::string normalizeSection(const std::string &section);

        // Strip quotes, process escapes & drop trailing comments
        static std::string parseValue(const std::string &raw, std::size_t lineNo);

        // `[core]`, `[remote "origin"]` or legacy `[branch.main]`
        static std::string parseSectionHeader(const std::string &line, std::size_t lineNo);

    public:
        // Parse config contents into this object, throws `ConfigError` with the line number on bad input
        void reads(const std::string &raw);

        // Missing files yield an empty config, unreadable ones throw `IoError`
        static GitConfig readFromFile(const fs::path &path);

        bool exists(const std::string &section) const;
        bool exists(const std::string &section, const std::string &key) const;

        // Last value set for the key, git semantics for single valued keys
        std::optional<std::string> get(const std::string &section, const std::string &key) const;
        std::vector<std::string> getAll(const std::string &section, const std::string &key) const;

        // yes/on/true/1 & no/off/false/0/empty, throws `ConfigError` on anything else
        bool getBool(const std::string &section, const std::string &key, bool defaultValue) const;
};
