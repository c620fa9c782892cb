#include "../include/GitRepository.hpp"
#include "../include/Errors.hpp"
#include "../misc/logger.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

fs::path GitRepository::repoPath(const std::initializer_list<std::string_view> &parts) const {
    fs::path result {gitDir};
    for (const std::string_view &part: parts)
        result /= part;
    return result;
}

bool GitRepository::isGitDir(const fs::path &path) {
    return fs::is_directory(path / "objects") && fs::is_regular_file(path / "HEAD");
}

void GitRepository::loadConfig() {
    conf = GitConfig::readFromFile(repoPath({"config"}));

    std::string repoVersion {conf.get("core", "repositoryformatversion").value_or("0")};
    if (repoVersion != "0" && repoVersion != "1")
        throw ConfigError("Unsupported `repositoryformatversion`: " + repoVersion);

    // Extensions are only honored from version 1 onwards
    std::optional<std::string> objectFormat {conf.get("extensions", "objectformat")};
    if (objectFormat && repoVersion == "1") {
        try {
            objectHash = parseObjectHash(*objectFormat);
        } catch (const std::invalid_argument &err) {
            throw ConfigError(err.what());
        }
    } else if (objectFormat) {
        Logging::Warn("Ignoring extensions.objectformat=", *objectFormat, " in a version 0 repository");
    }
}

GitRepository::GitRepository(const fs::path &path) {
    if (fs::is_directory(path / ".git")) {
        workTree = fs::canonical(path);
        gitDir = fs::canonical(path / ".git");
    } else if (isGitDir(path)) {
        gitDir = fs::canonical(path);
    } else {
        throw ConfigError("Not a Git Repository: " + fs::absolute(path).string());
    }

    if (!isGitDir(gitDir))
        throw ConfigError("Git directory is missing `objects` or `HEAD`: " + gitDir.string());

    loadConfig();
    Logging::Debug("Opened repository at ", gitDir.string(), " (", objectHashName(objectHash), ")");
}

GitRepository GitRepository::findRepo(const fs::path &path_) {
    fs::path path {fs::absolute(path_)};
    while (true) {
        if (fs::is_directory(path / ".git") || isGitDir(path))
            return GitRepository(path);
        else if (!path.has_parent_path() || path == path.parent_path())
            throw ConfigError("Not a git directory (or any of the parent directories): " + fs::absolute(path_).string());
        else
            path = path.parent_path();
    }
}

fs::path GitRepository::packDir() const { return repoPath({"objects", "pack"}); }

fs::path GitRepository::multiPackIndexPath() const { return repoPath({"objects", "pack", MULTI_PACK_INDEX_NAME}); }

std::vector<fs::path> GitRepository::packIndexPaths() const {
    std::vector<fs::path> paths;
    fs::path dir {packDir()};
    if (!fs::is_directory(dir)) return paths;

    for (const fs::directory_entry &entry: fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".idx")
            paths.emplace_back(entry.path());
    }

    std::sort(paths.begin(), paths.end());
    return paths;
}

MultiIndex::Outcome GitRepository::writeMultiPackIndex(
    std::unique_ptr<Progress> progress, const std::atomic<bool> &shouldInterrupt
) const {
    std::vector<fs::path> indices {packIndexPaths()};
    if (indices.empty())
        throw ConfigError("No pack indices found in " + packDir().string());

    fs::path target {multiPackIndexPath()};
    fs::path lockFile {target};
    lockFile += ".lock";

    // Exclusive create: if the lock already exists another writer owns it
    std::ofstream ofs {lockFile, std::ios::binary | std::ios::noreplace};
    if (!ofs) {
        if (fs::exists(lockFile))
            throw IoError("Unable to create '" + lockFile.string() + "': File exists. Another process may be writing the multi-pack-index");
        throw IoError("Unable to open multi-pack-index lock file for writing: " + lockFile.string());
    }

    // From here on the lock is ours, so any failure removes it
    try {
        MultiIndex::Outcome outcome {MultiIndex::writeFromIndexPaths(
            std::move(indices), ofs, std::move(progress), shouldInterrupt,
            MultiIndex::Options{.objectHash=objectHash}
        )};

        ofs.close();
        if (!ofs) throw IoError("Failed to close multi-pack-index lock file: " + lockFile.string());

        fs::rename(lockFile, target);
        return outcome;
    } catch (...) {
        if (ofs.is_open()) ofs.close();
        std::error_code ec;
        fs::remove(lockFile, ec);
        throw;
    }
}
