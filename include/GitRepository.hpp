#pragma once

#include "GitConfig.hpp"
#include "MultiIndexWriter.hpp"
#include "ObjectId.hpp"
#include "Progress.hpp"

#include <atomic>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// Just enough of a repository to locate its packs & maintain their multi-pack-index
class GitRepository {
    private:
        // workTree is parent folder containing `.git`, empty for bare repositories
        fs::path workTree;

        // gitDir is the absolute path to `.git` (or the bare repository itself)
        fs::path gitDir;

        GitConfig conf;
        ObjectHash objectHash {ObjectHash::Sha1};

        // What python's os.path.join("a", "b") does but inserts gitDir at front
        fs::path repoPath(const std::initializer_list<std::string_view> &parts) const;

        // Validate `core.repositoryformatversion` & pick up `extensions.objectformat`
        void loadConfig();

        static bool isGitDir(const fs::path &path);

    public:
        static constexpr std::string_view MULTI_PACK_INDEX_NAME {"multi-pack-index"};

        // `path` is either a work tree containing `.git` or a bare repository
        explicit GitRepository(const fs::path &path);

        // Starting at `path`, traverse up until we find a level containing `.git`
        // or a bare repository. If not found, throws a `ConfigError`
        static GitRepository findRepo(const fs::path &path = ".");

        fs::path repoDir() const { return gitDir; }
        const fs::path &getWorkTree() const { return workTree; }
        fs::path packDir() const;
        fs::path multiPackIndexPath() const;

        ObjectHash getObjectHash() const { return objectHash; }
        const GitConfig &config() const { return conf; }

        // All `*.idx` files in `objects/pack`, sorted
        std::vector<fs::path> packIndexPaths() const;

        // Write `objects/pack/multi-pack-index` over every pack index of the repository.
        // Bytes go to `multi-pack-index.lock` first which is renamed into place on success
        // and removed if anything fails.
        MultiIndex::Outcome writeMultiPackIndex(
            std::unique_ptr<Progress> progress, const std::atomic<bool> &shouldInterrupt
        ) const;
};
