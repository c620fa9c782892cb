#undef NDEBUG
#include <atomic>
#include <cassert>
#include <string>
#include <vector>

#include "fixtures.hpp"
#include "../include/Errors.hpp"
#include "../include/GitConfig.hpp"
#include "../include/GitRepository.hpp"
#include "../misc/logger.hpp"

using fixtures::IdxRecord;
using fixtures::makeId;

namespace {
    template<typename Error, typename Func>
    bool throws(Func &&func) {
        try { func(); }
        catch (const Error&) { return true; }
        return false;
    }

    // Minimal on disk layout git itself would recognize
    fs::path initGitDir(const fs::path &gitDir, const std::string &config) {
        fs::create_directories(gitDir / "objects" / "pack");
        fs::create_directories(gitDir / "refs" / "heads");
        fixtures::writeFile(gitDir / "HEAD", "ref: refs/heads/main\n");
        fixtures::writeFile(gitDir / "config", config);
        return gitDir;
    }
}

int main() {
    Logging::setLogLevel(Logging::Level::ERROR);
    fixtures::TempDir tmp;

    // Sections, subsections, case folding, comments & multivars
    {
        GitConfig conf;
        conf.reads(
            "# leading comment\n"
            "[Core]\n"
            "\tRepositoryFormatVersion = 1\n"
            "\tbare = false ; trailing comment\n"
            "\tfilemode\n"
            "[remote \"Origin\"]\n"
            "\turl = \"https://example.com/repo.git\"  # quoted\n"
            "\tfetch = +refs/heads/*:refs/remotes/Origin/*\n"
            "\tfetch = +refs/tags/*:refs/tags/*\n"
            "[branch.Main]\n"
            "\tremote = Origin\n"
            "[alias]\n"
            "\tmsg = \"say \\\"hi\\\"\\tthere\" \n"
            "\tlong = first \\\n"
            "second\n"
        );

        assert(conf.exists("core"));
        assert(conf.exists("CORE", "repositoryformatversion"));
        assert(conf.get("core", "RepositoryFormatVersion") == "1");
        assert(!conf.getBool("core", "bare", true));
        assert(conf.getBool("core", "filemode", false));
        assert(conf.getBool("core", "missing", true));

        assert(conf.exists("remote.Origin"));
        assert(!conf.exists("remote.origin"));
        assert(conf.get("remote.Origin", "url") == "https://example.com/repo.git");
        assert(conf.getAll("remote.Origin", "fetch").size() == 2);
        assert(conf.get("remote.Origin", "fetch") == "+refs/tags/*:refs/tags/*");

        assert(conf.get("branch.main", "remote") == "Origin");
        assert(conf.get("alias", "msg") == "say \"hi\"\tthere");
        assert(conf.get("alias", "long") == "first second");
        assert(!conf.get("alias", "nope").has_value());
    }

    // Malformed configs report the offending line
    {
        GitConfig conf;
        assert(throws<ConfigError>([&] { conf.reads("key = value\n"); }));
        assert(throws<ConfigError>([&] { conf.reads("[core\n"); }));
        assert(throws<ConfigError>([&] { conf.reads("[core]\n\tname = \"unterminated\n"); }));
        assert(throws<ConfigError>([&] { conf.reads("[core]\n\t= value\n"); }));

        try {
            conf.reads("[core]\n\tok = 1\n\tbad = \\q\n");
            assert(false);
        } catch (const ConfigError &err) {
            assert(std::string{err.what()}.find("Line #: 3") != std::string::npos);
        }

        GitConfig boolConf;
        boolConf.reads("[core]\n\tflag = maybe\n");
        assert(throws<ConfigError>([&] { boolConf.getBool("core", "flag", false); }));
        assert(GitConfig::readFromFile(tmp / "no-such-config").getAll("core", "bare").empty());
    }

    // Work tree repositories are found from nested directories
    {
        fs::path workTree {tmp / "work"};
        initGitDir(workTree / ".git", "[core]\n\trepositoryformatversion = 0\n");
        fs::create_directories(workTree / "src" / "deep");

        GitRepository repo {GitRepository::findRepo(workTree / "src" / "deep")};
        assert(repo.getWorkTree() == fs::canonical(workTree));
        assert(repo.repoDir() == fs::canonical(workTree / ".git"));
        assert(repo.getObjectHash() == ObjectHash::Sha1);
        assert(repo.packIndexPaths().empty());

        // Nothing to index is an error & must not leave a lock behind
        std::atomic<bool> interrupt {false};
        assert(throws<ConfigError>([&] { repo.writeMultiPackIndex(nullptr, interrupt); }));
        assert(!fs::exists(repo.packDir() / "multi-pack-index.lock"));
    }

    // Bare repositories with SHA256 objects
    {
        fs::path bare {initGitDir(tmp / "bare.git",
            "[core]\n\trepositoryformatversion = 1\n\tbare = true\n[extensions]\n\tobjectFormat = sha256\n")};
        GitRepository repo {bare};
        assert(repo.getWorkTree().empty());
        assert(repo.getObjectHash() == ObjectHash::Sha256);
        assert(repo.config().getBool("core", "bare", false));
    }

    // Unsupported repository formats
    {
        fs::path future {initGitDir(tmp / "future.git", "[core]\n\trepositoryformatversion = 2\n")};
        assert(throws<ConfigError>([&] { GitRepository repo {future}; }));

        fs::path unknownHash {initGitDir(tmp / "unknown.git",
            "[core]\n\trepositoryformatversion = 1\n[extensions]\n\tobjectformat = md5\n")};
        assert(throws<ConfigError>([&] { GitRepository repo {unknownHash}; }));

        fs::create_directories(tmp / "plain");
        assert(throws<ConfigError>([&] { GitRepository repo {tmp / "plain"}; }));
    }

    // Writing a repository's multi-pack-index
    {
        fs::path gitDir {initGitDir(tmp / "packs.git", "[core]\n\trepositoryformatversion = 0\n")};
        fs::path packDir {gitDir / "objects" / "pack"};
        fixtures::writeIdx(packDir / "pack-2.idx", fixtures::buildIdxV2({IdxRecord{makeId(ObjectHash::Sha1, 0x02), 20}}));
        fixtures::writeIdx(packDir / "pack-1.idx", fixtures::buildIdxV1({IdxRecord{makeId(ObjectHash::Sha1, 0x01), 10}}));
        fixtures::writeFile(packDir / "pack-1.pack", "PACK");

        GitRepository repo {gitDir};
        std::vector<fs::path> indices {repo.packIndexPaths()};
        assert(indices.size() == 2);
        assert(indices[0].filename().string() == "pack-1.idx");

        std::atomic<bool> interrupt {false};
        MultiIndex::Outcome outcome {repo.writeMultiPackIndex(nullptr, interrupt)};
        assert(fs::exists(repo.multiPackIndexPath()));
        assert(!fs::exists(packDir / "multi-pack-index.lock"));

        fixtures::ParsedMidx midx {fixtures::parseMidx(readBinaryFile(repo.multiPackIndexPath()))};
        assert(midx.numPacks == 2);
        assert((midx.packNames() == std::vector<std::string>{"pack-1.idx", "pack-2.idx"}));
        assert(midx.packOf(0) == 0 && midx.offsetOf(0) == 10);
        assert(midx.packOf(1) == 1 && midx.offsetOf(1) == 20);
        assert(outcome.multiIndexChecksum.asBytes() == midx.trailer());

        // A failing rewrite keeps the previous file & cleans up its lock
        std::string before {readBinaryFile(repo.multiPackIndexPath())};
        fixtures::writeFile(packDir / "pack-3.idx", "broken");
        assert(throws<OpenIndexError>([&] { repo.writeMultiPackIndex(nullptr, interrupt); }));
        assert(!fs::exists(packDir / "multi-pack-index.lock"));
        assert(readBinaryFile(repo.multiPackIndexPath()) == before);

        // So does an interrupted one
        fs::remove(packDir / "pack-3.idx");
        interrupt = true;
        assert(throws<InterruptedError>([&] { repo.writeMultiPackIndex(nullptr, interrupt); }));
        assert(!fs::exists(packDir / "multi-pack-index.lock"));

        // Someone else holding the lock: their bytes stay, and so does the lock
        // even when this run would have failed anyway
        interrupt = false;
        fixtures::writeFile(packDir / "multi-pack-index.lock", "in progress");
        assert(throws<IoError>([&] { repo.writeMultiPackIndex(nullptr, interrupt); }));
        assert(readBinaryFile(packDir / "multi-pack-index.lock") == "in progress");

        interrupt = true;
        assert(throws<IoError>([&] { repo.writeMultiPackIndex(nullptr, interrupt); }));
        assert(readBinaryFile(packDir / "multi-pack-index.lock") == "in progress");
        assert(readBinaryFile(repo.multiPackIndexPath()) == before);

        // Once released, writing works again
        interrupt = false;
        fs::remove(packDir / "multi-pack-index.lock");
        repo.writeMultiPackIndex(nullptr, interrupt);
        assert(!fs::exists(packDir / "multi-pack-index.lock"));
    }

    return 0;
}
