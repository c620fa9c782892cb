#include "../include/CommandHandler.hpp"
#include "../include/Errors.hpp"
#include "../include/GitPackIndex.hpp"
#include "../include/GitRepository.hpp"
#include "../include/MultiIndexWriter.hpp"
#include "../misc/logger.hpp"

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>

CommandHandler::CommandHandler(const std::atomic<bool> &shouldInterrupt, std::ostream &out):
    argparser(initParser()), shouldInterrupt(shouldInterrupt), out(out) {}

void CommandHandler::handleArgs(int argc, char **argv) {
    if (!argparser.parseArgs(argc, argv, out))
        return;

    if (argparser.get<bool>("verbose"))
        Logging::setLogLevel(Logging::Level::DEBUG);
    else if (argparser.get<bool>("quiet"))
        Logging::setLogLevel(Logging::Level::ERROR);

    argparse::ArgumentParser &writeParser     {argparser.getChildParser("write")};
    argparse::ArgumentParser &showIndexParser {argparser.getChildParser("show-index")};

    if (writeParser.ok())
        write(writeParser);
    else if (showIndexParser.ok())
        showIndex(showIndexParser);
    else
        out << argparser.getHelp() << '\n';
}

void CommandHandler::write(const argparse::ArgumentParser &parser) {
    std::unique_ptr<Progress> progress {std::make_unique<LogProgress>("write")};
    MultiIndex::Outcome outcome;

    if (parser.isSet("indices")) {
        if (!parser.isSet("output"))
            throw std::invalid_argument("--output is required together with --indices");

        std::vector<fs::path> indexPaths;
        for (const std::string &index: parser.get<std::vector<std::string>>("indices"))
            if (!index.empty()) indexPaths.emplace_back(index);

        fs::path output {parser.get("output")};
        ObjectHash objectHash {parseObjectHash(parser.isSet("object-format")? parser.get("object-format"): "sha1")};

        try {
            std::ofstream ofs {output, std::ios::binary | std::ios::trunc};
            if (!ofs) throw IoError("Unable to open file for writing: " + output.string());
            outcome = MultiIndex::writeFromIndexPaths(
                std::move(indexPaths), ofs, std::move(progress), shouldInterrupt,
                MultiIndex::Options{.objectHash=objectHash}
            );
            ofs.close();
            if (!ofs) throw IoError("Failed to close " + output.string());
        } catch (...) {
            // A partial file would look like a corrupt index to git
            std::error_code ec;
            fs::remove(output, ec);
            throw;
        }
    }

    else {
        if (parser.isSet("output"))
            throw std::invalid_argument("--output requires --indices, repositories always write objects/pack/multi-pack-index");

        GitRepository repo {GitRepository::findRepo(parser.get("repo"))};
        if (parser.isSet("object-format") && parseObjectHash(parser.get("object-format")) != repo.getObjectHash())
            throw ConfigError("Requested object format " + parser.get("object-format") +
                " does not match the repository's " + std::string(objectHashName(repo.getObjectHash())));

        outcome = repo.writeMultiPackIndex(std::move(progress), shouldInterrupt);
    }

    out << outcome.multiIndexChecksum.hex() << '\n';
}

void CommandHandler::showIndex(const argparse::ArgumentParser &parser) {
    ObjectHash objectHash {parseObjectHash(parser.get("object-format"))};
    GitPackIndex index {GitPackIndex::at(parser.get("path"), objectHash)};

    if (parser.get<bool>("verify") && !index.verifyChecksum())
        throw PackIndexError("Index checksum mismatch: " + index.getPath().string());

    if (parser.get<bool>("check-pack")) {
        fs::path packPath {index.getPath()};
        packPath.replace_extension(".pack");
        std::vector<std::uint32_t> mismatches {index.verifyPackCrcs(packPath)};
        for (std::uint32_t record: mismatches)
            Logging::Error("crc32 mismatch for ", index.oidAt(record).hex(), " at offset ", index.packOffsetAt(record));
        if (!mismatches.empty())
            throw PackIndexError(std::to_string(mismatches.size()) + " objects of " + packPath.string() + " are corrupt");
    }

    // Same shape as `git show-index`
    for (const PackIndexEntry &entry: index.entries()) {
        out << entry.packOffset << ' ' << entry.oid.hex();
        if (entry.crc32) {
            std::ostringstream crc;
            crc << std::hex << std::setfill('0') << std::setw(8) << *entry.crc32;
            out << " (" << crc.str() << ')';
        }
        out << '\n';
    }

    Logging::Debug("Listed ", index.numObjects(), " objects of version ", index.getVersion(), " index ", index.getPath().string());
}

argparse::ArgumentParser CommandHandler::initParser() {
    argparse::ArgumentParser argparser {"cmidx"};
    argparser.description("cmidx: writes git multi-pack-index files from pack indices");
    argparser.addArgument("verbose", argparse::NAMED).alias("v")
        .implicitValue(true).defaultValue(false).help("Log debug output.");
    argparser.addArgument("quiet", argparse::NAMED).alias("q")
        .implicitValue(true).defaultValue(false).help("Only log errors.");

    // write command
    argparse::ArgumentParser &writeParser {argparser.addSubcommand("write")};
    writeParser.description("Write a multi-pack-index.")
        .epilog("Without --indices, every pack of the repository is indexed into objects/pack/multi-pack-index.");
    writeParser.addArgument("repo", argparse::NAMED).alias("C").defaultValue(".")
        .help("Repository (or any directory inside it).");
    writeParser.addArgument("indices", argparse::NAMED).scan<std::vector<std::string>>()
        .help("Comma separated pack index files to merge.");
    writeParser.addArgument("output", argparse::NAMED).alias("o")
        .help("Where to write the multi-pack-index when --indices is given.");
    writeParser.addArgument("object-format", argparse::NAMED)
        .choices({"sha1", "sha256"}).help("Object hash of the pack indices.");

    // show-index command
    argparse::ArgumentParser &showIndexParser {argparser.addSubcommand("show-index")};
    showIndexParser.description("Show the records of a pack index.");
    showIndexParser.addArgument("path", argparse::POSITIONAL).required().help("Pack index file.");
    showIndexParser.addArgument("object-format", argparse::NAMED).defaultValue("sha1")
        .choices({"sha1", "sha256"}).help("Object hash of the pack index.");
    showIndexParser.addArgument("verify", argparse::NAMED).implicitValue(true).defaultValue(false)
        .help("Verify the trailing checksum before listing.");
    showIndexParser.addArgument("check-pack", argparse::NAMED).implicitValue(true).defaultValue(false)
        .help("Verify the crc32 of every object against the matching .pack file.");

    return argparser;
}
