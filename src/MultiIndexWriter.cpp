#include "../include/MultiIndexWriter.hpp"
#include "../include/MultiIndexChunks.hpp"
#include "../include/Errors.hpp"
#include "../include/GitPackIndex.hpp"
#include "../include/HashingWriter.hpp"
#include "../include/utils.hpp"
#include "../misc/logger.hpp"

#include <algorithm>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace MultiIndex {
    NormalizedPaths normalizePaths(std::vector<fs::path> indexPaths) {
        if (indexPaths.empty())
            throw std::invalid_argument("At least one pack index is required to write a multi-pack-index");

        std::sort(indexPaths.begin(), indexPaths.end());

        std::vector<fs::path> fileNames;
        fileNames.reserve(indexPaths.size());
        for (const fs::path &path: indexPaths) {
            if (!path.has_filename())
                throw std::invalid_argument("Pack index path has no file name: " + path.string());
            fileNames.emplace_back(path.filename());
        }

        return NormalizedPaths{.indexPaths=std::move(indexPaths), .fileNames=std::move(fileNames)};
    }

    std::vector<Entry> collectEntries(
        const std::vector<fs::path> &sortedIndexPaths, ObjectHash objectHash,
        Progress &progress, const std::atomic<bool> &shouldInterrupt
    ) {
        if (sortedIndexPaths.size() > std::numeric_limits<std::uint32_t>::max())
            throw std::invalid_argument("Too many pack indices: " + std::to_string(sortedIndexPaths.size()));

        std::vector<Entry> entries;
        auto start {cr::steady_clock::now()};
        progress.setName("Collecting entries");
        progress.init(sortedIndexPaths.size(), "indices");

        // Indices are read one after another, the interrupt is polled in between
        for (std::size_t indexId {0}; indexId < sortedIndexPaths.size(); indexId++) {
            if (shouldInterrupt.load(std::memory_order_relaxed))
                throw InterruptedError{};

            const fs::path &path {sortedIndexPaths[indexId]};

            // A missing mtime only weakens the tie-break, it never fails the write
            std::error_code ec;
            fs::file_time_type mtime {fs::last_write_time(path, ec)};
            if (ec) {
                Logging::Debug("No modification time for ", path.string(), " (", ec.message(), "), using the epoch");
                mtime = missingMtime();
            }

            std::optional<GitPackIndex> index;
            try {
                index.emplace(GitPackIndex::at(path, objectHash));
            } catch (const PackIndexError &err) {
                throw OpenIndexError(err.what());
            } catch (const IoError &err) {
                throw OpenIndexError(err.what());
            }

            std::size_t needed {entries.size() + index->numObjects()};
            if (needed > entries.capacity())
                entries.reserve(std::max(needed, entries.capacity() * 2));
            for (std::uint32_t i {0}; i < index->numObjects(); i++) {
                try {
                    entries.emplace_back(Entry{
                        .id=index->oidAt(i),
                        .packIndex=static_cast<std::uint32_t>(indexId),
                        .packOffset=index->packOffsetAt(i),
                        .indexMtime=mtime
                    });
                } catch (const PackIndexError &err) {
                    throw OpenIndexError(err.what());
                }
            }

            Logging::Debug("Collected ", index->numObjects(), " objects from ", path.string());
            progress.inc();
        }

        if (shouldInterrupt.load(std::memory_order_relaxed))
            throw InterruptedError{};

        progress.showThroughput(start);
        return entries;
    }

    void deduplicate(std::vector<Entry> &entries) {
        std::sort(entries.begin(), entries.end(), [](const Entry &l, const Entry &r) {
            if (l.id != r.id) return l.id < r.id;
            if (l.indexMtime != r.indexMtime) return l.indexMtime > r.indexMtime;
            return l.packIndex < r.packIndex;
        });

        // `std::unique` keeps the first of each run, which the sort made the winner
        auto last {std::unique(entries.begin(), entries.end(), [](const Entry &l, const Entry &r) {
            return l.id == r.id;
        })};
        entries.erase(last, entries.end());
    }

    ChunkPlan planChunks(
        const std::vector<fs::path> &fileNames, const std::vector<Entry> &sortedEntries,
        ObjectHash objectHash
    ) {
        ChunkIndex index {chunk::CANONICAL_ORDER};
        index.planChunk(chunk::indexNames::ID, chunk::indexNames::storageSize(fileNames));
        index.planChunk(chunk::fanout::ID, chunk::fanout::SIZE);
        index.planChunk(chunk::lookup::ID, chunk::lookup::storageSize(sortedEntries.size(), objectHash));
        index.planChunk(chunk::offsets::ID, chunk::offsets::storageSize(sortedEntries.size()));

        std::uint32_t numLargeOffsets {chunk::largeOffsets::numLargeOffsets(sortedEntries)};
        if (numLargeOffsets > 0)
            index.planChunk(chunk::largeOffsets::ID, chunk::largeOffsets::storageSize(numLargeOffsets));

        return ChunkPlan{.index=std::move(index), .numLargeOffsets=numLargeOffsets};
    }

    std::size_t writeHeader(std::ostream &out, std::uint8_t numChunks, std::uint32_t numIndices, ObjectHash objectHash) {
        std::string header;
        header.reserve(HEADER_LEN);
        header.append(SIGNATURE);
        header.push_back(static_cast<char>(Version::V1));
        header.push_back(static_cast<char>(objectHash));
        header.push_back(static_cast<char>(numChunks));
        header.push_back(0); // unused number of base files
        appendBigEndian(header, numIndices);

        writeAll(out, header.data(), header.size(), "multi-pack-index header");
        return HEADER_LEN;
    }

    Outcome writeFromIndexPaths(
        std::vector<fs::path> indexPaths, std::ostream &out,
        std::unique_ptr<Progress> progress, const std::atomic<bool> &shouldInterrupt,
        const Options &options
    ) {
        if (!progress) progress = std::make_unique<DiscardProgress>();
        const ObjectHash objectHash {options.objectHash};

        auto [indexPathsSorted, indexFileNamesSorted] = normalizePaths(std::move(indexPaths));

        std::vector<Entry> entries {collectEntries(indexPathsSorted, objectHash, *progress, shouldInterrupt)};
        {
            auto start {cr::steady_clock::now()};
            progress->setName("Deduplicate");
            progress->init(entries.size(), "entries");
            std::size_t collected {entries.size()};
            deduplicate(entries);
            progress->inc(collected);
            progress->showThroughput(start);
            Logging::Debug("Deduplicated ", collected, " entries down to ", entries.size());
        }

        ChunkPlan plan {planChunks(indexFileNamesSorted, entries, objectHash)};

        HashingWriter hashed {out, objectHash};
        std::size_t bytesWritten {writeHeader(
            hashed.hashed(),
            static_cast<std::uint8_t>(plan.index.numChunks()),
            static_cast<std::uint32_t>(indexPathsSorted.size()),
            objectHash
        )};

        ChunkWriter chunkWrite {plan.index.intoWrite(hashed.hashed(), bytesWritten)};
        while (std::optional<ChunkId> chunkToWrite = chunkWrite.nextChunk()) {
            Logging::Trace("Writing chunk ", chunkIdName(*chunkToWrite));
            if (*chunkToWrite == chunk::indexNames::ID)
                chunk::indexNames::write(indexFileNamesSorted, chunkWrite);
            else if (*chunkToWrite == chunk::fanout::ID)
                chunk::fanout::write(entries, chunkWrite);
            else if (*chunkToWrite == chunk::lookup::ID)
                chunk::lookup::write(entries, chunkWrite);
            else if (*chunkToWrite == chunk::offsets::ID)
                chunk::offsets::write(entries, chunkWrite);
            else if (*chunkToWrite == chunk::largeOffsets::ID)
                chunk::largeOffsets::write(entries, plan.numLargeOffsets, chunkWrite);
            else
                throw std::logic_error("BUG: forgot to implement chunk " + chunkIdName(*chunkToWrite));
        }

        // Write trailing checksum, not part of the hashed content
        ObjectId checksum {hashed.digest()};
        writeAll(hashed.inner(), checksum.asBytes().data(), checksum.size(), "multi-pack-index checksum");
        hashed.inner().flush();
        if (!hashed.inner()) throw IoError("Failed to flush multi-pack-index");

        Logging::Info("Wrote multi-pack-index over ", indexPathsSorted.size(), " packs with ",
                entries.size(), " objects, checksum ", checksum.hex());

        return Outcome{.multiIndexChecksum=std::move(checksum), .progress=std::move(progress)};
    }
}
