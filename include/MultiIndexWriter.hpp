#pragma once

#include "ChunkFile.hpp"
#include "MultiIndexFormat.hpp"
#include "ObjectId.hpp"
#include "Progress.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <ostream>
#include <vector>

namespace fs = std::filesystem;

namespace MultiIndex {
    struct Options {
        ObjectHash objectHash {ObjectHash::Sha1};
    };

    struct Outcome {
        // Checksum of the written file, also stored as its trailer
        ObjectId multiIndexChecksum;

        // The progress passed in, handed back to the caller
        std::unique_ptr<Progress> progress;
    };

    // Sorted index paths and their file names, positions line up.
    // The position of a path is the pack ordinal used in the written file.
    struct NormalizedPaths {
        std::vector<fs::path> indexPaths;
        std::vector<fs::path> fileNames;
    };

    struct ChunkPlan {
        ChunkIndex index;
        std::uint32_t numLargeOffsets;
    };

    // Stand-in for an index whose modification time cannot be read: the Unix epoch
    inline fs::file_time_type missingMtime() {
        return fs::file_time_type::clock::from_sys(cr::sys_seconds{});
    }

    // Sort index paths & derive their file names. Throws `std::invalid_argument` on an empty list
    NormalizedPaths normalizePaths(std::vector<fs::path> indexPaths);

    // Read every record of every index into one unsorted list, tagging each with the
    // ordinal & mtime of its index. The interrupt flag is polled between index files.
    std::vector<Entry> collectEntries(
        const std::vector<fs::path> &sortedIndexPaths, ObjectHash objectHash,
        Progress &progress, const std::atomic<bool> &shouldInterrupt
    );

    // Sort by id, newest index mtime first, lowest pack ordinal first, then drop
    // everything but the first entry of each id
    void deduplicate(std::vector<Entry> &entries);

    // Chunk sizes for the given names & deduplicated entries, in canonical order
    ChunkPlan planChunks(
        const std::vector<fs::path> &fileNames, const std::vector<Entry> &sortedEntries,
        ObjectHash objectHash
    );

    // Writes the fixed size header, returns the number of bytes written
    std::size_t writeHeader(std::ostream &out, std::uint8_t numChunks, std::uint32_t numIndices, ObjectHash objectHash);

    // Merge the given pack indices into a multi-pack-index written to `out`.
    // Throws `OpenIndexError` if an index cannot be read, `InterruptedError` if
    // `shouldInterrupt` was set during collection and `IoError` on write failures.
    Outcome writeFromIndexPaths(
        std::vector<fs::path> indexPaths, std::ostream &out,
        std::unique_ptr<Progress> progress, const std::atomic<bool> &shouldInterrupt,
        const Options &options
    );
}
