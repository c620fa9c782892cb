#pragma once

#include "ChunkFile.hpp"
#include "MultiIndexFormat.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

// Size calculation & serialization for each multi-pack-index chunk.
// Every `write` emits exactly `storageSize` bytes for the same input.
namespace MultiIndex::chunk {
    namespace indexNames {
        // Names plus NUL terminators, padded to `CHUNK_ALIGNMENT`
        std::uint64_t storageSize(const std::vector<fs::path> &fileNames);
        void write(const std::vector<fs::path> &fileNames, ChunkWriter &out);
    }

    namespace fanout {
        inline constexpr std::uint64_t SIZE {256 * 4};
        void write(const std::vector<Entry> &sortedEntries, ChunkWriter &out);
    }

    namespace lookup {
        std::uint64_t storageSize(std::size_t numEntries, ObjectHash objectHash);
        void write(const std::vector<Entry> &sortedEntries, ChunkWriter &out);
    }

    namespace offsets {
        std::uint64_t storageSize(std::size_t numEntries);
        void write(const std::vector<Entry> &sortedEntries, ChunkWriter &out);
    }

    namespace largeOffsets {
        // Number of entries whose offset needs the 64 bit table
        std::uint32_t numLargeOffsets(const std::vector<Entry> &entries);
        std::uint64_t storageSize(std::uint32_t numLargeOffsets);
        void write(const std::vector<Entry> &sortedEntries, std::uint32_t numLargeOffsets, ChunkWriter &out);
    }
}
