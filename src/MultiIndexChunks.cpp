#include "../include/MultiIndexChunks.hpp"
#include "../include/utils.hpp"

#include <array>
#include <stdexcept>

namespace MultiIndex::chunk {
    namespace {
        bool needsLargeOffset(const Entry &entry) { return entry.packOffset > LARGE_OFFSET_THRESHOLD; }
    }

    std::uint64_t indexNames::storageSize(const std::vector<fs::path> &fileNames) {
        std::uint64_t count {0};
        for (const fs::path &name: fileNames)
            count += name.string().size() + 1;

        std::uint64_t neededAlignment {CHUNK_ALIGNMENT - (count % CHUNK_ALIGNMENT)};
        if (neededAlignment < CHUNK_ALIGNMENT)
            count += neededAlignment;
        return count;
    }

    void indexNames::write(const std::vector<fs::path> &fileNames, ChunkWriter &out) {
        std::uint64_t written {0};
        for (const fs::path &name: fileNames) {
            std::string raw {name.string()};
            out.write(raw.c_str(), raw.size() + 1);
            written += raw.size() + 1;
        }

        // Pad with NULs until aligned
        static constexpr char padding[CHUNK_ALIGNMENT] {};
        std::uint64_t neededAlignment {CHUNK_ALIGNMENT - (written % CHUNK_ALIGNMENT)};
        if (neededAlignment < CHUNK_ALIGNMENT)
            out.write(padding, neededAlignment);
    }

    void fanout::write(const std::vector<Entry> &sortedEntries, ChunkWriter &out) {
        std::array<std::uint32_t, 256> counts {};
        for (const Entry &entry: sortedEntries)
            counts[entry.id.firstByte()]++;

        std::uint32_t total {0};
        for (std::uint32_t count: counts) {
            total += count;
            writeBigEndian(out, total);
        }
    }

    std::uint64_t lookup::storageSize(std::size_t numEntries, ObjectHash objectHash) {
        return std::uint64_t{numEntries} * hashLength(objectHash);
    }

    void lookup::write(const std::vector<Entry> &sortedEntries, ChunkWriter &out) {
        for (const Entry &entry: sortedEntries)
            out.write(entry.id.asBytes());
    }

    std::uint64_t offsets::storageSize(std::size_t numEntries) {
        return std::uint64_t{numEntries} * (4 /* pack index */ + 4 /* offset or large offset index */);
    }

    void offsets::write(const std::vector<Entry> &sortedEntries, ChunkWriter &out) {
        std::uint32_t numLargeOffsets {0};
        for (const Entry &entry: sortedEntries) {
            writeBigEndian(out, entry.packIndex);

            std::uint32_t offset;
            if (needsLargeOffset(entry)) offset = HIGH_BIT | numLargeOffsets++;
            else offset = static_cast<std::uint32_t>(entry.packOffset);
            writeBigEndian(out, offset);
        }
    }

    std::uint32_t largeOffsets::numLargeOffsets(const std::vector<Entry> &entries) {
        std::uint32_t count {0};
        for (const Entry &entry: entries)
            if (needsLargeOffset(entry)) count++;
        return count;
    }

    std::uint64_t largeOffsets::storageSize(std::uint32_t numLargeOffsets) {
        return std::uint64_t{numLargeOffsets} * 8;
    }

    // Must visit entries in the same order as `offsets::write` so the indices line up
    void largeOffsets::write(const std::vector<Entry> &sortedEntries, std::uint32_t numLargeOffsets, ChunkWriter &out) {
        std::uint32_t written {0};
        for (const Entry &entry: sortedEntries) {
            if (needsLargeOffset(entry)) {
                writeBigEndian(out, entry.packOffset);
                written++;
            }
        }

        if (written != numLargeOffsets)
            throw std::logic_error("BUG: expected " + std::to_string(numLargeOffsets)
                    + " large offsets, wrote " + std::to_string(written));
    }
}
