#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// 4 byte tag naming a chunk, eg: "OIDF"
using ChunkId = std::array<char, 4>;

constexpr ChunkId makeChunkId(const char (&tag)[5]) {
    return ChunkId{tag[0], tag[1], tag[2], tag[3]};
}

inline std::string chunkIdName(const ChunkId &id) { return std::string(id.data(), id.size()); }

struct PlannedChunk {
    ChunkId id;
    std::uint64_t size;
};

class ChunkWriter;

// Chunk table of a chunked file format (git's commit-graph & multi-pack-index).
// Chunks are planned with their exact sizes before anything gets written.
// The table keeps them in the canonical order it was constructed with,
// regardless of the order `planChunk` was called in.
class ChunkIndex {
    public:
        // Each table entry: 4 byte id + 8 byte absolute offset
        static constexpr std::size_t ENTRY_LEN {4 + 8};

    private:
        std::vector<ChunkId> canonicalOrder;
        std::vector<PlannedChunk> chunks;

        std::size_t rank(const ChunkId &id) const;

    public:
        explicit ChunkIndex(std::vector<ChunkId> canonicalOrder);

        // Throws `std::logic_error` if `id` is not part of the canonical order or already planned
        void planChunk(const ChunkId &id, std::uint64_t size);

        std::size_t numChunks() const { return chunks.size(); }
        const std::vector<PlannedChunk> &plannedChunks() const { return chunks; }

        // Size of the table itself, including the terminating entry
        static constexpr std::size_t sizeForEntries(std::size_t numChunks) {
            return ENTRY_LEN * (numChunks + 1);
        }

        // Writes the chunk table to `out` and returns a writer that hands out the chunks in order.
        // `currentOffset` is the number of bytes already written before the table.
        ChunkWriter intoWrite(std::ostream &out, std::uint64_t currentOffset) const;
};

// Streams chunk payloads following a written chunk table.
// Usage: `while (auto id = writer.nextChunk()) { ...write exactly the planned bytes... }`
class ChunkWriter {
    private:
        std::ostream &out;
        std::vector<PlannedChunk> chunks;
        std::size_t next {0};
        std::optional<PlannedChunk> current;
        std::uint64_t written {0};

        // A chunk not matching its plan is a bug in the caller, not an I/O condition
        void verifyCurrent() const;

    public:
        ChunkWriter(std::ostream &out, std::vector<PlannedChunk> chunks);

        // Id of the next chunk to write, std::nullopt once all chunks are done
        std::optional<ChunkId> nextChunk();

        // Write payload bytes for the current chunk, throws `IoError` on stream failure
        ChunkWriter &write(const char *data, std::size_t size);
        ChunkWriter &write(std::string_view data) { return write(data.data(), data.size()); }

        std::uint64_t bytesWritten() const { return written; }
};
