#include "../include/ChunkFile.hpp"
#include "../include/Errors.hpp"
#include "../include/utils.hpp"

#include <algorithm>
#include <stdexcept>

ChunkIndex::ChunkIndex(std::vector<ChunkId> canonicalOrder): canonicalOrder(std::move(canonicalOrder)) {}

std::size_t ChunkIndex::rank(const ChunkId &id) const {
    auto it {std::find(canonicalOrder.begin(), canonicalOrder.end(), id)};
    if (it == canonicalOrder.end())
        throw std::logic_error("BUG: chunk '" + chunkIdName(id) + "' is not part of this file format");
    return static_cast<std::size_t>(it - canonicalOrder.begin());
}

void ChunkIndex::planChunk(const ChunkId &id, std::uint64_t size) {
    std::size_t idRank {rank(id)};
    for (const PlannedChunk &chunk: chunks) {
        if (chunk.id == id)
            throw std::logic_error("BUG: chunk '" + chunkIdName(id) + "' was planned twice");
    }

    // Insert before the first chunk that ranks after us
    auto pos {std::find_if(chunks.begin(), chunks.end(), [&](const PlannedChunk &chunk) {
        return rank(chunk.id) > idRank;
    })};
    chunks.insert(pos, PlannedChunk{.id=id, .size=size});
}

ChunkWriter ChunkIndex::intoWrite(std::ostream &out, std::uint64_t currentOffset) const {
    std::uint64_t offset {currentOffset + sizeForEntries(chunks.size())};
    for (const PlannedChunk &chunk: chunks) {
        writeAll(out, chunk.id.data(), chunk.id.size(), "chunk table");
        writeBigEndian(out, offset);
        offset += chunk.size;
    }

    // Sentinel to mark end of chunks
    writeBigEndian(out, std::uint32_t{0});
    writeBigEndian(out, offset);
    if (!out) throw IoError("Failed to write chunk table");

    return ChunkWriter{out, chunks};
}

ChunkWriter::ChunkWriter(std::ostream &out, std::vector<PlannedChunk> chunks):
    out(out), chunks(std::move(chunks)) {}

void ChunkWriter::verifyCurrent() const {
    if (current && written != current->size)
        throw std::logic_error("BUG: chunk '" + chunkIdName(current->id) + "' was planned with "
                + std::to_string(current->size) + " bytes but " + std::to_string(written) + " were written");
}

std::optional<ChunkId> ChunkWriter::nextChunk() {
    verifyCurrent();
    if (next >= chunks.size()) {
        current.reset();
        return std::nullopt;
    }

    current = chunks[next++];
    written = 0;
    return current->id;
}

ChunkWriter &ChunkWriter::write(const char *data, std::size_t size) {
    if (!current)
        throw std::logic_error("BUG: chunk payload written outside of a chunk");
    if (written + size > current->size)
        throw std::logic_error("BUG: chunk '" + chunkIdName(current->id) + "' exceeds its planned size of "
                + std::to_string(current->size) + " bytes");

    out.write(data, static_cast<std::streamsize>(size));
    if (!out) throw IoError("Failed to write chunk '" + chunkIdName(current->id) + "'");
    written += size;
    return *this;
}
