#pragma once

#include "ChunkFile.hpp"
#include "ObjectId.hpp"

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

/* multi-pack-index layout (all integers big endian):
 * [header
 *   4 bytes signature "MIDX"
 *   1 byte  version
 *   1 byte  object hash kind (1 = sha1, 2 = sha256)
 *   1 byte  number of chunks
 *   1 byte  number of base files (always 0)
 *   4 bytes number of pack files
 * ]
 * [chunk table, (chunks + 1) entries of
 *   4 bytes chunk id
 *   8 bytes absolute offset of the chunk, the last entry has id 0 and points at the end
 * ]
 * [PNAM  index file names, each NUL terminated, zero padded to 4 byte alignment]
 * [OIDF  256 cumulative object counts per leading id byte, 4 bytes each]
 * [OIDL  sorted object ids]
 * [OOFF  per object: 4 bytes pack ordinal, 4 bytes offset or (high bit | large offset index)]
 * [LOFF  optional, 8 bytes per offset that does not fit into 31 bits]
 * [trailer: checksum of everything above]
 */
namespace MultiIndex {
    inline constexpr std::string_view SIGNATURE {"MIDX"};

    enum class Version: std::uint8_t { V1 = 1 };

    inline constexpr std::size_t HEADER_LEN {
        4 /* signature */ +
        1 /* version */ +
        1 /* object id version */ +
        1 /* num chunks */ +
        1 /* num base files */ +
        4 /* num pack files */
    };

    // Offsets above this need the large offset table
    inline constexpr std::uint64_t LARGE_OFFSET_THRESHOLD {0x7fff'ffff};
    inline constexpr std::uint32_t HIGH_BIT {0x8000'0000};

    inline constexpr std::size_t CHUNK_ALIGNMENT {4};

    namespace chunk {
        namespace indexNames   { inline constexpr ChunkId ID {makeChunkId("PNAM")}; }
        namespace fanout       { inline constexpr ChunkId ID {makeChunkId("OIDF")}; }
        namespace lookup       { inline constexpr ChunkId ID {makeChunkId("OIDL")}; }
        namespace offsets      { inline constexpr ChunkId ID {makeChunkId("OOFF")}; }
        namespace largeOffsets { inline constexpr ChunkId ID {makeChunkId("LOFF")}; }

        // Order in which chunks appear in the file, readers depend on it
        inline const std::vector<ChunkId> CANONICAL_ORDER {
            indexNames::ID, fanout::ID, lookup::ID, offsets::ID, largeOffsets::ID
        };
    }

    // An object location before deduplication
    struct Entry {
        ObjectId id;

        // Ordinal of the source index in sorted path order
        std::uint32_t packIndex;
        std::uint64_t packOffset;

        // Only used to pick a winner among duplicates, never persisted
        fs::file_time_type indexMtime;
    };
}
