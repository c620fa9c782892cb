#pragma once

#include "ObjectId.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// One record of a pack index
struct PackIndexEntry {
    ObjectId oid;
    std::uint64_t packOffset;

    // Only version 2 indices store the crc32 of the packed object
    std::optional<std::uint32_t> crc32;
};

// Read only view of a `.git/objects/pack/*.idx` file (version 1 or 2).
// The whole file is loaded into memory on `at`, every accessor works on that buffer.
class GitPackIndex {
    public:
        static constexpr std::size_t FANOUT_ENTRIES {256};
        static constexpr std::size_t FANOUT_SIZE {FANOUT_ENTRIES * 4};

        // Offsets with this bit set point into the 64 bit offset table (v2 only)
        static constexpr std::uint32_t LARGE_OFFSET_MARKER {1u << 31};

        static const std::string_view V2_SIGNATURE;

    private:
        fs::path path;
        std::string data;
        ObjectHash objectHash;
        unsigned int version;
        std::uint32_t objectCount;
        std::uint64_t largeOffsetCount {0};

        GitPackIndex(const fs::path &path, std::string &&data, ObjectHash objectHash);

        // Validate the header, the fanout & the total file size; fills version & counts
        void parseLayout();

        std::size_t hashLen() const { return hashLength(objectHash); }
        std::uint64_t fanoutStart() const { return version == 2? 8: 0; }
        std::uint64_t lookupStart() const { return fanoutStart() + FANOUT_SIZE; }
        std::uint64_t crcStart() const { return lookupStart() + std::uint64_t{objectCount} * hashLen(); }
        std::uint64_t offsetStart() const { return crcStart() + std::uint64_t{objectCount} * 4; }
        std::uint64_t largeOffsetStart() const { return offsetStart() + std::uint64_t{objectCount} * 4; }
        std::uint64_t trailerStart() const { return data.size() - 2 * hashLen(); }

        // Byte position of the object id at `index` for either version
        std::uint64_t oidPosition(std::uint32_t index) const;

        void checkIndex(std::uint32_t index) const;

    public:
        // Open and validate the index at `path`. Throws `IoError` if unreadable
        // and `PackIndexError` if the contents are malformed.
        static GitPackIndex at(const fs::path &path, ObjectHash objectHash);

        const fs::path &getPath() const { return path; }
        unsigned int getVersion() const { return version; }
        ObjectHash getObjectHash() const { return objectHash; }
        std::uint32_t numObjects() const { return objectCount; }

        // Cumulative count of objects whose first byte is <= `byte`
        std::uint32_t fanoutAt(std::uint8_t byte) const;

        ObjectId oidAt(std::uint32_t index) const;
        std::uint64_t packOffsetAt(std::uint32_t index) const;
        std::optional<std::uint32_t> crc32At(std::uint32_t index) const;
        PackIndexEntry entryAt(std::uint32_t index) const;

        // All records in index order (ascending object id)
        std::vector<PackIndexEntry> entries() const;

        // Binary search narrowed by the fanout table, returns the record index if present
        std::optional<std::uint32_t> lookup(const ObjectId &id) const;

        ObjectId packChecksum() const;
        ObjectId indexChecksum() const;

        // Recompute the hash over everything but the trailing index checksum
        [[nodiscard]] bool verifyChecksum() const;

        // Check every stored crc32 against the packed bytes of `packPath` (version 2 only).
        // An object spans from its offset up to the next one or the pack trailer.
        // Returns the record indices that do not match, throws `PackIndexError` if
        // the pack does not belong to this index.
        std::vector<std::uint32_t> verifyPackCrcs(const fs::path &packPath) const;
};
