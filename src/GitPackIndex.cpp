#include "../include/GitPackIndex.hpp"
#include "../include/Errors.hpp"
#include "../include/utils.hpp"
#include "../misc/zhelper.hpp"

#include <algorithm>
#include <numeric>

const std::string_view GitPackIndex::V2_SIGNATURE {"\377tOc", 4};

GitPackIndex::GitPackIndex(const fs::path &path, std::string &&data, ObjectHash objectHash):
    path(path), data(std::move(data)), objectHash(objectHash), version(0), objectCount(0) {}

GitPackIndex GitPackIndex::at(const fs::path &path, ObjectHash objectHash) {
    GitPackIndex index {path, readBinaryFile(path), objectHash};
    index.parseLayout();
    return index;
}

void GitPackIndex::parseLayout() {
    const std::string where {path.string()};
    const std::uint64_t size {data.size()};

    // Version 1 files have no header, they start with the fanout directly
    version = std::string_view{data}.starts_with(V2_SIGNATURE)? 2: 1;
    if (version == 2) {
        if (size < 8)
            throw PackIndexError("Pack index is truncated: " + where);
        std::uint32_t declared {readBigEndian<std::uint32_t>(data, 4)};
        if (declared != 2)
            throw PackIndexError("Unsupported pack index version " + std::to_string(declared) + ": " + where);
    }

    if (size < fanoutStart() + FANOUT_SIZE + 2 * hashLen())
        throw PackIndexError("Pack index is too small to hold a fanout table: " + where);

    // Fanout must never decrease, last slot is the object count
    std::uint32_t prev {0};
    for (std::size_t i {0}; i < FANOUT_ENTRIES; i++) {
        std::uint32_t curr {readBigEndian<std::uint32_t>(data, fanoutStart() + i * 4)};
        if (curr < prev)
            throw PackIndexError("Pack index fanout table is not monotonic at slot " + std::to_string(i) + ": " + where);
        prev = curr;
    }
    objectCount = prev;

    const std::uint64_t count {objectCount};
    if (version == 1) {
        std::uint64_t expected {FANOUT_SIZE + count * (4 + hashLen()) + 2 * hashLen()};
        if (size != expected)
            throw PackIndexError("Pack index size mismatch, expected " + std::to_string(expected)
                    + " bytes, got " + std::to_string(size) + ": " + where);
    } else {
        // Anything between the 32 bit offsets and the trailer must be 64 bit offsets
        std::uint64_t minimum {largeOffsetStart() + 2 * hashLen()};
        if (size < minimum || (size - minimum) % 8 != 0)
            throw PackIndexError("Pack index size mismatch, expected " + std::to_string(minimum)
                    + " bytes plus 8 byte large offsets, got " + std::to_string(size) + ": " + where);
        largeOffsetCount = (size - minimum) / 8;
    }
}

std::uint64_t GitPackIndex::oidPosition(std::uint32_t index) const {
    if (version == 2)
        return lookupStart() + std::uint64_t{index} * hashLen();
    else
        return lookupStart() + std::uint64_t{index} * (4 + hashLen()) + 4;
}

void GitPackIndex::checkIndex(std::uint32_t index) const {
    if (index >= objectCount)
        throw std::out_of_range("Pack index record " + std::to_string(index) + " out of range, index has "
                + std::to_string(objectCount) + " objects: " + path.string());
}

std::uint32_t GitPackIndex::fanoutAt(std::uint8_t byte) const {
    return readBigEndian<std::uint32_t>(data, fanoutStart() + std::uint64_t{byte} * 4);
}

ObjectId GitPackIndex::oidAt(std::uint32_t index) const {
    checkIndex(index);
    return ObjectId{std::string_view{data}.substr(oidPosition(index), hashLen())};
}

std::uint64_t GitPackIndex::packOffsetAt(std::uint32_t index) const {
    checkIndex(index);
    if (version == 1)
        return readBigEndian<std::uint32_t>(data, lookupStart() + std::uint64_t{index} * (4 + hashLen()));

    // First layer contains direct entries
    std::uint32_t r1 {readBigEndian<std::uint32_t>(data, offsetStart() + std::uint64_t{index} * 4)};
    if (!(r1 & LARGE_OFFSET_MARKER))
        return r1;

    // First layer points to second layer
    std::uint32_t largeIndex {r1 & ~LARGE_OFFSET_MARKER};
    if (largeIndex >= largeOffsetCount)
        throw PackIndexError("Pack index large offset reference " + std::to_string(largeIndex)
                + " out of range: " + path.string());
    return readBigEndian<std::uint64_t>(data, largeOffsetStart() + std::uint64_t{largeIndex} * 8);
}

std::optional<std::uint32_t> GitPackIndex::crc32At(std::uint32_t index) const {
    checkIndex(index);
    if (version == 1) return std::nullopt;
    return readBigEndian<std::uint32_t>(data, crcStart() + std::uint64_t{index} * 4);
}

PackIndexEntry GitPackIndex::entryAt(std::uint32_t index) const {
    return PackIndexEntry{
        .oid=oidAt(index),
        .packOffset=packOffsetAt(index),
        .crc32=crc32At(index)
    };
}

std::vector<PackIndexEntry> GitPackIndex::entries() const {
    std::vector<PackIndexEntry> result;
    result.reserve(objectCount);
    for (std::uint32_t i {0}; i < objectCount; i++)
        result.emplace_back(entryAt(i));
    return result;
}

std::optional<std::uint32_t> GitPackIndex::lookup(const ObjectId &id) const {
    if (id.size() != hashLen()) return std::nullopt;

    // Check fanout table - narrows down to ids sharing the first byte
    std::uint8_t first {id.firstByte()};
    std::uint32_t start {first == 0? 0: fanoutAt(static_cast<std::uint8_t>(first - 1))};
    std::uint32_t end {fanoutAt(first)};

    std::string_view needle {id.asBytes()};
    while (start < end) {
        std::uint32_t mid {start + (end - start) / 2};
        int cmp {std::string_view{data}.substr(oidPosition(mid), hashLen()).compare(needle)};
        if (cmp == 0) return mid;
        else if (cmp < 0) start = mid + 1;
        else end = mid;
    }

    return std::nullopt;
}

ObjectId GitPackIndex::packChecksum() const {
    return ObjectId{std::string_view{data}.substr(trailerStart(), hashLen())};
}

ObjectId GitPackIndex::indexChecksum() const {
    return ObjectId{std::string_view{data}.substr(trailerStart() + hashLen(), hashLen())};
}

bool GitPackIndex::verifyChecksum() const {
    ObjectHasher hasher {objectHash};
    hasher.update(std::string_view{data}.substr(0, data.size() - hashLen()));
    return hasher.digest() == indexChecksum();
}

std::vector<std::uint32_t> GitPackIndex::verifyPackCrcs(const fs::path &packPath) const {
    if (version != 2)
        throw PackIndexError("Version 1 pack indices carry no crc32s: " + path.string());

    const std::string pack {readBinaryFile(packPath)};
    constexpr std::size_t PACK_HEADER_LEN {12};
    if (pack.size() < PACK_HEADER_LEN + hashLen() || !std::string_view{pack}.starts_with("PACK"))
        throw PackIndexError("Not a pack file: " + packPath.string());

    const std::uint64_t packEnd {pack.size() - hashLen()};
    if (std::string_view{pack}.substr(packEnd) != packChecksum().asBytes())
        throw PackIndexError("Pack " + packPath.string() + " does not belong to index " + path.string());

    // Objects are laid out back to back, visit them in pack order
    std::vector<std::uint32_t> order(objectCount);
    std::iota(order.begin(), order.end(), 0u);
    std::vector<std::uint64_t> offsets;
    offsets.reserve(objectCount);
    for (std::uint32_t i {0}; i < objectCount; i++)
        offsets.emplace_back(packOffsetAt(i));
    std::sort(order.begin(), order.end(), [&](std::uint32_t l, std::uint32_t r) { return offsets[l] < offsets[r]; });

    std::vector<std::uint32_t> mismatches;
    for (std::size_t pos {0}; pos < order.size(); pos++) {
        std::uint32_t index {order[pos]};
        std::uint64_t start {offsets[index]};
        std::uint64_t end {pos + 1 < order.size()? offsets[order[pos + 1]]: packEnd};
        if (start < PACK_HEADER_LEN || end > packEnd || start >= end)
            throw PackIndexError("Object " + oidAt(index).hex() + " has an impossible pack offset "
                    + std::to_string(start) + ": " + packPath.string());

        std::uint32_t actual {zhelper::crc32(std::string_view{pack}.substr(start, end - start))};
        if (actual != *crc32At(index)) mismatches.push_back(index);
    }

    std::sort(mismatches.begin(), mismatches.end());
    return mismatches;
}
