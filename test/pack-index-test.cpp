#undef NDEBUG
#include <cassert>
#include <string>
#include <vector>

#include "fixtures.hpp"
#include "../include/Errors.hpp"
#include "../include/GitPackIndex.hpp"

using fixtures::IdxRecord;
using fixtures::makeId;

template<typename Error, typename Func>
bool throws(Func &&func) {
    try { func(); }
    catch (const Error&) { return true; }
    return false;
}

int main() {
    fixtures::TempDir tmp;

    // Version 2, SHA1: records come back sorted, with crc32s & 64 bit offsets
    {
        std::vector<IdxRecord> records {
            {makeId(ObjectHash::Sha1, 0xfe), 12, 0xdeadbeef},
            {makeId(ObjectHash::Sha1, 0x00, 1), 0x7fff'ffff, 1},
            {makeId(ObjectHash::Sha1, 0x80), 0x1'0000'0000ull, 2},
            {makeId(ObjectHash::Sha1, 0x80, 9), 0x8000'0000ull, 3},
        };
        fs::path path {fixtures::writeIdx(tmp / "v2.idx", fixtures::buildIdxV2(records))};
        GitPackIndex index {GitPackIndex::at(path, ObjectHash::Sha1)};

        assert(index.getVersion() == 2);
        assert(index.numObjects() == 4);
        assert(index.fanoutAt(0x00) == 1);
        assert(index.fanoutAt(0x7f) == 1);
        assert(index.fanoutAt(0x80) == 3);
        assert(index.fanoutAt(0xff) == 4);

        assert(index.oidAt(0) == makeId(ObjectHash::Sha1, 0x00, 1));
        assert(index.packOffsetAt(0) == 0x7fff'ffff);
        assert(index.oidAt(1) == makeId(ObjectHash::Sha1, 0x80));
        assert(index.packOffsetAt(1) == 0x1'0000'0000ull);
        assert(index.packOffsetAt(2) == 0x8000'0000ull);
        assert(index.entryAt(3).crc32 == 0xdeadbeef);
        assert(index.entryAt(3).packOffset == 12);

        assert(index.lookup(makeId(ObjectHash::Sha1, 0x80, 9)) == 2u);
        assert(!index.lookup(makeId(ObjectHash::Sha1, 0x80, 8)).has_value());
        assert(index.verifyChecksum());
        assert(index.packChecksum().asBytes() == fixtures::hashOf(ObjectHash::Sha1, "pack"));
    }

    // Version 1 has no crc32s and stores offset & id side by side
    {
        std::vector<IdxRecord> records {
            {makeId(ObjectHash::Sha1, 0x10), 100},
            {makeId(ObjectHash::Sha1, 0x01), 200},
        };
        fs::path path {fixtures::writeIdx(tmp / "v1.idx", fixtures::buildIdxV1(records))};
        GitPackIndex index {GitPackIndex::at(path, ObjectHash::Sha1)};

        assert(index.getVersion() == 1);
        assert(index.numObjects() == 2);
        std::vector<PackIndexEntry> entries {index.entries()};
        assert(entries[0].oid == makeId(ObjectHash::Sha1, 0x01));
        assert(entries[0].packOffset == 200);
        assert(!entries[0].crc32.has_value());
        assert(entries[1].packOffset == 100);
        assert(index.verifyChecksum());
    }

    // SHA256 ids are 32 bytes wide in both versions
    {
        std::vector<IdxRecord> records {
            {makeId(ObjectHash::Sha256, 0xaa, 0xbb), 42, 7},
            {makeId(ObjectHash::Sha256, 0x05), 0x2'0000'0000ull, 8},
        };
        fs::path v2 {fixtures::writeIdx(tmp / "sha256-v2.idx", fixtures::buildIdxV2(records, ObjectHash::Sha256))};
        GitPackIndex index {GitPackIndex::at(v2, ObjectHash::Sha256)};
        assert(index.numObjects() == 2);
        assert(index.oidAt(1).size() == 32);
        assert(index.oidAt(1) == makeId(ObjectHash::Sha256, 0xaa, 0xbb));
        assert(index.packOffsetAt(0) == 0x2'0000'0000ull);
        assert(index.verifyChecksum());

        records.pop_back();
        fs::path v1 {fixtures::writeIdx(tmp / "sha256-v1.idx", fixtures::buildIdxV1(records, ObjectHash::Sha256))};
        assert(GitPackIndex::at(v1, ObjectHash::Sha256).packOffsetAt(0) == 42);

        // Read with the wrong width the sizes no longer add up
        assert(throws<PackIndexError>([&] { GitPackIndex::at(v1, ObjectHash::Sha1); }));
    }

    // Stored crc32s checked against the pack, zlib's check value for "123456789" is 0xcbf43926
    {
        fixtures::PackFixture pack {fixtures::buildPack({"123456789", "a", "xyz"})};
        std::vector<IdxRecord> records {
            {makeId(ObjectHash::Sha1, 0x30), pack.offsets[0], 0xcbf43926},
            {makeId(ObjectHash::Sha1, 0x10), pack.offsets[1], 0xe8b7be43},
            {makeId(ObjectHash::Sha1, 0x20), pack.offsets[2], 0x12345678},
        };
        fixtures::writeFile(tmp / "pack-crc.pack", pack.bytes);
        fs::path path {fixtures::writeIdx(tmp / "pack-crc.idx", fixtures::buildIdxV2(records, ObjectHash::Sha1, pack.checksum))};
        GitPackIndex index {GitPackIndex::at(path, ObjectHash::Sha1)};

        // Only "xyz" carries a wrong crc, it sorts second by id
        assert((index.verifyPackCrcs(tmp / "pack-crc.pack") == std::vector<std::uint32_t>{1}));

        // A pack with a different trailer belongs to some other index
        fixtures::PackFixture other {fixtures::buildPack({"123456789", "a", "xyw"})};
        fixtures::writeFile(tmp / "other.pack", other.bytes);
        assert(throws<PackIndexError>([&] { index.verifyPackCrcs(tmp / "other.pack"); }));

        // Version 1 has nothing to check
        fs::path v1 {fixtures::writeIdx(tmp / "pack-crc-v1.idx", fixtures::buildIdxV1(records))};
        assert(throws<PackIndexError>([&] { GitPackIndex::at(v1, ObjectHash::Sha1).verifyPackCrcs(tmp / "pack-crc.pack"); }));
    }

    // An empty index is valid
    {
        fs::path path {fixtures::writeIdx(tmp / "empty.idx", fixtures::buildIdxV2({}))};
        GitPackIndex index {GitPackIndex::at(path, ObjectHash::Sha1)};
        assert(index.numObjects() == 0);
        assert(index.entries().empty());
        assert(!index.lookup(makeId(ObjectHash::Sha1, 0)).has_value());
    }

    // Malformed inputs
    {
        std::string good {fixtures::buildIdxV2({IdxRecord{makeId(ObjectHash::Sha1, 0x42), 1}})};

        // Missing file
        assert(throws<IoError>([&] { GitPackIndex::at(tmp / "missing.idx", ObjectHash::Sha1); }));

        // Truncated
        fs::path truncated {fixtures::writeIdx(tmp / "truncated.idx", good.substr(0, good.size() - 3))};
        assert(throws<PackIndexError>([&] { GitPackIndex::at(truncated, ObjectHash::Sha1); }));

        // Unsupported version
        std::string v3 {good}; v3[7] = 3;
        fs::path badVersion {fixtures::writeIdx(tmp / "v3.idx", v3)};
        assert(throws<PackIndexError>([&] { GitPackIndex::at(badVersion, ObjectHash::Sha1); }));

        // Fanout going backwards
        std::string backwards {good}; backwards[8 + 3] = 5;
        fs::path badFanout {fixtures::writeIdx(tmp / "fanout.idx", backwards)};
        assert(throws<PackIndexError>([&] { GitPackIndex::at(badFanout, ObjectHash::Sha1); }));

        // Large offset reference past the table
        std::string dangling {good};
        std::size_t offsetPos {8 + 1024 + 20 + 4};
        dangling[offsetPos] = static_cast<char>(0x80);
        GitPackIndex index {GitPackIndex::at(fixtures::writeIdx(tmp / "dangling.idx", dangling), ObjectHash::Sha1)};
        assert(throws<PackIndexError>([&] { index.packOffsetAt(0); }));

        // Corrupt checksum is only noticed on request
        std::string corrupt {good}; corrupt[8 + 1024] ^= 1;
        GitPackIndex corrupted {GitPackIndex::at(fixtures::writeIdx(tmp / "corrupt.idx", corrupt), ObjectHash::Sha1)};
        assert(!corrupted.verifyChecksum());
    }

    return 0;
}
