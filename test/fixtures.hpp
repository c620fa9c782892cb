#pragma once

#include "../include/ObjectId.hpp"
#include "../include/utils.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace fixtures {
    // Scratch directory removed (recursively) when going out of scope
    class TempDir {
        private:
            fs::path root;

        public:
            TempDir() {
                std::random_device rd;
                std::mt19937_64 gen {rd()};
                for (int attempt {0}; attempt < 16; attempt++) {
                    fs::path candidate {fs::temp_directory_path() / ("cmidx-test-" + std::to_string(gen()))};
                    if (fs::create_directory(candidate)) {
                        root = candidate;
                        return;
                    }
                }
                throw std::runtime_error("Unable to create a temporary directory");
            }

            ~TempDir() {
                std::error_code ec;
                fs::remove_all(root, ec);
            }

            TempDir(const TempDir&) = delete;
            TempDir &operator=(const TempDir&) = delete;

            const fs::path &path() const { return root; }
            fs::path operator/(const std::string &name) const { return root / name; }
    };

    struct IdxRecord {
        ObjectId id;
        std::uint64_t offset;
        std::uint32_t crc32 {0};
    };

    // Id of `kind` width, all zeros except for the first and last byte
    inline ObjectId makeId(ObjectHash kind, std::uint8_t first, std::uint8_t last = 0) {
        std::string bytes(hashLength(kind), '\0');
        bytes.front() = static_cast<char>(first);
        bytes.back() = static_cast<char>(last);
        return ObjectId{bytes};
    }

    inline std::string hashOf(ObjectHash kind, std::string_view data) {
        return std::string{ObjectHasher{kind}.update(data).digest().asBytes()};
    }

    inline std::vector<IdxRecord> sortedRecords(std::vector<IdxRecord> records) {
        std::sort(records.begin(), records.end(), [](const IdxRecord &l, const IdxRecord &r) { return l.id < r.id; });
        return records;
    }

    inline void appendFanout(std::string &out, const std::vector<IdxRecord> &sorted) {
        for (std::size_t slot {0}; slot < 256; slot++) {
            std::uint32_t count {static_cast<std::uint32_t>(std::count_if(sorted.begin(), sorted.end(),
                [slot](const IdxRecord &r) { return r.id.firstByte() <= slot; }))};
            appendBigEndian(out, count);
        }
    }

    // Pack checksum defaults to an arbitrary hash, index checksum is the real hash of everything before it
    inline void appendTrailer(std::string &out, ObjectHash kind, const std::string &packChecksum = "") {
        out += packChecksum.empty()? hashOf(kind, "pack"): packChecksum;
        out += hashOf(kind, out);
    }

    // Version 2 pack index, offsets above 31 bits go to the large offset table
    inline std::string buildIdxV2(
        std::vector<IdxRecord> records, ObjectHash kind = ObjectHash::Sha1, const std::string &packChecksum = ""
    ) {
        std::vector<IdxRecord> sorted {sortedRecords(std::move(records))};

        std::string out {"\377tOc", 4};
        appendBigEndian(out, std::uint32_t{2});
        appendFanout(out, sorted);
        for (const IdxRecord &r: sorted) out += r.id.asBytes();
        for (const IdxRecord &r: sorted) appendBigEndian(out, r.crc32);

        std::vector<std::uint64_t> large;
        for (const IdxRecord &r: sorted) {
            if (r.offset > 0x7fff'ffff) {
                appendBigEndian(out, static_cast<std::uint32_t>(0x8000'0000 | large.size()));
                large.push_back(r.offset);
            } else {
                appendBigEndian(out, static_cast<std::uint32_t>(r.offset));
            }
        }
        for (std::uint64_t offset: large) appendBigEndian(out, offset);

        appendTrailer(out, kind, packChecksum);
        return out;
    }

    // Version 1 pack index, offsets must fit into 32 bits
    inline std::string buildIdxV1(std::vector<IdxRecord> records, ObjectHash kind = ObjectHash::Sha1) {
        std::vector<IdxRecord> sorted {sortedRecords(std::move(records))};

        std::string out;
        appendFanout(out, sorted);
        for (const IdxRecord &r: sorted) {
            appendBigEndian(out, static_cast<std::uint32_t>(r.offset));
            out += r.id.asBytes();
        }

        appendTrailer(out, kind);
        return out;
    }

    // Pack file holding `objects` verbatim (no real object headers), good enough for crc checks
    struct PackFixture {
        std::string bytes;
        std::vector<std::uint64_t> offsets;
        std::string checksum;
    };

    inline PackFixture buildPack(const std::vector<std::string> &objects, ObjectHash kind = ObjectHash::Sha1) {
        PackFixture pack;
        pack.bytes = "PACK";
        appendBigEndian(pack.bytes, std::uint32_t{2});
        appendBigEndian(pack.bytes, static_cast<std::uint32_t>(objects.size()));
        for (const std::string &object: objects) {
            pack.offsets.push_back(pack.bytes.size());
            pack.bytes += object;
        }
        pack.checksum = hashOf(kind, pack.bytes);
        pack.bytes += pack.checksum;
        return pack;
    }

    inline void writeFile(const fs::path &path, std::string_view data) {
        std::ofstream ofs {path, std::ios::binary | std::ios::trunc};
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!ofs) throw std::runtime_error("Unable to write fixture: " + path.string());
    }

    inline fs::path writeIdx(const fs::path &path, std::string_view data) {
        writeFile(path, data);
        return path;
    }

    // Pin a file's mtime relative to now, used to control the duplicate tie-break
    inline void setMtime(const fs::path &path, std::chrono::seconds ago) {
        fs::last_write_time(path, fs::file_time_type::clock::now() - ago);
    }

    // Decoded multi-pack-index header & chunk table, for assertions
    struct ParsedMidx {
        std::string data;
        std::uint8_t version, hashKind, numChunks, numBaseFiles;
        std::uint32_t numPacks;
        std::vector<std::pair<std::string, std::uint64_t>> chunks;

        // Payload of a chunk, empty if the chunk is absent
        std::string_view chunk(const std::string &id) const {
            for (std::size_t i {0}; i < chunks.size(); i++) {
                if (chunks[i].first == id) {
                    std::uint64_t end {chunks[i + 1].second};
                    return std::string_view{data}.substr(chunks[i].second, end - chunks[i].second);
                }
            }
            return {};
        }

        bool hasChunk(const std::string &id) const {
            return std::any_of(chunks.begin(), chunks.end(), [&](const auto &c) { return c.first == id; });
        }

        std::size_t hashLen() const { return hashKind == 2? 32: 20; }

        std::uint32_t fanout(std::uint8_t slot) const {
            return readBigEndian<std::uint32_t>(chunk("OIDF"), std::size_t{slot} * 4);
        }

        std::uint32_t numObjects() const { return fanout(255); }

        ObjectId oidAt(std::size_t i) const {
            return ObjectId{chunk("OIDL").substr(i * hashLen(), hashLen())};
        }

        std::uint32_t packOf(std::size_t i) const {
            return readBigEndian<std::uint32_t>(chunk("OOFF"), i * 8);
        }

        std::uint32_t rawOffsetOf(std::size_t i) const {
            return readBigEndian<std::uint32_t>(chunk("OOFF"), i * 8 + 4);
        }

        std::uint64_t offsetOf(std::size_t i) const {
            std::uint32_t raw {rawOffsetOf(i)};
            if (!(raw & 0x8000'0000)) return raw;
            return readBigEndian<std::uint64_t>(chunk("LOFF"), std::size_t{raw & 0x7fff'ffff} * 8);
        }

        // NUL separated names, padding dropped
        std::vector<std::string> packNames() const {
            std::vector<std::string> names;
            std::string_view pnam {chunk("PNAM")};
            std::size_t pos {0};
            while (pos < pnam.size() && pnam[pos] != '\0') {
                std::size_t end {pnam.find('\0', pos)};
                names.emplace_back(pnam.substr(pos, end - pos));
                pos = end + 1;
            }
            return names;
        }

        std::string_view trailer() const { return std::string_view{data}.substr(data.size() - hashLen()); }
    };

    inline ParsedMidx parseMidx(std::string data) {
        if (data.size() < 12 || data.substr(0, 4) != "MIDX")
            throw std::runtime_error("Not a multi-pack-index");

        ParsedMidx midx;
        midx.data = std::move(data);
        midx.version = static_cast<std::uint8_t>(midx.data[4]);
        midx.hashKind = static_cast<std::uint8_t>(midx.data[5]);
        midx.numChunks = static_cast<std::uint8_t>(midx.data[6]);
        midx.numBaseFiles = static_cast<std::uint8_t>(midx.data[7]);
        midx.numPacks = readBigEndian<std::uint32_t>(midx.data, 8);

        // Includes the terminating entry
        for (std::size_t i {0}; i <= midx.numChunks; i++) {
            std::size_t pos {12 + i * 12};
            std::string id {midx.data.substr(pos, 4)};
            if (i == midx.numChunks) id = "";
            midx.chunks.emplace_back(id, readBigEndian<std::uint64_t>(midx.data, pos + 4));
        }
        return midx;
    }
}
