#pragma once

#include "../cryptography/hashlib.hpp"

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

// Object hash kind, the numeric value is what git persists in binary headers
enum class ObjectHash: std::uint8_t { Sha1 = 1, Sha256 = 2 };

// Width in bytes of a binary object id
constexpr std::size_t hashLength(ObjectHash kind) {
    return kind == ObjectHash::Sha256? 32: 20;
}

// "sha1" / "sha256", as used by `extensions.objectformat`
std::string_view objectHashName(ObjectHash kind);

// Inverse of `objectHashName`, case insensitive. Throws on unknown names
ObjectHash parseObjectHash(std::string_view name);

// Fixed width binary object identifier (20 bytes for SHA1, 32 for SHA256).
// Compares lexicographically by unsigned byte value.
class ObjectId {
    private:
        std::string bytes;

    public:
        ObjectId() = default;

        // Takes ownership of raw binary bytes, throws if the width matches no hash kind
        explicit ObjectId(std::string_view binary);

        // Parse a full length hex string (40 or 64 chars)
        static ObjectId fromHex(std::string_view hex);

        // Id with all bytes set to zero for the given kind
        static ObjectId null(ObjectHash kind);

        ObjectHash kind() const;
        std::size_t size() const { return bytes.size(); }
        bool empty() const { return bytes.empty(); }

        std::uint8_t firstByte() const;
        std::string_view asBytes() const { return bytes; }
        std::string hex() const;

        auto operator<=>(const ObjectId &other) const = default;
        bool operator==(const ObjectId &other) const = default;
};

// Incremental hasher over the digest matching an `ObjectHash`
class ObjectHasher {
    private:
        std::variant<hashutil::Sha1, hashutil::Sha256> hasher;

    public:
        explicit ObjectHasher(ObjectHash kind);

        ObjectHasher &update(std::string_view data);

        [[nodiscard]] ObjectId digest() const;
};
