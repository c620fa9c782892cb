#pragma once

#include <concepts>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>

namespace fs = std::filesystem;

// Reads the entire contents of a file into a string as raw bytes.
// Throws `IoError` if the file cannot be opened or read.
[[nodiscard]] std::string readBinaryFile(const fs::path &path);

// Reads a text file into a string, same error semantics as `readBinaryFile`
[[nodiscard]] std::string readTextFile(const fs::path &path);

// Converts an even length hex string to its binary representation.
[[nodiscard]] std::string hex2Binary(std::string_view hex);

// Converts raw bytes to a lowercase hex string, 2 chars per byte.
[[nodiscard]] std::string binary2Hex(std::string_view binary);

// Removes leading and trailing whitespace
std::string trim(const std::string &str);

std::string toLower(std::string str);

// Write `size` bytes or throw `IoError` naming `what`
void writeAll(std::ostream &os, const char *data, std::size_t size, std::string_view what);

// Util to read a Big Endian int* from a byte buffer at `pos`.
// Git uses BigEndian for a lot of its binary file formats
// This helper is system independent and works regardless
// of the endianness of the client. Caller ensures bounds.
template<typename T> requires std::integral<T>
T readBigEndian(std::string_view data, std::size_t pos) {
    using UT = std::make_unsigned_t<T>;
    UT val {0};
    for (std::size_t i = 0; i < sizeof(T); ++i)
        val = static_cast<UT>((val << 8) | static_cast<unsigned char>(data[pos + i]));
    return static_cast<T>(val);
}

// Utils to write input as Big Endian int* to anything with a `write(const char*, n)`.
// Independent of the endianness of the client
template <typename T, typename Sink> requires std::integral<T>
void writeBigEndian(Sink &out, T val) {
    using UT = std::make_unsigned_t<T>;
    UT uval {static_cast<UT>(val)};
    unsigned char buffer[sizeof(T)];
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        buffer[sizeof(T) - 1 - i] = static_cast<unsigned char>(uval & 0xFF);
        uval = static_cast<UT>(uval >> 8);
    }
    out.write(reinterpret_cast<const char *>(buffer), sizeof(T));
}

// Same as above but appends into an in memory buffer
template <typename T> requires std::integral<T>
void appendBigEndian(std::string &out, T val) {
    using UT = std::make_unsigned_t<T>;
    UT uval {static_cast<UT>(val)};
    for (int i = static_cast<int>(sizeof(T)) - 1; i >= 0; --i)
        out.push_back(static_cast<char>((uval >> (i * 8)) & 0xFF));
}
