#include "../include/utils.hpp"
#include "../include/Errors.hpp"
#include "../cryptography/hashlib.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

[[nodiscard]] std::string readBinaryFile(const fs::path &path) {
    std::ifstream ifs {path, std::ios::binary};
    if (!ifs) throw IoError("Failed to open file for reading: " + path.string());
    std::ostringstream oss;
    oss << ifs.rdbuf();
    if (ifs.bad()) throw IoError("Failed to read file: " + path.string());
    return oss.str();
}

[[nodiscard]] std::string readTextFile(const fs::path &path) {
    std::ifstream ifs {path};
    if (!ifs) throw IoError("Failed to open file for reading: " + path.string());
    std::ostringstream oss;
    oss << ifs.rdbuf();
    if (ifs.bad()) throw IoError("Failed to read file: " + path.string());
    return oss.str();
}

[[nodiscard]] std::string hex2Binary(std::string_view hex) {
    if (hex.size() % 2 != 0)
        throw std::invalid_argument("Hex string must have an even length: " + std::string{hex});

    auto nibble {[&hex](char ch) -> int {
        if (ch >= '0' && ch <= '9') return ch - '0';
        else if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
        else if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
        throw std::invalid_argument("Invalid hex string: " + std::string{hex});
    }};

    std::string binary;
    binary.reserve(hex.size() / 2);
    for (std::size_t i {0}; i < hex.size(); i += 2)
        binary.push_back(static_cast<char>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
    return binary;
}

[[nodiscard]] std::string binary2Hex(std::string_view binary) {
    return hashutil::toHex(binary);
}

std::string trim(const std::string &str) {
    auto notSpace {[](unsigned char ch) { return !std::isspace(ch); }};
    auto first {std::find_if(str.begin(), str.end(), notSpace)};
    auto last {std::find_if(str.rbegin(), str.rend(), notSpace).base()};
    return first < last? std::string(first, last): std::string{};
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return str;
}

void writeAll(std::ostream &os, const char *data, std::size_t size, std::string_view what) {
    os.write(data, static_cast<std::streamsize>(size));
    if (!os) throw IoError("Failed to write " + std::string{what});
}
