#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string_view>
#include <zlib.h>

namespace zhelper {
    // zlib's crc32 over arbitrarily long input, `crc` continues a previous run
    [[nodiscard]] inline std::uint32_t crc32(std::string_view data, std::uint32_t crc = 0) {
        uLong running {crc};
        while (!data.empty()) {
            std::size_t chunk {std::min<std::size_t>(data.size(), std::numeric_limits<uInt>::max())};
            running = ::crc32(running, reinterpret_cast<const Bytef *>(data.data()), static_cast<uInt>(chunk));
            data.remove_prefix(chunk);
        }
        return static_cast<std::uint32_t>(running);
    }
}
