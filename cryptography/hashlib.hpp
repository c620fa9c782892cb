#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace hashutil {
    namespace impl {
        // Buffers arbitrary input into 64 byte blocks and applies the Merkle-Damgard
        // padding shared by SHA1 & SHA256: 0x80, zeros, then the 64 bit message length
        class BlockFeeder {
            private:
                std::array<std::uint8_t, 64> block {};
                std::size_t filled {0};
                std::uint64_t total {0};

            public:
                template<typename OnBlock>
                void feed(std::string_view data, OnBlock &&onBlock) {
                    total += data.size();
                    for (const char &ch: data) {
                        block[filled++] = static_cast<std::uint8_t>(ch);
                        if (filled == 64) {
                            onBlock(block.data());
                            filled = 0;
                        }
                    }
                }

                // Message length must be captured before padding is fed
                template<typename OnBlock>
                void finish(OnBlock &&onBlock) {
                    std::uint64_t bitLen {total * 8ull};
                    block[filled++] = 0x80;
                    if (filled > 56) {
                        while (filled < 64) block[filled++] = 0;
                        onBlock(block.data());
                        filled = 0;
                    }

                    while (filled < 56) block[filled++] = 0;
                    for (int i = 7; i >= 0; --i)
                        block[filled++] = static_cast<std::uint8_t>(bitLen >> (i * 8));
                    onBlock(block.data());
                    filled = 0;
                }
        };

        constexpr std::uint32_t loadBigEndian(const std::uint8_t *bytes) {
            return
                static_cast<std::uint32_t>(bytes[0]) << 24 |
                static_cast<std::uint32_t>(bytes[1]) << 16 |
                static_cast<std::uint32_t>(bytes[2]) <<  8 |
                static_cast<std::uint32_t>(bytes[3]) <<  0;
        }

        template<std::size_t N>
        std::string toDigest(const std::array<std::uint32_t, N> &state) {
            std::string digest; digest.reserve(N * 4);
            for (std::uint32_t part: state) {
                for (int i = 3; i >= 0; --i)
                    digest.push_back(static_cast<char>((part >> (i * 8)) & 0xFF));
            }
            return digest;
        }
    }

    constexpr char x2c(std::uint8_t val) { return "0123456789abcdef"[val]; }

    // Lowercase hex representation of raw bytes, two chars per byte
    inline std::string toHex(std::string_view bytes) {
        std::string out; out.reserve(bytes.size() * 2);
        for (const char &ch: bytes) {
            std::uint8_t byte {static_cast<std::uint8_t>(ch)};
            out.push_back(x2c(byte >> 4));
            out.push_back(x2c(byte & 0xF));
        }
        return out;
    }

    constexpr std::uint32_t rotate_left(std::uint32_t b, unsigned shift) {
        shift = shift & 31u;
        return (b << shift) | (b >> ((32u - shift) & 31u));
    }

    constexpr std::uint32_t rotate_right(std::uint32_t b, unsigned shift) {
        shift = shift & 31u;
        return (b >> shift) | (b << ((32u - shift) & 31u));
    }

    // Incremental SHA1, bytes can be fed in any number of `update` calls
    class Sha1 {
        public:
            static constexpr std::size_t DIGEST_SIZE {20};

        private:
            std::array<std::uint32_t, 5> state {0x67452301, 0xefcdab89, 0x98badcfe, 0x10325476, 0xc3d2e1f0};
            impl::BlockFeeder feeder;

            void processBlock(const std::uint8_t *chunk) {
                // Convert 16 word array into 80 worded array using bit wise formula
                std::array<std::uint32_t, 80> word;
                for (std::size_t j {0}; j < 16; ++j)
                    word[j] = impl::loadBigEndian(chunk + j * 4);
                for (std::size_t j {16}; j < 80; ++j)
                    word[j] = rotate_left(word[j - 3] ^ word[j - 8] ^ word[j - 14] ^ word[j - 16], 1);

                std::uint32_t a {state[0]}, b {state[1]}, c {state[2]}, d {state[3]}, e {state[4]};
                for (std::size_t j {0}; j < 80; ++j) {
                    std::uint32_t f, k;
                    if (j < 20) {
                        k = 0x5A827999;
                        f = (b & c) | (~b & d);
                    } else if (j < 40) {
                        k = 0x6ED9EBA1;
                        f = b ^ c ^ d;
                    } else if (j < 60) {
                        k = 0x8F1BBCDC;
                        f = (b & c) | (b & d) | (c & d);
                    } else {
                        k = 0xCA62C1D6;
                        f = b ^ c ^ d;
                    }

                    std::uint32_t temp {rotate_left(a, 5) + f + e + k + word[j]};
                    e = d; d = c;
                    c = rotate_left(b, 30);
                    b = a; a = temp;
                }

                state[0] += a; state[1] += b; state[2] += c; state[3] += d; state[4] += e;
            }

        public:
            Sha1 &update(std::string_view data) {
                feeder.feed(data, [this](const std::uint8_t *block) { processBlock(block); });
                return *this;
            }

            // Digest of everything fed so far as raw bytes, the hasher itself stays usable
            [[nodiscard]] std::string digest() const {
                Sha1 copy {*this};
                copy.feeder.finish([&copy](const std::uint8_t *block) { copy.processBlock(block); });
                return impl::toDigest(copy.state);
            }
    };

    // Incremental SHA256, same interface as `Sha1`
    class Sha256 {
        public:
            static constexpr std::size_t DIGEST_SIZE {32};

        private:
            static constexpr std::array<std::uint32_t, 64> K {
                0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
                0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
                0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
                0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
                0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
                0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
                0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
                0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
            };

            std::array<std::uint32_t, 8> state {
                0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
                0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
            };
            impl::BlockFeeder feeder;

            void processBlock(const std::uint8_t *chunk) {
                std::array<std::uint32_t, 64> word;
                for (std::size_t j {0}; j < 16; ++j)
                    word[j] = impl::loadBigEndian(chunk + j * 4);
                for (std::size_t j {16}; j < 64; ++j) {
                    std::uint32_t s0 {rotate_right(word[j - 15], 7) ^ rotate_right(word[j - 15], 18) ^ (word[j - 15] >> 3)};
                    std::uint32_t s1 {rotate_right(word[j - 2], 17) ^ rotate_right(word[j - 2], 19) ^ (word[j - 2] >> 10)};
                    word[j] = word[j - 16] + s0 + word[j - 7] + s1;
                }

                std::uint32_t a {state[0]}, b {state[1]}, c {state[2]}, d {state[3]};
                std::uint32_t e {state[4]}, f {state[5]}, g {state[6]}, h {state[7]};
                for (std::size_t j {0}; j < 64; ++j) {
                    std::uint32_t S1 {rotate_right(e, 6) ^ rotate_right(e, 11) ^ rotate_right(e, 25)};
                    std::uint32_t ch {(e & f) ^ (~e & g)};
                    std::uint32_t temp1 {h + S1 + ch + K[j] + word[j]};
                    std::uint32_t S0 {rotate_right(a, 2) ^ rotate_right(a, 13) ^ rotate_right(a, 22)};
                    std::uint32_t maj {(a & b) ^ (a & c) ^ (b & c)};
                    std::uint32_t temp2 {S0 + maj};

                    h = g; g = f; f = e;
                    e = d + temp1;
                    d = c; c = b; b = a;
                    a = temp1 + temp2;
                }

                state[0] += a; state[1] += b; state[2] += c; state[3] += d;
                state[4] += e; state[5] += f; state[6] += g; state[7] += h;
            }

        public:
            Sha256 &update(std::string_view data) {
                feeder.feed(data, [this](const std::uint8_t *block) { processBlock(block); });
                return *this;
            }

            [[nodiscard]] std::string digest() const {
                Sha256 copy {*this};
                copy.feeder.finish([&copy](const std::uint8_t *block) { copy.processBlock(block); });
                return impl::toDigest(copy.state);
            }
    };

    // One shot helpers, returns a hex string unless `asBytes` is set
    [[nodiscard]] inline std::string sha1(std::string_view raw, bool asBytes = false) {
        std::string digest {Sha1{}.update(raw).digest()};
        return asBytes? digest: toHex(digest);
    }

    [[nodiscard]] inline std::string sha256(std::string_view raw, bool asBytes = false) {
        std::string digest {Sha256{}.update(raw).digest()};
        return asBytes? digest: toHex(digest);
    }
}
