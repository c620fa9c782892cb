#pragma once

#include "ObjectId.hpp"

#include <ostream>
#include <streambuf>

// Unbuffered streambuf that forwards every byte to `inner` and
// feeds exactly the bytes `inner` accepted into a running hash
class HashingStreambuf: public std::streambuf {
    private:
        std::streambuf *inner;
        ObjectHasher hasher;

    protected:
        int_type overflow(int_type ch) override;
        std::streamsize xsputn(const char *s, std::streamsize n) override;
        int sync() override;

    public:
        HashingStreambuf(std::streambuf *inner, ObjectHash kind);

        [[nodiscard]] ObjectId digest() const { return hasher.digest(); }
};

// Pairs a `HashingStreambuf` with an ostream over it, everything written
// to `hashed()` ends up in `inner` and contributes to `digest()`
class HashingWriter {
    private:
        std::ostream &innerStream;
        HashingStreambuf buf;
        std::ostream stream;

    public:
        HashingWriter(std::ostream &inner, ObjectHash kind);

        HashingWriter(const HashingWriter&) = delete;
        HashingWriter &operator=(const HashingWriter&) = delete;

        std::ostream &hashed() { return stream; }

        // Bytes written here bypass the hash, used for the trailing checksum
        std::ostream &inner() { return innerStream; }

        [[nodiscard]] ObjectId digest() const { return buf.digest(); }
};
