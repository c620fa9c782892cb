#include "../include/HashingWriter.hpp"

#include <string_view>

HashingStreambuf::HashingStreambuf(std::streambuf *inner, ObjectHash kind):
    inner(inner), hasher(kind) {}

HashingStreambuf::int_type HashingStreambuf::overflow(int_type ch) {
    if (traits_type::eq_int_type(ch, traits_type::eof()))
        return traits_type::not_eof(ch);

    char byte {traits_type::to_char_type(ch)};
    return xsputn(&byte, 1) == 1? ch: traits_type::eof();
}

std::streamsize HashingStreambuf::xsputn(const char *s, std::streamsize n) {
    if (inner == nullptr) return 0;

    // Partial writes only hash what actually made it through
    std::streamsize written {inner->sputn(s, n)};
    if (written > 0)
        hasher.update(std::string_view{s, static_cast<std::size_t>(written)});
    return written;
}

int HashingStreambuf::sync() {
    return inner == nullptr? -1: inner->pubsync();
}

HashingWriter::HashingWriter(std::ostream &inner, ObjectHash kind):
    innerStream(inner), buf(inner.rdbuf(), kind), stream(&buf) {}
