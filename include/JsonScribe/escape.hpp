#pragma once

#include <cstddef>
#include <string_view>

#include "sink.hpp"

namespace JsonScribe {

namespace escape_detail {

constexpr bool needs_escape(char c) {
    return c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20;
}

} // namespace escape_detail

/// Writes the content of a JSON string literal (no surrounding quotes).
/// Stateless per character, so a literal may be written in any number of chunks.
template<SinkLike Sink>
constexpr bool write_escaped(Sink& sink, const char* data, std::size_t size) {
    constexpr char hex[] = "0123456789abcdef";

    const char* p = data;
    const char* e = data + size;

    while (p < e) {
        // Bulk-write the run of bytes that go out verbatim
        const char* run = p;
        while (run < e && !escape_detail::needs_escape(*run)) {
            ++run;
        }
        if (run != p) {
            if (!sink.write(p, static_cast<std::size_t>(run - p))) return false;
            p = run;
            continue;
        }

        unsigned char uc = static_cast<unsigned char>(*p++);
        char esc[6] = {'\\', 0, 0, 0, 0, 0};
        std::size_t len = 2;
        switch (uc) {
        case '"':  esc[1] = '"';  break;
        case '\\': esc[1] = '\\'; break;
        case '\b': esc[1] = 'b';  break;
        case '\f': esc[1] = 'f';  break;
        case '\n': esc[1] = 'n';  break;
        case '\r': esc[1] = 'r';  break;
        case '\t': esc[1] = 't';  break;
        default:
            esc[1] = 'u';
            esc[2] = '0';
            esc[3] = '0';
            esc[4] = hex[(uc >> 4) & 0xF];
            esc[5] = hex[uc & 0xF];
            len = 6;
            break;
        }
        if (!sink.write(esc, len)) return false;
    }
    return true;
}

template<SinkLike Sink>
constexpr bool write_escaped(Sink& sink, std::string_view s) {
    return write_escaped(sink, s.data(), s.size());
}

} // namespace JsonScribe
