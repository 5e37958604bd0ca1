#include "util/u8.hpp"

namespace sbs::util {

namespace {

constexpr std::string_view REPLACEMENT = "\xEF\xBF\xBD";

struct Scan {
    size_t length;   // bytes consumed
    bool valid;      // whether they form a complete sequence
};

// Walks the sequence starting at i. An invalid sequence consumes its maximal
// subpart, i.e. the longest prefix that could still have become valid.
Scan scanSequence(const std::string_view s, const size_t i) {
    const auto c0 = static_cast<unsigned char>(s[i]);
    if (c0 < 0x80) return {1, true};

    size_t need;
    unsigned char lo = 0x80, hi = 0xBF;

    if (c0 >= 0xC2 && c0 <= 0xDF) need = 1;
    else if (c0 >= 0xE0 && c0 <= 0xEF) {
        need = 2;
        if (c0 == 0xE0) lo = 0xA0;         // overlong
        else if (c0 == 0xED) hi = 0x9F;    // surrogates
    } else if (c0 >= 0xF0 && c0 <= 0xF4) {
        need = 3;
        if (c0 == 0xF0) lo = 0x90;
        else if (c0 == 0xF4) hi = 0x8F;    // above U+10FFFF
    } else return {1, false};

    for (size_t k = 1; k <= need; ++k) {
        if (i + k >= s.size()) return {k, false};
        const auto c = static_cast<unsigned char>(s[i + k]);
        if (c < lo || c > hi) return {k, false};
        lo = 0x80;
        hi = 0xBF;
    }
    return {need + 1, true};
}

}

std::string toLossyUtf8(const std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        const auto [length, valid] = scanSequence(bytes, i);
        if (valid) out.append(bytes.substr(i, length));
        else out.append(REPLACEMENT);
        i += length;
    }
    return out;
}

}
