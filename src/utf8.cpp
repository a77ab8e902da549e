#include "mcpd/utf8.hpp"

namespace mcpd {

namespace {

constexpr std::string_view REPLACEMENT = "\xEF\xBF\xBD";

bool is_cont(unsigned char c) { return (c & 0xC0) == 0x80; }

// Length of the well-formed sequence at `in[i]`, or the length of the
// maximal invalid subpart (negated) when it is ill-formed.
int sequence_length(std::string_view in, size_t i) {
    const auto b0 = static_cast<unsigned char>(in[i]);
    if (b0 < 0x80) return 1;

    int need;
    unsigned char lo = 0x80, hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        need = 1;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        need = 2;
        if (b0 == 0xE0) lo = 0xA0;
        if (b0 == 0xED) hi = 0x9F;
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        need = 3;
        if (b0 == 0xF0) lo = 0x90;
        if (b0 == 0xF4) hi = 0x8F;
    } else {
        return -1;
    }

    for (int k = 1; k <= need; ++k) {
        if (i + k >= in.size()) return -k;
        const auto b = static_cast<unsigned char>(in[i + k]);
        if (k == 1 ? (b < lo || b > hi) : !is_cont(b)) return -k;
    }
    return need + 1;
}

} // anonymous namespace

std::string sanitize_utf8(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    size_t i = 0;
    while (i < in.size()) {
        int n = sequence_length(in, i);
        if (n > 0) {
            out.append(in.data() + i, static_cast<size_t>(n));
            i += static_cast<size_t>(n);
        } else {
            out.append(REPLACEMENT);
            i += static_cast<size_t>(-n);
        }
    }
    return out;
}

} // namespace mcpd
