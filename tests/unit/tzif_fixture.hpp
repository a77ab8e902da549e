#pragma once
#include <gtest/gtest.h>
#include <unistd.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

// Builds small TZif v2 images for tests.
namespace tzif_fixture {

/// Scratch directory private to this process and the running test, so
/// parallel ctest runs never share fixtures.
inline std::filesystem::path scratch_dir(const std::string& prefix) {
    std::string name = prefix + "_" + std::to_string(::getpid());
    if (const auto* info = ::testing::UnitTest::GetInstance()->current_test_info()) {
        name += std::string("_") + info->test_suite_name() + "_" + info->name();
    }
    return std::filesystem::temp_directory_path() / name;
}

struct Type {
    int32_t utoff;
    bool isdst;
    std::string abbr;
};

inline void put32(std::string& out, uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8) out += static_cast<char>((v >> shift) & 0xFF);
}

inline void put64(std::string& out, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) out += static_cast<char>((v >> shift) & 0xFF);
}

inline void header(std::string& out, char version, uint32_t timecnt, uint32_t typecnt,
                   uint32_t charcnt) {
    out += "TZif";
    out += version;
    out.append(15, '\0');
    put32(out, 0);        // isutcnt
    put32(out, 0);        // isstdcnt
    put32(out, 0);        // leapcnt
    put32(out, timecnt);
    put32(out, typecnt);
    put32(out, charcnt);
}

/// A v2 file: minimal v1 block, then the 64-bit data and `footer`.
inline std::string build(const std::vector<int64_t>& transitions,
                         const std::vector<uint8_t>& transition_types,
                         const std::vector<Type>& types, const std::string& footer) {
    std::string out;

    // v1 block: one UTC type, no transitions
    header(out, '2', 0, 1, 4);
    put32(out, 0);
    out += '\0';
    out += '\0';
    out.append("UTC", 4);

    std::string chars;
    std::vector<uint8_t> idx;
    for (const auto& t : types) {
        idx.push_back(static_cast<uint8_t>(chars.size()));
        chars += t.abbr;
        chars += '\0';
    }

    header(out, '2', static_cast<uint32_t>(transitions.size()),
           static_cast<uint32_t>(types.size()), static_cast<uint32_t>(chars.size()));
    for (int64_t t : transitions) put64(out, static_cast<uint64_t>(t));
    for (uint8_t i : transition_types) out += static_cast<char>(i);
    for (size_t i = 0; i < types.size(); ++i) {
        put32(out, static_cast<uint32_t>(types[i].utoff));
        out += static_cast<char>(types[i].isdst ? 1 : 0);
        out += static_cast<char>(idx[i]);
    }
    out += chars;
    out += '\n';
    out += footer;
    out += '\n';
    return out;
}

/// Eastern European zone: LMT until 1970, then EET/EEST by rule.
inline std::string eastern_europe() {
    return build({0}, {1},
                 {{7324, false, "LMT"}, {7200, false, "EET"}, {10800, true, "EEST"}},
                 "EET-2EEST,M3.5.0/3,M10.5.0/4");
}

} // namespace tzif_fixture
