#pragma once
#include "errors.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <unordered_map>
#include <utility>
#include <vector>

using Counter = std::unordered_map<std::string, uint64_t>;
using RankedEntry = std::pair<std::string, uint64_t>;

inline std::string errno_message(int err) {
    return err ? std::string(std::strerror(err)) : std::string("unknown error");
}

inline bool reads_stdin(const std::string& path) {
    return path.empty() || path == "-";
}

inline std::string input_name(const std::string& path) {
    return reads_stdin(path) ? std::string("<stdin>") : path;
}

// ------------ I/O ------------
// Empty path or "-" selects stdin (not owned, never deleted).
inline std::shared_ptr<std::istream> open_input(const std::string& path) {
    if (reads_stdin(path)) {
        return std::shared_ptr<std::istream>(&std::cin, [](std::istream*) {});
    }

    struct stat st;
    if (::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
        throw InputOpenError("cannot open input '" + path + "': " + errno_message(EISDIR));
    }

    errno = 0;
    auto f = std::make_shared<std::ifstream>(path, std::ios::binary);
    if (!*f) {
        throw InputOpenError("cannot open input '" + path + "': " + errno_message(errno));
    }
    return f;
}

// ------------ UTF-8 ------------
// Rejects overlongs, surrogates and code points above U+10FFFF.
inline bool is_valid_utf8(const std::string& s) {
    const unsigned char* p = (const unsigned char*)s.data();
    const unsigned char* end = p + s.size();
    while (p < end) {
        unsigned char c = *p;
        if (c < 0x80) { ++p; continue; }

        size_t n;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            n = 1;
        } else if (c >= 0xE0 && c <= 0xEF) {
            n = 2;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            n = 3;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            return false;
        }
        if ((size_t)(end - p) <= n) return false;
        if (p[1] < lo || p[1] > hi) return false;
        for (size_t i = 2; i <= n; ++i) {
            if ((p[i] & 0xC0) != 0x80) return false;
        }
        p += n + 1;
    }
    return true;
}

// ------------ table -> entries ------------
inline std::vector<RankedEntry> collect_entries(const Counter& c) {
    return std::vector<RankedEntry>(c.begin(), c.end());
}

inline uint64_t total_count(const Counter& c) {
    uint64_t sum = 0;
    for (const auto& kv : c) sum += kv.second;
    return sum;
}
