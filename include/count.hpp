#pragma once
#include "errors.hpp"
#include "utils.hpp"
#include <cerrno>
#include <cstdint>
#include <istream>
#include <string>

// Reads one record into 'line'. Strips "\n" and "\r\n"; a final line with
// no terminator keeps any trailing '\r'.
inline bool read_line(std::istream& in, std::string& line) {
    if (!std::getline(in, line)) return false;
    if (!in.eof() && !line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

inline void count_line(const std::string& line, Counter& out) {
    auto it = out.find(line);
    if (it != out.end()) ++it->second;
    else out.emplace(line, 1);
}

// Sequential: every line of 'in' ends up in 'out'. Returns lines read.
inline uint64_t count_lines(std::istream& in, Counter& out) {
    uint64_t n = 0;
    std::string line; line.reserve(256);
    errno = 0;
    while (read_line(in, line)) {
        ++n;
        if (!is_valid_utf8(line)) {
            throw InputReadError("stream did not contain valid UTF-8 (line " + std::to_string(n) + ")");
        }
        count_line(line, out);
    }
    if (in.bad()) {
        throw InputReadError("error reading input after line " + std::to_string(n) + ": " + errno_message(errno));
    }
    return n;
}
