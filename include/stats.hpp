#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <string>

struct RunStats {
    std::string input;
    std::string order;
    int threads = 1;
    uint64_t lines = 0;
    size_t distinct = 0;
    size_t rows = 0;
    bool broken_pipe = false;
    double count_ms = 0.0;
    double sort_ms = 0.0;
    double write_ms = 0.0;
};

inline std::string ascii_bar(double frac, int width) {
    frac = std::max(0.0, std::min(1.0, frac));
    int filled = (int)std::round(frac * width);
    std::string s(width, ' ');
    for (int i = 0; i < filled; ++i) s[i] = '#';
    return s;
}

inline void print_phase(std::ostream& err, const char* name, double ms, double total_ms, int barw) {
    double f = total_ms > 0.0 ? ms / total_ms : 0.0;
    err << std::left << std::setw(6) << name << " [" << ascii_bar(f, barw) << "]  "
        << std::fixed << std::setprecision(3) << ms << " ms\n";
}

// Verbose report, always on stderr so stdout stays machine-readable.
inline void print_run_stats(std::ostream& err, const RunStats& s, int barw) {
    double total = s.count_ms + s.sort_ms + s.write_ms;
    err << "\n[linefreq] input: " << s.input << "\n"
        << "[linefreq] " << s.lines << " lines, " << s.distinct << " distinct, "
        << s.rows << " written" << (s.broken_pipe ? " (stopped: broken pipe)" : "") << "\n"
        << "[linefreq] order " << s.order << ", sort on " << s.threads << " OpenMP threads\n";
    print_phase(err, "count", s.count_ms, total, barw);
    print_phase(err, "sort", s.sort_ms, total, barw);
    print_phase(err, "write", s.write_ms, total, barw);
    err << "Time: " << std::fixed << std::setprecision(3) << total << " ms\n";
}
