#pragma once
#include "sort.hpp"
#include <cstddef>
#include <ostream>
#include <string>

#ifndef LINEFREQ_VERSION
#define LINEFREQ_VERSION "0.0.0"
#endif

struct Args {
    std::string path;                       // empty: stdin
    SortingOrder sort_by = SortingOrder::Count;
    bool has_top = false;
    size_t top = 0;
    int threads = 0;                        // 0: omp_get_max_threads()
    bool verbose = false;
    int bar_width = 40;
    bool show_help = false;
    bool show_version = false;

    size_t limit() const;
};

void usage(std::ostream& os, const char* argv0);

// Throws ArgumentError.
Args parse_args(int argc, char** argv);
