#pragma once
#include "errors.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <omp.h>
#include <string>
#include <vector>

enum class SortingOrder { Key, Count, None };

inline const char* sorting_order_name(SortingOrder o) {
    switch (o) {
    case SortingOrder::Key:   return "Key";
    case SortingOrder::Count: return "Count";
    case SortingOrder::None:  return "None";
    }
    return "?";
}

// Case-insensitive: "key", "COUNT", "None" ...
inline SortingOrder parse_sorting_order(const std::string& s) {
    std::string v;
    for (unsigned char c : s) v.push_back((char)std::tolower(c));
    if (v == "key")   return SortingOrder::Key;
    if (v == "count") return SortingOrder::Count;
    if (v == "none")  return SortingOrder::None;
    throw ArgumentError("invalid value '" + s + "' for --sortby (expected Key, Count or None)");
}

// ------------ comparators ------------
// Line ascending (unsigned byte order), then count descending.
struct ByKey {
    bool operator()(const RankedEntry& a, const RankedEntry& b) const {
        int c = a.first.compare(b.first);
        if (c != 0) return c < 0;
        return a.second > b.second;
    }
};

// Count descending, then line ascending. Total order over unique lines.
struct ByCount {
    bool operator()(const RankedEntry& a, const RankedEntry& b) const {
        if (a.second != b.second) return a.second > b.second;
        return a.first.compare(b.first) < 0;
    }
};

// ------------ parallel merge sort ------------
// Below this many elements a range is handed to std::sort.
constexpr size_t kSerialSortCutoff = 1 << 14;

template <class It, class Cmp>
void merge_sort_tasks(It first, It last, Cmp cmp, int depth) {
    size_t n = (size_t)(last - first);
    if (depth <= 0 || n <= kSerialSortCutoff) {
        std::sort(first, last, cmp);
        return;
    }
    It mid = first + (ptrdiff_t)(n / 2);
#pragma omp task firstprivate(first, mid, cmp, depth)
    merge_sort_tasks(first, mid, cmp, depth - 1);
#pragma omp task firstprivate(mid, last, cmp, depth)
    merge_sort_tasks(mid, last, cmp, depth - 1);
#pragma omp taskwait
    std::inplace_merge(first, mid, last, cmp);
}

// Blocks until the whole range is sorted. Result is identical to
// std::sort(first, last, cmp) whenever cmp is a total order.
template <class T, class Cmp>
void parallel_sort(std::vector<T>& v, Cmp cmp, int nthreads) {
    if (nthreads <= 0) nthreads = omp_get_max_threads();
    if (nthreads <= 1 || v.size() <= kSerialSortCutoff) {
        std::sort(v.begin(), v.end(), cmp);
        return;
    }

    // at least two leaves per thread
    int depth = 0;
    while ((1 << depth) < 2 * nthreads) ++depth;

    auto first = v.begin();
    auto last = v.end();
#pragma omp parallel num_threads(nthreads) firstprivate(first, last, cmp, depth)
    {
#pragma omp single
        merge_sort_tasks(first, last, cmp, depth);
    }
}

inline void sort_counts(std::vector<RankedEntry>& counts, SortingOrder order, int nthreads) {
    switch (order) {
    case SortingOrder::Key:
        parallel_sort(counts, ByKey(), nthreads);
        break;
    case SortingOrder::Count:
        parallel_sort(counts, ByCount(), nthreads);
        break;
    case SortingOrder::None:
        break;
    }
}
