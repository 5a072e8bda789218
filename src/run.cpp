#include "run.hpp"

#include "count.hpp"
#include "output.hpp"
#include "sort.hpp"
#include "utils.hpp"
#include <chrono>
#include <omp.h>

namespace {

double ms_since(std::chrono::steady_clock::time_point t0) {
    auto t1 = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(t1 - t0).count();
}

} // namespace

RunStats run_count(const Args& a, const BrokenPipeWatcher& pipe, std::ostream& out) {
    RunStats st;
    st.input = input_name(a.path);
    st.order = sorting_order_name(a.sort_by);
    st.threads = a.threads > 0 ? a.threads : omp_get_max_threads();

    auto t0 = std::chrono::steady_clock::now();
    auto in = open_input(a.path);

    std::vector<RankedEntry> counts;
    {
        Counter table;
        st.lines = count_lines(*in, table);
        counts = collect_entries(table);
    }
    st.distinct = counts.size();
    st.count_ms = ms_since(t0);

    t0 = std::chrono::steady_clock::now();
    sort_counts(counts, a.sort_by, st.threads);
    st.sort_ms = ms_since(t0);

    t0 = std::chrono::steady_clock::now();
    WriteResult w = write_entries(out, counts, a.limit(), pipe);
    st.write_ms = ms_since(t0);
    st.rows = w.rows;
    st.broken_pipe = w.outcome == WriteOutcome::BrokenPipe;
    return st;
}
