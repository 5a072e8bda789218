#include "args.hpp"
#include "errors.hpp"
#include "pipe_watch.hpp"
#include "run.hpp"
#include "stats.hpp"
#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);

    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const ArgumentError& e) {
        std::cerr << "linefreq: " << e.what() << "\n\n";
        usage(std::cerr, argv[0]);
        return 2;
    }
    if (args.show_help) { usage(std::cout, argv[0]); return 0; }
    if (args.show_version) { std::cout << "linefreq " << LINEFREQ_VERSION << "\n"; return 0; }

    try {
        PipeFlag broken_pipe = make_pipe_flag();
        auto watcher = make_broken_pipe_watcher(broken_pipe);
        watcher->install();

        RunStats st = run_count(args, *watcher, std::cout);
        if (args.verbose) print_run_stats(std::cerr, st, args.bar_width);
    } catch (const std::exception& e) {
        std::cerr << "linefreq: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
