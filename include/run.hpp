#pragma once
#include "args.hpp"
#include "pipe_watch.hpp"
#include "stats.hpp"
#include <ostream>

// resolve input -> count -> sort -> write, on the calling thread (the sort
// fans out to OpenMP). Throws InputOpenError, InputReadError and
// OutputWriteError; a closed pipe is reported through RunStats.
RunStats run_count(const Args& a, const BrokenPipeWatcher& pipe, std::ostream& out);
