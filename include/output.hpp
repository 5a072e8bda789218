#pragma once
#include "errors.hpp"
#include "pipe_watch.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

enum class WriteOutcome { Completed, BrokenPipe };

struct WriteResult {
    WriteOutcome outcome = WriteOutcome::Completed;
    size_t rows = 0;
};

// A failed stream is either the reader hanging up (clean stop) or a real
// error.
inline bool pipe_closed(int err, const BrokenPipeWatcher& pipe) {
    return err == EPIPE || pipe.is_tripped();
}

// Writes "<line>\t<count>\n" for the first 'limit' entries. The flag is
// checked after every row, so at most one buffered row follows a closed
// pipe.
inline WriteResult write_entries(std::ostream& out, const std::vector<RankedEntry>& entries,
                                 size_t limit, const BrokenPipeWatcher& pipe) {
    WriteResult res;
    size_t n = std::min(limit, entries.size());
    for (size_t i = 0; i < n; ++i) {
        errno = 0;
        out << entries[i].first << '\t' << entries[i].second << '\n';
        if (!out) {
            if (pipe_closed(errno, pipe)) { res.outcome = WriteOutcome::BrokenPipe; return res; }
            throw OutputWriteError("error writing output: " + errno_message(errno));
        }
        ++res.rows;
        if (pipe.is_tripped()) { res.outcome = WriteOutcome::BrokenPipe; return res; }
    }

    errno = 0;
    out.flush();
    if (!out) {
        if (pipe_closed(errno, pipe)) { res.outcome = WriteOutcome::BrokenPipe; return res; }
        throw OutputWriteError("error flushing output: " + errno_message(errno));
    }
    return res;
}
