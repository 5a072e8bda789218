#pragma once
#include <atomic>
#include <csignal>
#include <memory>
#include <signal.h>

using PipeFlag = std::shared_ptr<std::atomic<bool>>;

inline PipeFlag make_pipe_flag() {
    return std::make_shared<std::atomic<bool>>(false);
}

// Tells the output loop that the reader of stdout went away.
class BrokenPipeWatcher {
public:
    virtual ~BrokenPipeWatcher() {}
    virtual void install() = 0;
    virtual bool is_tripped() const = 0;
};

#if defined(SIGPIPE)
// Sets the flag from a SIGPIPE handler. While installed, writes to a closed
// pipe fail with EPIPE instead of killing the process. Only one instance may
// be installed at a time; the previous disposition is restored on
// destruction.
class SignalBrokenPipeWatcher : public BrokenPipeWatcher {
public:
    explicit SignalBrokenPipeWatcher(PipeFlag flag);
    ~SignalBrokenPipeWatcher() override;

    SignalBrokenPipeWatcher(const SignalBrokenPipeWatcher&) = delete;
    SignalBrokenPipeWatcher& operator=(const SignalBrokenPipeWatcher&) = delete;

    void install() override;
    bool is_tripped() const override;

private:
    PipeFlag flag;
    bool installed = false;
    struct sigaction previous;
};
#endif

// For platforms without SIGPIPE: never trips, EPIPE on write is the only
// signal left.
class NoopBrokenPipeWatcher : public BrokenPipeWatcher {
public:
    explicit NoopBrokenPipeWatcher(PipeFlag flag) : flag(flag) {}
    void install() override {}
    bool is_tripped() const override { return flag->load(std::memory_order_relaxed); }

private:
    PipeFlag flag;
};

std::unique_ptr<BrokenPipeWatcher> make_broken_pipe_watcher(PipeFlag flag);
