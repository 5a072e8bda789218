#include "pipe_watch.hpp"

#include <cerrno>
#include <system_error>

#if defined(SIGPIPE)
namespace {

// The handler cannot take arguments; the installed watcher's flag is
// published here. Both atomics are lock-free, so the handler is
// async-signal-safe.
std::atomic<std::atomic<bool>*> g_sigpipe_flag{nullptr};

void on_sigpipe(int) {
    std::atomic<bool>* f = g_sigpipe_flag.load(std::memory_order_relaxed);
    if (f) f->store(true, std::memory_order_relaxed);
}

} // namespace

SignalBrokenPipeWatcher::SignalBrokenPipeWatcher(PipeFlag flag) : flag(flag) {}

SignalBrokenPipeWatcher::~SignalBrokenPipeWatcher() {
    if (!installed) return;
    ::sigaction(SIGPIPE, &previous, nullptr);
    std::atomic<bool>* expected = flag.get();
    g_sigpipe_flag.compare_exchange_strong(expected, nullptr);
}

void SignalBrokenPipeWatcher::install() {
    if (installed) return;
    g_sigpipe_flag.store(flag.get(), std::memory_order_relaxed);

    struct sigaction sa;
    sa.sa_handler = on_sigpipe;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGPIPE, &sa, &previous) != 0) {
        int err = errno;
        g_sigpipe_flag.store(nullptr, std::memory_order_relaxed);
        throw std::system_error(err, std::generic_category(), "sigaction(SIGPIPE)");
    }
    installed = true;
}

bool SignalBrokenPipeWatcher::is_tripped() const {
    return flag->load(std::memory_order_relaxed);
}

std::unique_ptr<BrokenPipeWatcher> make_broken_pipe_watcher(PipeFlag flag) {
    return std::unique_ptr<BrokenPipeWatcher>(new SignalBrokenPipeWatcher(flag));
}

#else

std::unique_ptr<BrokenPipeWatcher> make_broken_pipe_watcher(PipeFlag flag) {
    return std::unique_ptr<BrokenPipeWatcher>(new NoopBrokenPipeWatcher(flag));
}

#endif
