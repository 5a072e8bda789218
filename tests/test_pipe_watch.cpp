#include "pipe_watch.hpp"

#include <cerrno>
#include <gtest/gtest.h>
#include <signal.h>
#include <unistd.h>

TEST(PipeWatch, FactoryStartsUntripped) {
    PipeFlag flag = make_pipe_flag();
    auto w = make_broken_pipe_watcher(flag);
    w->install();
    EXPECT_FALSE(w->is_tripped());
}

TEST(PipeWatch, NoopNeverTrips) {
    PipeFlag flag = make_pipe_flag();
    NoopBrokenPipeWatcher w(flag);
    w.install();
    EXPECT_FALSE(w.is_tripped());
}

#if defined(SIGPIPE)
TEST(PipeWatch, RaisedSignalSetsFlag) {
    PipeFlag flag = make_pipe_flag();
    SignalBrokenPipeWatcher w(flag);
    w.install();
    ASSERT_EQ(::raise(SIGPIPE), 0);
    EXPECT_TRUE(w.is_tripped());
    EXPECT_TRUE(flag->load());
}

TEST(PipeWatch, ClosedPipeWriteFailsWithEpipe) {
    PipeFlag flag = make_pipe_flag();
    SignalBrokenPipeWatcher w(flag);
    w.install();

    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    ::close(fds[0]);
    errno = 0;
    ssize_t n = ::write(fds[1], "x\n", 2);
    int err = errno;
    ::close(fds[1]);

    EXPECT_EQ(n, -1);
    EXPECT_EQ(err, EPIPE);
    EXPECT_TRUE(w.is_tripped());
}

TEST(PipeWatch, RestoresPreviousHandler) {
    struct sigaction before;
    ASSERT_EQ(::sigaction(SIGPIPE, nullptr, &before), 0);
    {
        SignalBrokenPipeWatcher w(make_pipe_flag());
        w.install();
        struct sigaction during;
        ASSERT_EQ(::sigaction(SIGPIPE, nullptr, &during), 0);
        EXPECT_NE(during.sa_handler, before.sa_handler);
    }
    struct sigaction after;
    ASSERT_EQ(::sigaction(SIGPIPE, nullptr, &after), 0);
    EXPECT_EQ(after.sa_handler, before.sa_handler);
}

TEST(PipeWatch, FlagOnlyGoesUp) {
    PipeFlag flag = make_pipe_flag();
    SignalBrokenPipeWatcher w(flag);
    w.install();
    ::raise(SIGPIPE);
    ::raise(SIGPIPE);
    EXPECT_TRUE(w.is_tripped());
}
#endif
