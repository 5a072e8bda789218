#include "errors.hpp"
#include "fake_watcher.hpp"
#include "run.hpp"

#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

namespace {

class RunCountTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = ::testing::TempDir() + "linefreq_run_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".txt";
    }
    void TearDown() override { std::remove(path.c_str()); }

    void write_input(const std::string& text) {
        std::ofstream f(path, std::ios::binary);
        f << text;
    }

    std::string run(Args a, size_t trip_after = 0) {
        a.path = path;
        FakePipeWatcher pipe(trip_after);
        std::ostringstream out;
        last = run_count(a, pipe, out);
        return out.str();
    }

    std::string path;
    RunStats last;
};

const char* kSample = "b\na\nb\nc\na\nb\n";

} // namespace

TEST_F(RunCountTest, DefaultIsCountOrder) {
    write_input(kSample);
    EXPECT_EQ(run(Args()), "b\t3\na\t2\nc\t1\n");
    EXPECT_EQ(last.lines, 6u);
    EXPECT_EQ(last.distinct, 3u);
    EXPECT_EQ(last.rows, 3u);
    EXPECT_FALSE(last.broken_pipe);
}

TEST_F(RunCountTest, KeyOrder) {
    write_input(kSample);
    Args a;
    a.sort_by = SortingOrder::Key;
    EXPECT_EQ(run(a), "a\t2\nb\t3\nc\t1\n");
}

TEST_F(RunCountTest, CountTop2) {
    write_input(kSample);
    Args a;
    a.has_top = true;
    a.top = 2;
    EXPECT_EQ(run(a), "b\t3\na\t2\n");
}

TEST_F(RunCountTest, NoneOrderHasAllRows) {
    write_input(kSample);
    Args a;
    a.sort_by = SortingOrder::None;
    std::string out = run(a);
    EXPECT_NE(out.find("a\t2\n"), std::string::npos);
    EXPECT_NE(out.find("b\t3\n"), std::string::npos);
    EXPECT_NE(out.find("c\t1\n"), std::string::npos);
    EXPECT_EQ(last.rows, 3u);
}

TEST_F(RunCountTest, EmptyInput) {
    write_input("");
    EXPECT_EQ(run(Args()), "");
    EXPECT_EQ(last.lines, 0u);
}

TEST_F(RunCountTest, Idempotent) {
    write_input("x\ny\nz\ny\nx\nw\nv\n");
    Args a;
    a.threads = 4;
    EXPECT_EQ(run(a), run(a));
}

TEST_F(RunCountTest, BrokenPipeStopsCleanly) {
    write_input(kSample);
    EXPECT_EQ(run(Args(), 1), "b\t3\n");
    EXPECT_TRUE(last.broken_pipe);
    EXPECT_EQ(last.rows, 1u);
}

TEST_F(RunCountTest, MissingFile) {
    Args a;
    a.path = path + ".missing";
    FakePipeWatcher pipe;
    std::ostringstream out;
    EXPECT_THROW(run_count(a, pipe, out), InputOpenError);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(RunCountTest, InvalidUtf8PrintsNothing) {
    write_input("a\n\xFE\n");
    Args a;
    a.path = path;
    FakePipeWatcher pipe;
    std::ostringstream out;
    EXPECT_THROW(run_count(a, pipe, out), InputReadError);
    EXPECT_TRUE(out.str().empty());
}

TEST(RunStatsReport, PrintsPhasesAndTotals) {
    RunStats s;
    s.input = "<stdin>";
    s.order = "Count";
    s.threads = 2;
    s.lines = 6;
    s.distinct = 3;
    s.rows = 2;
    s.broken_pipe = true;
    s.count_ms = 3.0;
    s.sort_ms = 1.0;
    s.write_ms = 0.0;

    std::ostringstream err;
    print_run_stats(err, s, 8);
    std::string r = err.str();
    EXPECT_NE(r.find("6 lines, 3 distinct, 2 written (stopped: broken pipe)"), std::string::npos);
    EXPECT_NE(r.find("count  [######  ]"), std::string::npos);
    EXPECT_NE(r.find("write  [        ]"), std::string::npos);
    EXPECT_NE(r.find("Time: 4.000 ms"), std::string::npos);
}

TEST(AsciiBar, Clamps) {
    EXPECT_EQ(ascii_bar(0.5, 4), "##  ");
    EXPECT_EQ(ascii_bar(2.0, 3), "###");
    EXPECT_EQ(ascii_bar(-1.0, 2), "  ");
}
