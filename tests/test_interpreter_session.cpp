#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <sstream>
#include <string>
#include <thread>

#include <signal.h>

#include <boost/process/search_path.hpp>

#include "runtime/runtime_backend.hpp"
#include "sandbox/interpreter_session.hpp"
#include "sandbox/process_runner.hpp"

using kiln::sandbox::InterpreterSession;
using kiln::sandbox::MarkerDemux;
using kiln::sandbox::ProcessRunner;
using kiln::sandbox::ProcessSpec;

namespace {

bool HasPython() {
    return !boost::process::search_path("python3").empty();
}

std::string Joined(const std::vector<MarkerDemux::Event>& events) {
    std::string text;
    for (const auto& event : events) {
        text += event.text;
    }
    return text;
}

}  // namespace

TEST(MarkerDemuxTest, SplitsTextAndMarkerLine) {
    MarkerDemux demux("@@END@@");
    const auto events = demux.Feed("hello\n@@END@@ 3\nafter");
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events[0].text, "hello\n");
    EXPECT_TRUE(events[0].marker_seen);
    EXPECT_EQ(events[0].marker_payload, "3");
    EXPECT_EQ(events.back().text, "after");
    EXPECT_FALSE(events.back().marker_seen);
}

TEST(MarkerDemuxTest, HoldsBackAPossibleMarkerPrefix) {
    MarkerDemux demux("@@END@@");
    auto first = demux.Feed("output @@EN");
    EXPECT_EQ(Joined(first), "output ");
    auto second = demux.Feed("D@@ 0\n");
    ASSERT_EQ(second.size(), 1u);
    EXPECT_TRUE(second[0].marker_seen);
    EXPECT_EQ(second[0].text, "");
    EXPECT_EQ(demux.Flush(), "");
}

TEST(MarkerDemuxTest, FalseAlarmIsReleased) {
    MarkerDemux demux("@@END@@");
    EXPECT_EQ(Joined(demux.Feed("a@@E")), "a");
    EXPECT_EQ(Joined(demux.Feed("X")), "@@EX");
}

TEST(MarkerDemuxTest, MarkerSplitAcrossManyChunks) {
    MarkerDemux demux("@@END@@");
    std::string text;
    int markers = 0;
    for (const char c : std::string("x@@END@@ 7\ny@@END@@ 0\n")) {
        for (const auto& event : demux.Feed(std::string(1, c))) {
            text += event.text;
            markers += event.marker_seen ? 1 : 0;
        }
    }
    EXPECT_EQ(text, "xy");
    EXPECT_EQ(markers, 2);
}

TEST(MarkerDemuxTest, FlushReturnsHeldText) {
    MarkerDemux demux("@@END@@");
    demux.Feed("tail @@");
    EXPECT_EQ(demux.Flush(), "@@");
}

class InterpreterSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!HasPython()) {
            GTEST_SKIP() << "python3 not on PATH";
        }
        launcher.executable = "python3";
    }

    ProcessSpec launcher;
};

TEST_F(InterpreterSessionTest, StatePersistsAcrossFrames) {
    InterpreterSession session(launcher);
    kiln::runtime::OutputSink first;
    EXPECT_EQ(session.Execute("x = 40", first), 0);
    kiln::runtime::OutputSink second;
    EXPECT_EQ(session.Execute("print(x + 2)", second), 0);
    EXPECT_EQ(second.Stdout(), "42\n");
    EXPECT_EQ(second.Stderr(), "");
}

TEST_F(InterpreterSessionTest, ExceptionsAndExitCodesBecomeStatus) {
    InterpreterSession session(launcher);
    kiln::runtime::OutputSink failed;
    EXPECT_EQ(session.Execute("raise ValueError('bad')", failed), 1);
    EXPECT_NE(failed.Stderr().find("ValueError: bad"), std::string::npos);

    kiln::runtime::OutputSink exited;
    EXPECT_EQ(session.Execute("import sys\nsys.exit(3)", exited), 3);

    kiln::runtime::OutputSink after;
    EXPECT_EQ(session.Execute("print('still here')", after), 0);
    EXPECT_EQ(after.Stdout(), "still here\n");
}

TEST_F(InterpreterSessionTest, AbortInterruptsRunningFrame) {
    InterpreterSession session(launcher);
    kiln::runtime::OutputSink warmup;
    ASSERT_EQ(session.Execute("import time", warmup), 0);

    std::thread killer([&session] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        session.Abort();
    });
    kiln::runtime::OutputSink sink;
    EXPECT_THROW(session.Execute("print('started', flush=True)\nwhile True: time.sleep(0.05)", sink),
                 std::runtime_error);
    killer.join();
    EXPECT_EQ(sink.Stdout(), "started\n");

    kiln::runtime::OutputSink fresh;
    EXPECT_EQ(session.Execute("print('x' in globals())", fresh), 0);
    EXPECT_EQ(fresh.Stdout(), "False\n");
    session.Close(std::chrono::milliseconds(500));
}

TEST_F(InterpreterSessionTest, UserCodeCannotReadTheFrameStream) {
    InterpreterSession session(launcher);
    kiln::runtime::OutputSink prompted;
    EXPECT_EQ(session.Execute("input('name? ')", prompted), 1);
    EXPECT_NE(prompted.Stderr().find("EOFError"), std::string::npos);

    kiln::runtime::OutputSink drained;
    EXPECT_EQ(session.Execute("import sys, os\nprint(repr(sys.stdin.read()), repr(os.read(0, 16)))", drained), 0);
    EXPECT_EQ(drained.Stdout(), "'' b''\n");

    kiln::runtime::OutputSink after;
    EXPECT_EQ(session.Execute("print('frames intact')", after), 0);
    EXPECT_EQ(after.Stdout(), "frames intact\n");
}

TEST_F(InterpreterSessionTest, CloseIsBoundedWhenADescendantKeepsOutputOpen) {
    InterpreterSession session(launcher);
    kiln::runtime::OutputSink sink;
    ASSERT_EQ(session.Execute("import subprocess\n"
                              "child = subprocess.Popen(['sleep', '60'], start_new_session=True)\n"
                              "print(child.pid)",
                              sink),
              0);
    pid_t pid = 0;
    std::istringstream(sink.Stdout()) >> pid;
    ASSERT_GT(pid, 0);

    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(session.Close(std::chrono::milliseconds(500)));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));
    ::kill(pid, SIGKILL);
}

TEST_F(InterpreterSessionTest, CloseReportsCleanStop) {
    InterpreterSession session(launcher);
    kiln::runtime::OutputSink sink;
    ASSERT_EQ(session.Execute("print(1)", sink), 0);
    EXPECT_TRUE(session.Close(std::chrono::milliseconds(500)));
}

TEST(ProcessRunnerTest, CaptureCollectsOutputAndExitCode) {
    ProcessSpec spec{};
    spec.executable = "sh";
    spec.args = {"-c", "echo out; echo err >&2; exit 4"};
    const auto captured = ProcessRunner::Capture(spec, std::chrono::seconds(5));
    EXPECT_EQ(captured.stdout_text, "out\n");
    EXPECT_EQ(captured.stderr_text, "err\n");
    EXPECT_EQ(captured.outcome.exit_code, 4);
    EXPECT_FALSE(captured.outcome.timed_out);
}

TEST(ProcessRunnerTest, TimeoutStopsTheChild) {
    ProcessSpec spec{};
    spec.executable = "sh";
    spec.args = {"-c", "echo begin; sleep 30"};
    const auto started = std::chrono::steady_clock::now();
    const auto captured = ProcessRunner::Capture(spec, std::chrono::milliseconds(200));
    EXPECT_TRUE(captured.outcome.timed_out);
    EXPECT_EQ(captured.stdout_text, "begin\n");
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST(ProcessRunnerTest, CancelFlagStopsTheChild) {
    ProcessSpec spec{};
    spec.executable = "sleep";
    spec.args = {"30"};
    std::atomic<bool> cancel{false};
    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel = true;
    });
    const auto outcome = ProcessRunner::Run(spec, "", std::chrono::seconds(20), &cancel, {}, {});
    canceller.join();
    EXPECT_TRUE(outcome.cancelled);
}

TEST(ProcessRunnerTest, StdinIsDelivered) {
    ProcessSpec spec{};
    spec.executable = "cat";
    const auto captured = ProcessRunner::Capture(spec, std::chrono::seconds(5), "piped");
    EXPECT_EQ(captured.stdout_text, "piped");
    EXPECT_EQ(captured.outcome.exit_code, 0);
}

TEST(ProcessRunnerTest, MissingExecutableThrows) {
    ProcessSpec spec{};
    spec.executable = "kiln-definitely-not-a-binary";
    EXPECT_THROW(ProcessRunner::Capture(spec, std::chrono::seconds(1)), std::runtime_error);
}

TEST(ProcessRunnerTest, DetachedDescendantDoesNotHoldTheRunOpen) {
    if (!HasPython()) {
        GTEST_SKIP() << "python3 not on PATH";
    }
    ProcessSpec spec{};
    spec.executable = "python3";
    spec.args = {"-c",
                 "import subprocess\n"
                 "child = subprocess.Popen(['sleep', '60'], start_new_session=True)\n"
                 "print(child.pid, flush=True)"};
    const auto started = std::chrono::steady_clock::now();
    const auto captured = ProcessRunner::Capture(spec, std::chrono::seconds(10));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_EQ(captured.outcome.exit_code, 0);
    EXPECT_TRUE(captured.outcome.escaped);
    pid_t pid = 0;
    std::istringstream(captured.stdout_text) >> pid;
    ASSERT_GT(pid, 0);
    ::kill(pid, SIGKILL);
}
