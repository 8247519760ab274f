// ═══════════════════════════════════════════════════════════════════
//  test_child_process.cpp — fork/exec, exit status, reporter pipe
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <sidecar/child_process.h>
#include <sidecar/lifecycle.h>

#include <chrono>
#include <csignal>
#include <string>
#include <thread>

#include <unistd.h>

using namespace sidecar;

namespace {

std::shared_ptr<ChildProcess> spawnShell(const std::string& script) {
    SpawnParams params;
    params.file = "/bin/sh";
    params.args = {"-c", script};
    params.env  = {"PATH=/usr/bin:/bin"};
    return ChildProcess::spawn(params);
}

bool waitForExit(ChildProcess& child) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!child.reap()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

std::string readAll(int fd) {
    std::string data;
    char buf[256];
    for (;;) {
        auto n = ::read(fd, buf, sizeof(buf));
        if (n <= 0) break;
        data.append(buf, static_cast<std::size_t>(n));
    }
    return data;
}

} // namespace

TEST(ChildProcessTest, ReportsExitCode) {
    auto child = spawnShell("exit 7");
    ASSERT_TRUE(waitForExit(*child));
    ASSERT_TRUE(child->exitStatus().has_value());
    EXPECT_EQ(child->exitStatus()->reason, ExitStatus::Reason::Exit);
    EXPECT_EQ(child->exitStatus()->code, 7);
}

TEST(ChildProcessTest, ReportsTerminatingSignal) {
    auto child = spawnShell("kill -TERM $$");
    ASSERT_TRUE(waitForExit(*child));
    EXPECT_EQ(child->exitStatus()->reason, ExitStatus::Reason::Signal);
    EXPECT_EQ(child->exitStatus()->code, SIGTERM);
}

TEST(ChildProcessTest, ReporterPipeIsDescriptorThree) {
    auto child = spawnShell("printf '{\"ip\":\"\",\"port\":1}' >&3");
    auto reporter = child->takeReporter();
    ASSERT_TRUE(static_cast<bool>(reporter));
    EXPECT_EQ(readAll(reporter.get()), "{\"ip\":\"\",\"port\":1}");
    ASSERT_TRUE(waitForExit(*child));
}

TEST(ChildProcessTest, PipesStdoutOnlyWhenAsked) {
    SpawnParams params;
    params.file = "/bin/sh";
    params.args = {"-c", "echo out; echo err >&2"};
    params.pipeStdout = true;
    params.pipeStderr = true;
    auto child = ChildProcess::spawn(params);

    auto out = child->takeStdout();
    auto err = child->takeStderr();
    EXPECT_EQ(readAll(out.get()), "out\n");
    EXPECT_EQ(readAll(err.get()), "err\n");
    ASSERT_TRUE(waitForExit(*child));

    auto plain = spawnShell("true");
    EXPECT_FALSE(static_cast<bool>(plain->takeStdout()));
    EXPECT_FALSE(static_cast<bool>(plain->takeStderr()));
    ASSERT_TRUE(waitForExit(*plain));
}

TEST(ChildProcessTest, StdinIsDevNull) {
    SpawnParams params;
    params.file = "/bin/sh";
    params.args = {"-c", "cat; echo done"};
    params.env  = {"PATH=/usr/bin:/bin"};
    params.pipeStdout = true;
    auto child = ChildProcess::spawn(params);
    auto out = child->takeStdout();
    EXPECT_EQ(readAll(out.get()), "done\n");
    ASSERT_TRUE(waitForExit(*child));
}

TEST(ChildProcessTest, EnvironmentIsExactlyWhatWasGiven) {
    SpawnParams params;
    params.file = "/bin/sh";
    params.args = {"-c", "printf '%s' \"$ENGINE_CONFIG\""};
    params.env  = {"ENGINE_CONFIG={\"a\":1}"};
    params.pipeStdout = true;
    auto child = ChildProcess::spawn(params);
    auto out = child->takeStdout();
    EXPECT_EQ(readAll(out.get()), "{\"a\":1}");
    ASSERT_TRUE(waitForExit(*child));
}

TEST(ChildProcessTest, ExecFailureExits127) {
    SpawnParams params;
    params.file = "/nonexistent/engine";
    auto child = ChildProcess::spawn(params);
    ASSERT_TRUE(waitForExit(*child));
    EXPECT_EQ(child->exitStatus()->reason, ExitStatus::Reason::Exit);
    EXPECT_EQ(child->exitStatus()->code, 127);
}

TEST(ChildProcessTest, KillAndExitCallbacks) {
    auto child = spawnShell("sleep 30");
    int calls = 0;
    ExitStatus seen;
    child->onExit([&](const ExitStatus& status) {
        calls++;
        seen = status;
    });

    EXPECT_TRUE(child->kill(SIGKILL));
    child->reapBlocking();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(seen.reason, ExitStatus::Reason::Signal);
    EXPECT_EQ(seen.code, SIGKILL);

    // Already gone: no signal sent, late callbacks run right away.
    EXPECT_FALSE(child->kill(SIGTERM));
    child->onExit([&](const ExitStatus&) { calls++; });
    EXPECT_EQ(calls, 2);
}

TEST(ExitDescriptionTest, CodeAndSignal) {
    EXPECT_EQ(describeExit({ExitStatus::Reason::Exit, 3}),
              "Engine crashed unexpectedly with code: 3");
    EXPECT_EQ(describeExit({ExitStatus::Reason::Signal, SIGKILL}),
              "Engine was killed unexpectedly by signal: SIGKILL");
}

TEST(SignalNameTest, RoundTripsKnownSignals) {
    EXPECT_EQ(signalName(SIGTERM), "SIGTERM");
    EXPECT_EQ(signalName(SIGUSR2), "SIGUSR2");
    EXPECT_EQ(signalNumber("SIGINT"), SIGINT);
    EXPECT_FALSE(signalNumber("SIGNOPE").has_value());
    EXPECT_EQ(signalName(250), "signal 250");
}
