/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <csignal>
#include <deque>
#include <filesystem>
#include <functional>

#include "frt/executor.hpp"
#include "frt/finalizer.hpp"
#include "frt/job.hpp"
#include "frt/shutdown.hpp"
#include "test_support.hpp"

namespace frt {
namespace {

namespace fs = std::filesystem;

// Replays scripted outcomes and records what it was asked to run
class ScriptedRunner final : public Runner {
public:
    explicit ScriptedRunner(std::deque<RunOutcome> outcomes) : outcomes_(std::move(outcomes)) {}

    RunOutcome run(const std::vector<std::string>& command, const StreamMapping& streams) override {
        commands.push_back(command);
        mappings.push_back(streams);
        if (onRun) onRun();
        if (outcomes_.empty()) {
            RunOutcome outcome;
            outcome.started = true;
            outcome.exitCode = 0;
            return outcome;
        }
        auto outcome = outcomes_.front();
        outcomes_.pop_front();
        return outcome;
    }

    std::vector<std::vector<std::string>> commands;
    std::vector<StreamMapping> mappings;
    std::function<void()> onRun;

private:
    std::deque<RunOutcome> outcomes_;
};

RunOutcome exited(int code) {
    RunOutcome outcome;
    outcome.started = true;
    outcome.exitCode = code;
    return outcome;
}

class ExecutorTest : public ::testing::Test {
protected:
    ExecutorTest() : dir_("executor"), config_(test::makeConfig(dir_ / "work")) {
        config_.bridge = "poll";
        config_.serverTools.ffmpeg = "/opt/remote/ffmpeg";
        config_.serverTools.ffprobe = "/opt/remote/ffprobe";
        config_.clientTools.ffmpeg = "/usr/bin/ffmpeg";
        config_.clientTools.ffprobe = "/usr/bin/ffprobe";
        input_ = dir_ / "media/clip.mkv";
        output_ = dir_ / "media/clip.mp4";
        test::writeFile(input_, "frames");
    }

    Job makeJob(const std::string& program = "ffmpeg", const std::vector<std::string>& args = {}) {
        auto job = Job::create(config_, program, args);
        EXPECT_TRUE(Job::ensureDirectories(job.root()));
        return job;
    }

    std::vector<std::string> transcodeArgs() const {
        return {"-i", input_.string(), "-c:v", "libx264", output_.string()};
    }

    test::TempDir dir_;
    Config config_;
    fs::path input_;
    fs::path output_;
};

TEST_F(ExecutorTest, ConnectionFailureFallsBackToLocal) {
    auto job = makeJob();
    ScriptedRunner runner({exited(kConnectionFailure), exited(0)});
    Executor executor(job, config_, runner);

    auto result = executor.run(transcodeArgs());
    ASSERT_EQ(runner.commands.size(), 2u);
    EXPECT_EQ(runner.commands[0].front(), "ssh");
    EXPECT_EQ(runner.commands[1].front(), "/usr/bin/ffmpeg");
    EXPECT_EQ(runner.commands[1][2], input_.string());
    EXPECT_EQ(runner.commands[1].back(), output_.string());

    EXPECT_TRUE(result.fellBack);
    EXPECT_EQ(result.attempt, Attempt::Local);
    EXPECT_EQ(result.exitCode, 0);
}

TEST_F(ExecutorTest, LocalExitCodeIsFinal) {
    auto job = makeJob();
    ScriptedRunner runner({exited(kConnectionFailure), exited(kConnectionFailure), exited(0)});
    Executor executor(job, config_, runner);

    auto result = executor.run(transcodeArgs());
    EXPECT_EQ(runner.commands.size(), 2u);
    EXPECT_EQ(result.exitCode, kConnectionFailure);
    EXPECT_EQ(result.attempt, Attempt::Local);
}

TEST_F(ExecutorTest, RemoteExitCodeIsReturnedUnchanged) {
    auto job = makeJob();
    ScriptedRunner runner({exited(69)});
    Executor executor(job, config_, runner);

    auto result = executor.run(transcodeArgs());
    ASSERT_EQ(runner.commands.size(), 1u);
    EXPECT_EQ(result.exitCode, 69);
    EXPECT_EQ(result.attempt, Attempt::Remote);
    EXPECT_FALSE(result.fellBack);

    const auto& command = runner.commands[0];
    auto tool = std::find(command.begin(), command.end(), "/opt/remote/ffmpeg");
    ASSERT_NE(tool, command.end());
    EXPECT_EQ(*(tool - 1), "frt@transcoder.invalid");
    EXPECT_EQ(*(tool + 2), job.remoteWorkingPath(input_).string());
    EXPECT_EQ(command.back(), job.remoteWorkingPath(output_).string());
}

TEST_F(ExecutorTest, InterruptedRemoteAttemptDoesNotFallBack) {
    auto job = makeJob();
    RunOutcome interrupted = exited(kConnectionFailure);
    interrupted.interrupted = true;
    interrupted.signal = SIGTERM;
    ScriptedRunner runner({interrupted});
    Executor executor(job, config_, runner);

    auto result = executor.run(transcodeArgs());
    EXPECT_EQ(runner.commands.size(), 1u);
    EXPECT_TRUE(result.interrupted);
    EXPECT_EQ(result.signal, SIGTERM);
    EXPECT_FALSE(result.fellBack);
}

// ssh exits 255 when it is killed by the same signal that reached us
TEST_F(ExecutorTest, ConnectionFailureDuringShutdownDoesNotFallBack) {
    ShutdownHook hook;
    ASSERT_TRUE(hook.install());

    auto job = makeJob();
    ScriptedRunner runner({exited(kConnectionFailure)});
    runner.onRun = [&hook] { hook.request(SIGINT); };
    Executor executor(job, config_, runner, &hook);

    auto result = executor.run(transcodeArgs());
    EXPECT_EQ(runner.commands.size(), 1u);
    EXPECT_EQ(result.attempt, Attempt::Remote);
    EXPECT_EQ(result.exitCode, kConnectionFailure);
    EXPECT_FALSE(result.fellBack);
}

TEST_F(ExecutorTest, PendingShutdownSkipsLaunch) {
    ShutdownHook hook;
    ASSERT_TRUE(hook.install());
    hook.request(SIGHUP);

    auto job = makeJob();
    ScriptedRunner runner(std::deque<RunOutcome>{});
    Executor executor(job, config_, runner, &hook);

    auto result = executor.run(transcodeArgs());
    EXPECT_TRUE(runner.commands.empty());
    EXPECT_TRUE(result.interrupted);
    EXPECT_EQ(result.exitCode, 128 + SIGHUP);
}

TEST_F(ExecutorTest, StdoutGoesToStderrForTranscodes) {
    auto job = makeJob("ffmpeg", transcodeArgs());
    ScriptedRunner runner({exited(0)});
    Executor executor(job, config_, runner);
    (void)executor.run(transcodeArgs());

    ASSERT_EQ(runner.mappings.size(), 1u);
    EXPECT_EQ(runner.mappings[0].in, STDIN_FILENO);
    EXPECT_EQ(runner.mappings[0].out, STDERR_FILENO);
    EXPECT_EQ(runner.mappings[0].err, STDERR_FILENO);
}

TEST_F(ExecutorTest, StdoutPassesThroughForBypassAndProbe) {
    auto bypass = makeJob("ffmpeg", {"-encoders"});
    ScriptedRunner bypassRunner({exited(0)});
    Executor bypassExecutor(bypass, config_, bypassRunner);
    EXPECT_EQ(bypassExecutor.mapStreams().out, STDOUT_FILENO);

    auto probe = makeJob("/usr/local/bin/ffprobe", {input_.string()});
    ScriptedRunner probeRunner({exited(0)});
    Executor probeExecutor(probe, config_, probeRunner);
    (void)probeExecutor.run({"-show_format", input_.string()});

    ASSERT_EQ(probeRunner.commands.size(), 1u);
    EXPECT_EQ(probeRunner.mappings[0].out, STDOUT_FILENO);
    const auto& command = probeRunner.commands[0];
    EXPECT_NE(std::find(command.begin(), command.end(), "/opt/remote/ffprobe"), command.end());
}

TEST(SshCommandTest, BuildsNonInteractivePrefix) {
    Config config;
    config.host = "10.0.0.5";
    config.username = "media";

    auto command = sshCommand(config);
    EXPECT_EQ(command, (std::vector<std::string>{
        "ssh", "-q", "-o", "ConnectTimeout=1", "-o", "ConnectionAttempts=1",
        "-o", "StrictHostKeyChecking=no", "-o", "UserKnownHostsFile=/dev/null",
        "media@10.0.0.5"}));

    config.identityFile = "/etc/frt/id_ed25519";
    config.sshPath = "/usr/bin/ssh";
    command = sshCommand(config);
    EXPECT_EQ(command.front(), "/usr/bin/ssh");
    ASSERT_GE(command.size(), 3u);
    EXPECT_EQ(command[command.size() - 3], "-i");
    EXPECT_EQ(command[command.size() - 2], "/etc/frt/id_ed25519");
    EXPECT_EQ(command.back(), "media@10.0.0.5");
}

// Round trips through real processes: a stand-in ssh that runs the remote command
// locally against the shared working tree, with cp playing the transcoder
class ExecutorRoundTripTest : public ExecutorTest {
protected:
    ExecutorRoundTripTest() {
        auto ssh = dir_ / "bin/ssh";
        test::writeScript(ssh,
            "while [ $# -gt 0 ]; do\n"
            "  case \"$1\" in\n"
            "    -o|-i) shift 2 ;;\n"
            "    *@*) shift; break ;;\n"
            "    *) shift ;;\n"
            "  esac\n"
            "done\n"
            "exec /bin/sh -c \"$*\"\n");
        config_.sshPath = ssh.string();
        config_.serverTools.ffmpeg = "/bin/cp";
        config_.clientTools.ffmpeg = "/bin/cp";
    }
};

TEST_F(ExecutorRoundTripTest, RemoteRunDeliversOutput) {
    auto job = makeJob();
    ProcessRunner runner;
    Executor executor(job, config_, runner);

    auto result = executor.run({"-i", input_.string(), output_.string()});
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.attempt, Attempt::Remote);

    // Visible through the reverse link before finalization
    ASSERT_TRUE(fs::is_symlink(output_));
    EXPECT_EQ(test::readFile(output_), "frames");

    Finalizer finalizer(job, config_, runner, false);
    auto report = finalizer.run();
    EXPECT_EQ(report.failures, 0u);
    EXPECT_EQ(report.promoted, 1u);
    EXPECT_EQ(report.unlinked, 1u);

    EXPECT_FALSE(fs::is_symlink(output_));
    EXPECT_EQ(test::readFile(output_), "frames");
    EXPECT_EQ(test::readFile(input_), "frames");
    EXPECT_FALSE(fs::exists(job.root()));
}

TEST_F(ExecutorRoundTripTest, UnreachableHostRunsLocally) {
    test::writeScript(dir_ / "bin/ssh", "exit 255\n");

    auto job = makeJob();
    ProcessRunner runner;
    Executor executor(job, config_, runner);

    auto result = executor.run({"-i", input_.string(), output_.string()});
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_TRUE(result.fellBack);

    Finalizer finalizer(job, config_, runner, !result.fellBack);
    auto report = finalizer.run();
    EXPECT_FALSE(report.reaped);
    EXPECT_EQ(report.failures, 0u);
    EXPECT_EQ(test::readFile(output_), "frames");
    EXPECT_FALSE(fs::exists(job.root()));
}

TEST_F(ExecutorRoundTripTest, ToolFailureIsReported) {
    auto job = makeJob();
    ProcessRunner runner;
    Executor executor(job, config_, runner);

    auto missing = dir_ / "media/missing.mkv";
    auto result = executor.run({"-i", missing.string(), output_.string()});
    EXPECT_NE(result.exitCode, 0);
    EXPECT_NE(result.exitCode, kConnectionFailure);
    EXPECT_EQ(result.attempt, Attempt::Remote);
    EXPECT_FALSE(fs::exists(fs::symlink_status(output_)));
}

TEST_F(ExecutorRoundTripTest, InterruptedSshStillReapsRemote) {
    test::writeScript(dir_ / "bin/ssh", "kill -INT $PPID\nexit 255\n");

    auto job = makeJob();
    ShutdownHook hook;
    ASSERT_TRUE(hook.install());
    ProcessRunner runner(&hook);
    Executor executor(job, config_, runner, &hook);

    auto result = executor.run({"-i", input_.string(), output_.string()});
    EXPECT_TRUE(result.interrupted);
    EXPECT_EQ(result.signal, SIGINT);
    EXPECT_EQ(result.attempt, Attempt::Remote);
    EXPECT_FALSE(result.fellBack);

    // Cleanup the way main does it: a hookless runner, reaping unless we fell back
    auto reapLog = dir_ / "reap.log";
    test::writeScript(dir_ / "bin/ssh", "echo \"$@\" > '" + reapLog.string() + "'\nexit 1\n");
    ProcessRunner cleanupRunner;
    Finalizer finalizer(job, config_, cleanupRunner, !result.fellBack);
    auto report = finalizer.run();

    EXPECT_TRUE(report.reaped);
    EXPECT_NE(test::readFile(reapLog).find("pkill -P1"), std::string::npos);
    EXPECT_EQ(test::readFile(input_), "frames");
    EXPECT_FALSE(fs::exists(job.root()));
}

}
}
