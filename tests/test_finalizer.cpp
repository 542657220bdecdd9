/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <csignal>
#include <filesystem>
#include <thread>

#include "frt/executor.hpp"
#include "frt/finalizer.hpp"
#include "frt/job.hpp"
#include "frt/shutdown.hpp"
#include "test_support.hpp"

namespace frt {
namespace {

namespace fs = std::filesystem;

class RecordingRunner final : public Runner {
public:
    RunOutcome run(const std::vector<std::string>& command, const StreamMapping& streams) override {
        commands.push_back(command);
        mappings.push_back(streams);
        RunOutcome outcome;
        outcome.started = true;
        outcome.exitCode = exitCode;
        return outcome;
    }

    int exitCode = 0;
    std::vector<std::vector<std::string>> commands;
    std::vector<StreamMapping> mappings;
};

class FinalizerTest : public ::testing::Test {
protected:
    FinalizerTest()
        : dir_("finalizer"),
          config_(test::makeConfig(dir_ / "work")),
          job_("fa11fa11fa11fa11fa11fa11fa11fa11", dir_ / "work", dir_ / "work", false, ToolKind::Ffmpeg) {
        input_ = dir_ / "media/in/clip.mkv";
        output_ = dir_ / "media/out/clip.mp4";
        test::writeFile(input_, "source");
        fs::create_directories(output_.parent_path());
    }

    // The tree a finished job leaves behind: forward link, produced artifact, reverse link
    void stageFinishedJob() {
        auto inputLink = job_.localWorkingPath(input_);
        fs::create_directories(inputLink.parent_path());
        fs::create_symlink(input_, inputLink);

        auto artifact = job_.localWorkingPath(output_);
        test::writeFile(artifact, "encoded");
        fs::create_symlink(artifact, output_);
    }

    test::TempDir dir_;
    Config config_;
    Job job_;
    fs::path input_;
    fs::path output_;
};

TEST_F(FinalizerTest, PromotesArtifactsAndRemovesWorkingTree) {
    stageFinishedJob();
    RecordingRunner runner;
    Finalizer finalizer(job_, config_, runner, false);

    auto report = finalizer.run();
    EXPECT_FALSE(report.skipped);
    EXPECT_EQ(report.unlinked, 1u);
    EXPECT_EQ(report.promoted, 1u);
    EXPECT_EQ(report.failures, 0u);
    EXPECT_GT(report.removedDirectories, 0u);

    EXPECT_TRUE(fs::is_regular_file(fs::symlink_status(output_)));
    EXPECT_EQ(test::readFile(output_), "encoded");
    EXPECT_TRUE(fs::is_regular_file(fs::symlink_status(input_)));
    EXPECT_EQ(test::readFile(input_), "source");
    EXPECT_FALSE(fs::exists(job_.root()));
    EXPECT_TRUE(runner.commands.empty());
}

TEST_F(FinalizerTest, ReplacesStaleDestinationFile) {
    stageFinishedJob();
    fs::remove(output_);
    test::writeFile(output_, "from last week");

    RecordingRunner runner;
    Finalizer finalizer(job_, config_, runner, false);
    auto report = finalizer.run();
    EXPECT_EQ(report.promoted, 1u);
    EXPECT_EQ(test::readFile(output_), "encoded");
}

TEST_F(FinalizerTest, RunsOnlyOnce) {
    stageFinishedJob();
    RecordingRunner runner;
    Finalizer finalizer(job_, config_, runner, true);

    auto first = finalizer.run();
    EXPECT_FALSE(first.skipped);
    auto second = finalizer.run();
    EXPECT_TRUE(second.skipped);
    EXPECT_EQ(second.promoted, 0u);
    EXPECT_EQ(runner.commands.size(), 1u);
}

TEST_F(FinalizerTest, MissingWorkingTreeIsNotAnError) {
    RecordingRunner runner;
    Finalizer finalizer(job_, config_, runner, false);
    auto report = finalizer.run();
    EXPECT_EQ(report.failures, 0u);
    EXPECT_EQ(report.removedDirectories, 0u);
}

TEST_F(FinalizerTest, SpecialDestinationsAreNotReplaced) {
    auto sink = job_.localWorkingPath("/dev/null");
    test::writeFile(sink, "discard me");

    RecordingRunner runner;
    Finalizer finalizer(job_, config_, runner, false);
    auto report = finalizer.run();
    EXPECT_EQ(report.discarded, 1u);
    EXPECT_EQ(report.promoted, 0u);
    EXPECT_TRUE(fs::is_character_file("/dev/null"));
    EXPECT_FALSE(fs::exists(job_.root()));
}

TEST_F(FinalizerTest, FailuresAreCountedAndWalkContinues) {
    stageFinishedJob();
    // Destination directory vanished while the job ran
    auto orphan = dir_ / "gone/out.mkv";
    test::writeFile(job_.localWorkingPath(orphan), "orphan");

    RecordingRunner runner;
    Finalizer finalizer(job_, config_, runner, false);
    auto report = finalizer.run();
    EXPECT_GE(report.failures, 1u);
    EXPECT_EQ(report.promoted, 1u);
    EXPECT_EQ(test::readFile(output_), "encoded");
    EXPECT_TRUE(fs::exists(job_.localWorkingPath(orphan)));
}

TEST_F(FinalizerTest, ReapsRemoteToolsOverSsh) {
    config_.username = "media";
    config_.serverTools.ffmpeg = "/usr/lib/jellyfin-ffmpeg/ffmpeg";
    config_.serverTools.ffprobe = "/usr/lib/jellyfin-ffmpeg/ffprobe";

    RecordingRunner runner;
    runner.exitCode = 1; // nothing left to kill
    Finalizer finalizer(job_, config_, runner, true);

    auto command = finalizer.reapCommand();
    ASSERT_GE(command.size(), 6u);
    EXPECT_EQ(command.front(), "ssh");
    EXPECT_EQ(std::vector<std::string>(command.end() - 6, command.end()),
              (std::vector<std::string>{"pkill", "-P1", "-u", "media", "-f", "'ffmpeg|ffprobe'"}));

    auto report = finalizer.run();
    EXPECT_TRUE(report.reaped);
    ASSERT_EQ(runner.commands.size(), 1u);
    EXPECT_EQ(runner.commands[0], command);
    EXPECT_EQ(runner.mappings[0].in, -1);
    EXPECT_EQ(runner.mappings[0].out, STDERR_FILENO);
}

using FinalizerDeathTest = FinalizerTest;

TEST_F(FinalizerDeathTest, ExitCleansUpAndTerminates) {
    stageFinishedJob();
    RecordingRunner runner;
    Finalizer finalizer(job_, config_, runner, false);

    EXPECT_EXIT(finalizer.exit(42), ::testing::ExitedWithCode(42), "");
}

// A termination request mid-run still leaves the caller with the produced output
TEST_F(FinalizerTest, InterruptedRunIsCleanedUpLikeANormalOne) {
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
    auto tool = dir_ / "bin/slow-ffmpeg";
    test::writeScript(tool, "cp \"$2\" \"$3\"\nexec sleep 10\n");

    config_.sshPath = ssh.string();
    config_.serverTools.ffmpeg = tool.string();
    config_.bridge = "poll";
    ASSERT_TRUE(Job::ensureDirectories(job_.root()));

    ShutdownHook hook;
    ASSERT_TRUE(hook.install());
    ProcessRunner runner(&hook, std::chrono::milliseconds(1000));
    Executor executor(job_, config_, runner, &hook);

    std::thread trigger([&] {
        (void)test::waitFor([&] { return fs::is_symlink(output_) && test::readFile(output_) == "source"; },
                      std::chrono::milliseconds(5000));
        hook.request(SIGTERM);
    });
    auto result = executor.run({"-i", input_.string(), output_.string()});
    trigger.join();

    EXPECT_TRUE(result.interrupted);
    EXPECT_EQ(result.signal, SIGTERM);
    EXPECT_FALSE(result.fellBack);

    ProcessRunner cleanupRunner;
    Finalizer finalizer(job_, config_, cleanupRunner, false);
    auto report = finalizer.run();
    EXPECT_EQ(report.promoted, 1u);
    EXPECT_EQ(test::readFile(output_), "source");
    EXPECT_FALSE(fs::exists(job_.root()));
}

}
}
