/**
 * @file test_execution_harness.cpp
 * @brief Unit tests for runner execution, classification and report reading
 *
 * Runs real /bin/sh runners. As root the runner is switched to uid 61000;
 * otherwise it keeps the invoking identity (development mode).
 */

#include "codecell/sandbox/execution_harness.hpp"
#include "codecell/core/execution_context.hpp"
#include "codecell/utils/string_utils.hpp"
#include "fake_syscalls.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <thread>

#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace codecell;
using namespace codecell::sandbox;
using codecell::test_support::FakeIdentitySyscalls;
using codecell::test_support::FakeRlimitSyscalls;

namespace fs = std::filesystem;

// ============================================================================
// CLASSIFICATION
// ============================================================================

TEST(ClassifyTerminationTest, ExitCodes) {
    std::string reason;
    EXPECT_EQ(ExecutionHarness::ClassifyTermination(0, std::nullopt, {0, 1}, reason),
              ExecutionStatus::COMPLETED);
    EXPECT_EQ(ExecutionHarness::ClassifyTermination(1, std::nullopt, {0, 1}, reason),
              ExecutionStatus::COMPLETED);
    EXPECT_EQ(ExecutionHarness::ClassifyTermination(2, std::nullopt, {0, 1}, reason),
              ExecutionStatus::CRASHED);
    EXPECT_NE(reason.find("unexpected code 2"), std::string::npos);
}

TEST(ClassifyTerminationTest, Signals) {
    std::string reason;
    EXPECT_EQ(ExecutionHarness::ClassifyTermination(std::nullopt, SIGXCPU, {0}, reason),
              ExecutionStatus::RESOURCE_KILLED);
    EXPECT_EQ(ExecutionHarness::ClassifyTermination(std::nullopt, SIGXFSZ, {0}, reason),
              ExecutionStatus::RESOURCE_KILLED);
    EXPECT_EQ(ExecutionHarness::ClassifyTermination(std::nullopt, SIGKILL, {0}, reason),
              ExecutionStatus::RESOURCE_KILLED);
    EXPECT_EQ(ExecutionHarness::ClassifyTermination(std::nullopt, SIGSEGV, {0}, reason),
              ExecutionStatus::CRASHED);
    EXPECT_EQ(ExecutionHarness::ClassifyTermination(std::nullopt, SIGABRT, {0}, reason),
              ExecutionStatus::CRASHED);
}

TEST(ResolveExecutableTest, SearchesPath) {
    EXPECT_EQ(ExecutionHarness::ResolveExecutable("sh", {"/nonexistent", "/bin"}), "/bin/sh");
    EXPECT_EQ(ExecutionHarness::ResolveExecutable("/bin/sh", {}), "/bin/sh");
    EXPECT_THROW(ExecutionHarness::ResolveExecutable("no-such-runner", {"/bin"}), ExecutionFault);
    EXPECT_THROW(ExecutionHarness::ResolveExecutable("/etc/hostname", {}), ExecutionFault);
}

// ============================================================================
// REPORT FILE
// ============================================================================

class ReportFileTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("codecell_report_" + std::to_string(::getpid()));
        fs::create_directories(dir_ / "out");
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    void Write(const fs::path& relative, const std::string& content) {
        std::ofstream(dir_ / relative) << content;
    }
};

TEST_F(ReportFileTest, ReadsRegularFiles) {
    Write("report.json", "{\"tests\": []}");
    Write("out/nested.json", "nested");

    EXPECT_EQ(ExecutionHarness::ReadReportFile(dir_, "report.json", 1024), "{\"tests\": []}");
    EXPECT_EQ(ExecutionHarness::ReadReportFile(dir_, "out/nested.json", 1024), "nested");
}

TEST_F(ReportFileTest, MissingFileIsAParseError) {
    EXPECT_THROW(ExecutionHarness::ReadReportFile(dir_, "report.json", 1024), ReportParseError);
}

TEST_F(ReportFileTest, SymlinksAreNotFollowed) {
    Write("secret", "host data");
    fs::create_symlink(dir_ / "secret", dir_ / "report.json");
    fs::create_directory_symlink(dir_ / "out", dir_ / "link");
    Write("out/r.json", "x");

    EXPECT_THROW(ExecutionHarness::ReadReportFile(dir_, "report.json", 1024), ReportParseError);
    EXPECT_THROW(ExecutionHarness::ReadReportFile(dir_, "link/r.json", 1024), ReportParseError);
}

TEST_F(ReportFileTest, OversizedAndSpecialFilesAreRejected) {
    Write("big.json", std::string(2048, 'x'));
    EXPECT_THROW(ExecutionHarness::ReadReportFile(dir_, "big.json", 1024), ReportParseError);

    ASSERT_EQ(::mkfifo((dir_ / "fifo.json").c_str(), 0600), 0);
    EXPECT_THROW(ExecutionHarness::ReadReportFile(dir_, "fifo.json", 1024), ReportParseError);

    EXPECT_THROW(ExecutionHarness::ReadReportFile(dir_, "../report.json", 1024), ReportParseError);
}

// ============================================================================
// REAL RUNS
// ============================================================================

class HarnessRunTest : public ::testing::Test {
protected:
    fs::path root_;
    std::unique_ptr<core::ExecutionContext> context_;

    void SetUp() override {
        root_ = fs::temp_directory_path() / ("codecell_harness_" + std::to_string(::getpid()));
        core::ExecutionContext::PrepareRoot(root_);

        std::optional<Identity> owner;
        if (geteuid() == 0) {
            owner = Identity{61000, 61000};
        }
        context_ = std::make_unique<core::ExecutionContext>(root_, "harness", owner);
    }

    void TearDown() override {
        context_.reset();
        fs::remove_all(root_);
    }

    HarnessRun Script(const std::string& script) {
        HarnessRun run;
        run.label = "[test]";
        run.workspace = context_->Path();
        run.argv = {"/bin/sh", "-c", script};
        run.environment = {"PATH=/usr/bin:/bin", "HOME=" + context_->Path().string()};
        run.limits.network_disabled = false;
        run.limits.wall_clock_seconds = 10.0;
        run.deadline = std::chrono::milliseconds(10000);
        run.report_file = "";
        run.max_output_bytes = 4096;
        run.drain_timeout = std::chrono::milliseconds(200);

        if (geteuid() == 0) {
            run.identity = Identity{61000, 61000};
            run.require_identity_switch = true;
            run.sweep_identity = true;
        }
        else {
            run.identity = Identity{getuid(), getgid()};
            run.require_identity_switch = false;
        }
        return run;
    }

    core::CancellationToken token_;
};

TEST_F(HarnessRunTest, CompletedRunCapturesStreams) {
    ExecutionHarness harness;
    auto outcome = harness.Run(Script("echo 1..1; echo 'ok 1 - works'; echo diag >&2; exit 1"), token_);

    EXPECT_EQ(outcome.status, ExecutionStatus::COMPLETED) << outcome.reason;
    ASSERT_TRUE(outcome.exit_code.has_value());
    EXPECT_EQ(*outcome.exit_code, 1);
    EXPECT_EQ(outcome.stdout_output, "1..1\nok 1 - works\n");
    EXPECT_EQ(outcome.stderr_output, "diag\n");
    ASSERT_TRUE(outcome.report_payload.has_value());
    EXPECT_EQ(*outcome.report_payload, outcome.stdout_output);
    EXPECT_EQ(outcome.fault, FaultKind::NONE);
}

TEST_F(HarnessRunTest, RunnerSeesOnlyTheGivenEnvironmentAndWorkspace) {
    ExecutionHarness harness;
    auto outcome = harness.Run(Script("pwd; env | sort"), token_);

    ASSERT_EQ(outcome.status, ExecutionStatus::COMPLETED) << outcome.reason;
    auto lines = utils::StringUtils::Split(outcome.stdout_output, '\n');
    ASSERT_FALSE(lines.empty());
    EXPECT_TRUE(fs::equivalent(fs::path(lines[0]), context_->Path()));
    EXPECT_EQ(outcome.stdout_output.find("CODECELL"), std::string::npos);
}

TEST_F(HarnessRunTest, UnexpectedExitCodeIsACrash) {
    ExecutionHarness harness;
    auto outcome = harness.Run(Script("exit 3"), token_);

    EXPECT_EQ(outcome.status, ExecutionStatus::CRASHED);
    ASSERT_TRUE(outcome.exit_code.has_value());
    EXPECT_EQ(*outcome.exit_code, 3);
    EXPECT_FALSE(outcome.report_payload.has_value());
}

TEST_F(HarnessRunTest, SignalIsACrash) {
    ExecutionHarness harness;
    auto outcome = harness.Run(Script("kill -SEGV $$"), token_);

    EXPECT_EQ(outcome.status, ExecutionStatus::CRASHED);
    ASSERT_TRUE(outcome.term_signal.has_value());
    EXPECT_EQ(*outcome.term_signal, SIGSEGV);
}

TEST_F(HarnessRunTest, DeadlineKillsTheWholeTree) {
    ExecutionHarness harness;
    auto run = Script("sleep 30 & while :; do :; done");
    run.deadline = std::chrono::milliseconds(500);

    auto started = std::chrono::steady_clock::now();
    auto outcome = harness.Run(run, token_);
    auto took = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(outcome.status, ExecutionStatus::TIMED_OUT);
    EXPECT_NE(outcome.reason.find("deadline"), std::string::npos);
    EXPECT_GE(outcome.elapsed.count(), 500);
    EXPECT_LT(took, std::chrono::seconds(5));
}

TEST_F(HarnessRunTest, CancelledTokenYieldsCancelled) {
    ExecutionHarness harness;
    token_.Cancel(core::CancelCause::CALLER);

    auto outcome = harness.Run(Script("sleep 30"), token_);
    EXPECT_EQ(outcome.status, ExecutionStatus::CANCELLED);
}

TEST_F(HarnessRunTest, WatchdogCancellationIsATimeout) {
    ExecutionHarness harness;
    token_.Cancel(core::CancelCause::DEADLINE);

    auto outcome = harness.Run(Script("sleep 30"), token_);
    EXPECT_EQ(outcome.status, ExecutionStatus::TIMED_OUT);
}

TEST_F(HarnessRunTest, PublishedGroupIsKilledFromAnotherThread) {
    ExecutionHarness harness;
    pid_t seen = 0;
    std::thread watchdog([this, &seen]() {
        auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (token_.Process() == 0 && std::chrono::steady_clock::now() < give_up) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        seen = token_.Process();
        token_.Cancel(core::CancelCause::DEADLINE);
        token_.KillProcessGroup();
    });

    auto started = std::chrono::steady_clock::now();
    auto outcome = harness.Run(Script("sleep 30"), token_);
    watchdog.join();

    EXPECT_GT(seen, 0);
    EXPECT_EQ(outcome.status, ExecutionStatus::TIMED_OUT);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    EXPECT_EQ(token_.Process(), 0);
    EXPECT_FALSE(token_.KillProcessGroup());
}

TEST_F(HarnessRunTest, OutputFloodIsTruncated) {
    ExecutionHarness harness;
    auto outcome = harness.Run(Script("i=0; while [ $i -lt 2000 ]; do echo xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx; i=$((i+1)); done"), token_);

    ASSERT_EQ(outcome.status, ExecutionStatus::COMPLETED) << outcome.reason;
    EXPECT_TRUE(outcome.stdout_truncated);
    EXPECT_LE(outcome.stdout_output.size(), 4096u);
    EXPECT_TRUE(utils::StringUtils::EndsWith(outcome.stdout_output,
                                             utils::StringUtils::kTruncationMarker));
    // A truncated stdout is never handed to a parser
    EXPECT_FALSE(outcome.report_payload.has_value());
}

TEST_F(HarnessRunTest, ReportFileIsRead) {
    ExecutionHarness harness;
    auto run = Script("printf '1..0\\n' > report.tap");
    run.report_file = "report.tap";

    auto outcome = harness.Run(run, token_);
    ASSERT_EQ(outcome.status, ExecutionStatus::COMPLETED) << outcome.reason;
    ASSERT_TRUE(outcome.report_payload.has_value());
    EXPECT_EQ(*outcome.report_payload, "1..0\n");
}

TEST_F(HarnessRunTest, SymlinkedReportFileIsIgnored) {
    ExecutionHarness harness;
    auto run = Script("ln -s /etc/passwd report.tap");
    run.report_file = "report.tap";

    auto outcome = harness.Run(run, token_);
    EXPECT_EQ(outcome.status, ExecutionStatus::COMPLETED);
    EXPECT_FALSE(outcome.report_payload.has_value());
}

TEST_F(HarnessRunTest, UnverifiedPrivilegeDropNeverExecs) {
    auto identity = std::make_shared<FakeIdentitySyscalls>();
    identity->ignore_setresuid = true;
    ExecutionHarness harness(identity, nullptr);

    auto run = Script("touch escaped");
    run.identity = Identity{61000, 61000};
    run.require_identity_switch = true;
    run.sweep_identity = false;

    auto outcome = harness.Run(run, token_);

    EXPECT_EQ(outcome.status, ExecutionStatus::CRASHED);
    EXPECT_EQ(outcome.fault, FaultKind::PRIVILEGE_ERROR);
    EXPECT_FALSE(fs::exists(context_->Path() / "escaped"));
}

TEST_F(HarnessRunTest, RejectedLimitNeverExecs) {
    auto rlimits = std::make_shared<FakeRlimitSyscalls>();
    rlimits->rejected.insert(RLIMIT_CPU);
    ExecutionHarness harness(nullptr, rlimits);

    auto outcome = harness.Run(Script("touch escaped"), token_);

    EXPECT_EQ(outcome.status, ExecutionStatus::CRASHED);
    EXPECT_EQ(outcome.fault, FaultKind::LIMIT_SETUP_ERROR);
    EXPECT_NE(outcome.reason.find("RLIMIT_CPU"), std::string::npos);
    EXPECT_FALSE(fs::exists(context_->Path() / "escaped"));
}

TEST_F(HarnessRunTest, FailedNetworkDetachNeverExecs) {
    auto rlimits = std::make_shared<FakeRlimitSyscalls>();
    rlimits->fail_unshare = true;
    ExecutionHarness harness(nullptr, rlimits);

    auto run = Script("touch escaped");
    run.limits.network_disabled = true;
    auto outcome = harness.Run(run, token_);

    EXPECT_EQ(outcome.status, ExecutionStatus::CRASHED);
    EXPECT_EQ(outcome.fault, FaultKind::LIMIT_SETUP_ERROR);
    EXPECT_FALSE(fs::exists(context_->Path() / "escaped"));
}

TEST_F(HarnessRunTest, FailedPrivateTmpNeverExecs) {
    auto rlimits = std::make_shared<FakeRlimitSyscalls>();
    rlimits->fail_unshare_mounts = true;
    ExecutionHarness harness(nullptr, rlimits);

    auto run = Script("touch escaped");
    run.private_directories = {"/tmp"};
    auto outcome = harness.Run(run, token_);

    EXPECT_EQ(outcome.status, ExecutionStatus::CRASHED);
    EXPECT_EQ(outcome.fault, FaultKind::LIMIT_SETUP_ERROR);
    EXPECT_NE(outcome.reason.find("CLONE_NEWNS"), std::string::npos);
    EXPECT_FALSE(fs::exists(context_->Path() / "escaped"));
}

TEST_F(HarnessRunTest, PrivateTmpHidesScratchFilesFromTheHost) {
    if (geteuid() != 0) {
        GTEST_SKIP() << "mount namespaces need root";
    }
    const fs::path marker = fs::path("/tmp") / ("codecell_private_" + std::to_string(::getpid()));
    ExecutionHarness harness;

    // The workspace itself lives below /tmp and must stay reachable
    auto run = Script("touch " + marker.string() + " && touch in_workspace && ls -A /tmp");
    run.private_directories = {"/tmp", "/nonexistent-scratch"};
    auto outcome = harness.Run(run, token_);

    ASSERT_EQ(outcome.status, ExecutionStatus::COMPLETED) << outcome.reason << outcome.stderr_output;
    EXPECT_NE(outcome.stdout_output.find(marker.filename().string()), std::string::npos);
    EXPECT_FALSE(fs::exists(marker));
    EXPECT_TRUE(fs::exists(context_->Path() / "in_workspace"));
}

TEST_F(HarnessRunTest, InvalidLimitsFailBeforeFork) {
    ExecutionHarness harness;
    auto run = Script("true");
    run.limits.max_processes = 0;
    EXPECT_THROW(harness.Run(run, token_), LimitSetupError);

    run = Script("true");
    run.argv = {"sh", "-c", "true"};
    EXPECT_THROW(harness.Run(run, token_), ExecutionFault);
}
