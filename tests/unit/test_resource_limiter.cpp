/**
 * @file test_resource_limiter.cpp
 * @brief Unit tests for rlimit planning, application and verification
 */

#include "codecell/sandbox/resource_limiter.hpp"
#include "codecell/core/types.hpp"
#include "fake_syscalls.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>

#include <sys/mount.h>

using namespace codecell;
using namespace codecell::sandbox;
using codecell::test_support::FakeIdentitySyscalls;
using codecell::test_support::FakeRlimitSyscalls;

namespace {

RlimitPlan Find(const std::vector<RlimitPlan>& plans, int resource) {
    auto it = std::find_if(plans.begin(), plans.end(),
                           [resource](const RlimitPlan& p) { return p.resource == resource; });
    EXPECT_NE(it, plans.end());
    return it == plans.end() ? RlimitPlan{} : *it;
}

} // namespace

class ResourceLimiterTest : public ::testing::Test {
protected:
    void SetUp() override {
        identity_ = std::make_shared<FakeIdentitySyscalls>();
        rlimits_ = std::make_shared<FakeRlimitSyscalls>();
        limits_.cpu_time_seconds = 2.5;
        limits_.memory_bytes = 256ULL * 1024 * 1024;
        limits_.max_processes = 8;
    }

    RestrictedContext Restricted() {
        PrivilegeDeescalator deescalator(identity_);
        return deescalator.Drop(SetupContext(Identity{61000, 61000}));
    }

    std::shared_ptr<FakeIdentitySyscalls> identity_;
    std::shared_ptr<FakeRlimitSyscalls> rlimits_;
    ExecutionLimits limits_;
};

TEST_F(ResourceLimiterTest, PlanCoversEveryCeiling) {
    auto plans = ResourceLimiter::Plan(limits_, 3);
    ASSERT_EQ(plans.size(), 6u);

    auto cpu = Find(plans, RLIMIT_CPU);
    EXPECT_EQ(cpu.soft, 3u);
    EXPECT_EQ(cpu.hard, 4u);

    EXPECT_EQ(Find(plans, RLIMIT_AS).soft, 256ULL * 1024 * 1024);
    EXPECT_EQ(Find(plans, RLIMIT_NPROC).soft, 3u + 8u + 1u);
    EXPECT_EQ(Find(plans, RLIMIT_CORE).hard, 0u);
    EXPECT_EQ(Find(plans, RLIMIT_NOFILE).soft, limits_.max_open_files);
}

TEST_F(ResourceLimiterTest, InvalidLimitsFailClosed) {
    limits_.memory_bytes = 0;
    EXPECT_THROW(ResourceLimiter::Plan(limits_, 0), LimitSetupError);
}

TEST_F(ResourceLimiterTest, ApplySetsAndVerifies) {
    ResourceLimiter limiter(rlimits_);
    auto restricted = Restricted();

    limiter.Apply(restricted, limits_, 0);

    ASSERT_EQ(rlimits_->limits.size(), 6u);
    EXPECT_EQ(rlimits_->limits[RLIMIT_CPU].rlim_cur, 3u);
    EXPECT_EQ(rlimits_->limits[RLIMIT_NPROC].rlim_max, 9u);
}

TEST_F(ResourceLimiterTest, RejectedLimitIsFatal) {
    rlimits_->rejected.insert(RLIMIT_NPROC);
    ResourceLimiter limiter(rlimits_);
    auto restricted = Restricted();

    try {
        limiter.Apply(restricted, limits_, 0);
        FAIL() << "Apply() ignored a rejected setrlimit";
    }
    catch (const LimitSetupError& e) {
        EXPECT_EQ(e.Kind(), FaultKind::LIMIT_SETUP_ERROR);
        EXPECT_NE(std::string(e.what()).find("RLIMIT_NPROC"), std::string::npos);
    }
}

TEST_F(ResourceLimiterTest, LimitThatDoesNotReadBackIsFatal) {
    rlimits_->clamped.insert(RLIMIT_AS);
    ResourceLimiter limiter(rlimits_);
    auto restricted = Restricted();

    EXPECT_THROW(limiter.Apply(restricted, limits_, 0), LimitSetupError);
}

TEST_F(ResourceLimiterTest, NetworkDetachFollowsTheFlag) {
    ResourceLimiter limiter(rlimits_);
    SetupContext setup(Identity{61000, 61000});

    limits_.network_disabled = false;
    limiter.DetachNetwork(setup, limits_);
    EXPECT_EQ(rlimits_->unshare_calls, 0);

    limits_.network_disabled = true;
    limiter.DetachNetwork(setup, limits_);
    EXPECT_EQ(rlimits_->unshare_calls, 1);

    rlimits_->fail_unshare = true;
    EXPECT_THROW(limiter.DetachNetwork(setup, limits_), LimitSetupError);
}

// ============================================================================
// PRIVATE TEMPORARY DIRECTORIES
// ============================================================================

class PrivateTempTest : public ResourceLimiterTest {
protected:
    void SetUp() override {
        ResourceLimiterTest::SetUp();
        scratch_ = std::filesystem::canonical(std::filesystem::temp_directory_path()) /
                   "codecell_private_tmp_test";
        workspace_ = scratch_ / "runs" / "job-1";
        std::filesystem::create_directories(workspace_);
    }

    void TearDown() override {
        std::filesystem::remove_all(scratch_);
    }

    std::filesystem::path scratch_;
    std::filesystem::path workspace_;
};

TEST_F(PrivateTempTest, EmptyPlanTouchesNothing) {
    ResourceLimiter limiter(rlimits_);
    limiter.IsolateTemporaryDirectories(SetupContext(Identity{61000, 61000}), PrivateTempPlan{});

    EXPECT_EQ(rlimits_->unshare_mounts_calls, 0);
    EXPECT_TRUE(rlimits_->mounts.empty());
}

TEST_F(PrivateTempTest, MountsFreshTmpfsAndKeepsTheWorkspace) {
    PrivateTempPlan plan;
    plan.directories = {"/dev/shm", scratch_.string()};
    plan.workspace = workspace_.string();
    plan.size_bytes = 1024 * 1024;

    ResourceLimiter limiter(rlimits_);
    limiter.IsolateTemporaryDirectories(SetupContext(Identity{61000, 61000}), plan);

    EXPECT_EQ(rlimits_->unshare_mounts_calls, 1);
    ASSERT_EQ(rlimits_->mounts.size(), 4u);

    // Propagation to the host is cut before anything is mounted
    EXPECT_EQ(rlimits_->mounts[0].target, "/");
    EXPECT_EQ(rlimits_->mounts[0].flags, static_cast<unsigned long>(MS_REC | MS_PRIVATE));

    EXPECT_EQ(rlimits_->mounts[1].target, "/dev/shm");
    EXPECT_EQ(rlimits_->mounts[1].fstype, "tmpfs");
    EXPECT_EQ(rlimits_->mounts[1].data, "mode=1777,size=1048576");
    EXPECT_TRUE(rlimits_->mounts[1].flags & MS_NOSUID);

    EXPECT_EQ(rlimits_->mounts[2].target, scratch_.string());
    EXPECT_EQ(rlimits_->mounts[2].fstype, "tmpfs");

    EXPECT_EQ(rlimits_->mounts[3].target, workspace_.string());
    EXPECT_EQ(rlimits_->mounts[3].source.rfind("/proc/self/fd/", 0), 0u);
    EXPECT_TRUE(rlimits_->mounts[3].flags & MS_BIND);
}

TEST_F(PrivateTempTest, FailuresAreFatal) {
    PrivateTempPlan plan;
    plan.directories = {scratch_.string()};
    plan.workspace = workspace_.string();
    plan.size_bytes = 1024 * 1024;
    ResourceLimiter limiter(rlimits_);

    rlimits_->fail_unshare_mounts = true;
    EXPECT_THROW(limiter.IsolateTemporaryDirectories(SetupContext(Identity{61000, 61000}), plan),
                 LimitSetupError);

    rlimits_->fail_unshare_mounts = false;
    rlimits_->failing_mount_targets.insert("/");
    EXPECT_THROW(limiter.IsolateTemporaryDirectories(SetupContext(Identity{61000, 61000}), plan),
                 LimitSetupError);

    rlimits_->failing_mount_targets = {workspace_.string()};
    EXPECT_THROW(limiter.IsolateTemporaryDirectories(SetupContext(Identity{61000, 61000}), plan),
                 LimitSetupError);
}
