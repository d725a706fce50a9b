/**
 * @file test_privilege_deescalator.cpp
 * @brief Unit tests for the verified one-way identity switch
 */

#include "codecell/sandbox/privilege_deescalator.hpp"
#include "codecell/core/types.hpp"
#include "fake_syscalls.hpp"

#include <gtest/gtest.h>

using namespace codecell;
using namespace codecell::sandbox;
using codecell::test_support::FakeIdentitySyscalls;

class PrivilegeDeescalatorTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeIdentitySyscalls> fake_ = std::make_shared<FakeIdentitySyscalls>();
    PrivilegeDeescalator deescalator_{fake_};
    Identity target_{61000, 61000};
};

TEST_F(PrivilegeDeescalatorTest, DropsRootToTarget) {
    RestrictedContext restricted = deescalator_.Drop(SetupContext(target_));

    EXPECT_EQ(restricted.Current().uid, 61000u);
    EXPECT_EQ(fake_->euid, 61000u);
    EXPECT_EQ(fake_->sgid, 61000u);
    EXPECT_TRUE(fake_->groups.empty());
    EXPECT_TRUE(fake_->no_new_privs);
}

TEST_F(PrivilegeDeescalatorTest, SwitchReportingSuccessWhileStillRootIsRejected) {
    fake_->ignore_setresuid = true;

    try {
        deescalator_.Drop(SetupContext(target_));
        FAIL() << "Drop() accepted an identity that is still uid 0";
    }
    catch (const PrivilegeError& e) {
        EXPECT_EQ(e.Kind(), FaultKind::PRIVILEGE_ERROR);
        EXPECT_NE(std::string(e.what()).find("not in effect"), std::string::npos);
    }
    EXPECT_EQ(fake_->setresuid_calls, 1);
}

TEST_F(PrivilegeDeescalatorTest, FailedSwitchIsRejected) {
    fake_->fail_setresuid = true;
    EXPECT_THROW(deescalator_.Drop(SetupContext(target_)), PrivilegeError);
}

TEST_F(PrivilegeDeescalatorTest, RetainedCapabilitiesAreRejected) {
    fake_->keep_capabilities = true;
    EXPECT_THROW(deescalator_.Drop(SetupContext(target_)), PrivilegeError);
}

TEST_F(PrivilegeDeescalatorTest, RootTargetIsRejected) {
    EXPECT_THROW(deescalator_.Drop(SetupContext(Identity{0, 61000})), PrivilegeError);
    EXPECT_THROW(deescalator_.Drop(SetupContext(Identity{61000, 0})), PrivilegeError);
    EXPECT_EQ(fake_->setresuid_calls, 0);
}

TEST_F(PrivilegeDeescalatorTest, SameIdentityIsRejectedWhenSwitchRequired) {
    fake_->BecomeUnprivileged(1000, 1000);
    EXPECT_THROW(deescalator_.Drop(SetupContext(Identity{1000, 1000}, true)), PrivilegeError);
}

TEST_F(PrivilegeDeescalatorTest, DevelopmentModeOnlyVerifies) {
    fake_->BecomeUnprivileged(1000, 1000);
    fake_->groups = {1000, 27};

    RestrictedContext restricted = deescalator_.Drop(SetupContext(Identity{1000, 1000}, false));

    EXPECT_EQ(restricted.Current().uid, 1000u);
    EXPECT_EQ(fake_->setresuid_calls, 0);
    EXPECT_TRUE(fake_->no_new_privs);
}

TEST_F(PrivilegeDeescalatorTest, DevelopmentModeRejectsRootGroup) {
    fake_->BecomeUnprivileged(1000, 1000);
    fake_->groups = {1000, 0};
    EXPECT_THROW(deescalator_.Drop(SetupContext(Identity{1000, 1000}, false)), PrivilegeError);
}

TEST_F(PrivilegeDeescalatorTest, DevelopmentModeRejectsCapabilities) {
    fake_->BecomeUnprivileged(1000, 1000);
    fake_->effective_caps = 1ULL << 21;  // CAP_SYS_ADMIN
    EXPECT_THROW(deescalator_.Drop(SetupContext(Identity{1000, 1000}, false)), PrivilegeError);
}
