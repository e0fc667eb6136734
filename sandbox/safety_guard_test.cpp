#include "sandbox/safety_guard.hpp"

#include <errno.h>
#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

namespace {

using namespace sandbox;

const std::string test_tmpdir = "/tmp/evalbox_testdir";

ExecutionInfo Run(const std::string& executable,
                  const std::vector<std::string>& args,
                  const GuardOptions& guard) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ExecutionOptions options("sandbox/test", executable);
  options.args = args;
  options.guard = guard;
  options.wall_limit_millis = 5000;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg)) << error_msg;
  return info;
}

class SafetyGuardTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!SafetyGuard::HostCapabilities().syscall_filter) {
      GTEST_SKIP() << "syscall filtering is not available on this host";
    }
  }
};

// NOLINTNEXTLINE
TEST(SafetyGuard, EnforcedFollowsOptions) {
  GuardOptions options;
  options.deny_filesystem_changes = false;
  options.deny_process_creation = false;
  options.deny_foreign_signals = false;
  SafetyGuard guard(options);
  EXPECT_FALSE(guard.Enforced().syscall_filter);
  EXPECT_EQ(guard.Enforced().resource_limits,
            SafetyGuard::HostCapabilities().resource_limits);
}

// NOLINTNEXTLINE
TEST(SafetyGuard, InstallingLimitsInChildDoesNotAffectParent) {
  GuardOptions options;
  options.max_files = 16;
  ExecutionInfo info = ::Run("return_arg1", {"0"}, options);
  EXPECT_EQ(info.status_code, 0);
  util::TempDir tmpdir(test_tmpdir);
  for (int i = 0; i < 32; i++) {
    util::File::Write(tmpdir.Path() + "/f" + std::to_string(i), "x");
  }
}

// NOLINTNEXTLINE
TEST_F(SafetyGuardTest, UnlinkIsDenied) {
  util::TempDir tmpdir(test_tmpdir);
  std::string path = tmpdir.Path() + "/victim";
  util::File::Write(path, "data");
  ExecutionInfo info = ::Run("unlink_arg1", {path}, GuardOptions());
  EXPECT_EQ(info.status_code, EPERM);
  EXPECT_TRUE(util::File::Exists(path));
}

// NOLINTNEXTLINE
TEST_F(SafetyGuardTest, UnlinkIsAllowedWhenNotDenied) {
  util::TempDir tmpdir(test_tmpdir);
  std::string path = tmpdir.Path() + "/victim";
  util::File::Write(path, "data");
  GuardOptions options;
  options.deny_filesystem_changes = false;
  ExecutionInfo info = ::Run("unlink_arg1", {path}, options);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_FALSE(util::File::Exists(path));
}

// NOLINTNEXTLINE
TEST_F(SafetyGuardTest, FtruncateIsDenied) {
  util::TempDir tmpdir(test_tmpdir);
  std::string path = tmpdir.Path() + "/victim";
  util::File::Write(path, "data");
  ExecutionInfo info = ::Run("ftruncate_arg1", {path}, GuardOptions());
  EXPECT_EQ(info.status_code, EPERM);
  EXPECT_EQ(util::File::Read(path), "data");
}

// NOLINTNEXTLINE
TEST_F(SafetyGuardTest, FtruncateIsAllowedWhenNotDenied) {
  util::TempDir tmpdir(test_tmpdir);
  std::string path = tmpdir.Path() + "/victim";
  util::File::Write(path, "data");
  GuardOptions options;
  options.deny_filesystem_changes = false;
  ExecutionInfo info = ::Run("ftruncate_arg1", {path}, options);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(util::File::Read(path), "");
}

// NOLINTNEXTLINE
TEST_F(SafetyGuardTest, ForkIsDenied) {
  ExecutionInfo info = ::Run("fork_child", {}, GuardOptions());
  EXPECT_EQ(info.status_code, EPERM);
}

// NOLINTNEXTLINE
TEST_F(SafetyGuardTest, ForkIsAllowedWhenNotDenied) {
  GuardOptions options;
  options.deny_process_creation = false;
  ExecutionInfo info = ::Run("fork_child", {}, options);
  EXPECT_EQ(info.status_code, 0);
}

// NOLINTNEXTLINE
TEST_F(SafetyGuardTest, ThreadsAreAllowed) {
  ExecutionInfo info = ::Run("thread_arg1", {"4"}, GuardOptions());
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
}

// NOLINTNEXTLINE
TEST_F(SafetyGuardTest, SignalingTheHarnessIsDenied) {
  ExecutionInfo info = ::Run("signal_parent", {}, GuardOptions());
  EXPECT_EQ(info.status_code, EPERM);
}

// NOLINTNEXTLINE
TEST_F(SafetyGuardTest, SignalingItselfIsAllowed) {
  ExecutionInfo info = ::Run("signal_arg1", {"6"}, GuardOptions());
  EXPECT_EQ(info.signal, 6);
}

}  // namespace
