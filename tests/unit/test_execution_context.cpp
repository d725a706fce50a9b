/**
 * @file test_execution_context.cpp
 * @brief Unit tests for per-run workspace creation, population and removal
 */

#include "codecell/core/execution_context.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <sys/stat.h>
#include <unistd.h>

using namespace codecell;
using namespace codecell::core;

namespace fs = std::filesystem;

class ExecutionContextTest : public ::testing::Test {
protected:
    fs::path root_;

    void SetUp() override {
        root_ = fs::temp_directory_path() / ("codecell_test_ws_" + std::to_string(::getpid()));
        ExecutionContext::PrepareRoot(root_);
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    static std::string ReadFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(ExecutionContextTest, PrepareRootSetsTraverseOnlyMode) {
    struct stat st;
    ASSERT_EQ(::stat(root_.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0711u);
}

TEST_F(ExecutionContextTest, MaterializesFilesAndManifest) {
    ExecutionRequest request;
    request.files["solution.py"] = "def add(a, b):\n    return a + b\n";
    request.files["tests/unit/test_solution.py"] = "from solution import add\n";
    request.manifest = "pytest==8.2\n";

    fs::path workspace;
    {
        ExecutionContext context(root_, "job-1", std::nullopt);
        workspace = context.Path();
        context.Materialize(request, "requirements.txt");

        EXPECT_EQ(workspace.parent_path(), root_);
        EXPECT_EQ(workspace.filename().string().rfind("job-1-", 0), 0u);
        EXPECT_EQ(ReadFile(workspace / "solution.py"), request.files["solution.py"]);
        EXPECT_TRUE(fs::is_regular_file(workspace / "tests" / "unit" / "test_solution.py"));
        EXPECT_EQ(ReadFile(workspace / "requirements.txt"), "pytest==8.2\n");

        struct stat st;
        ASSERT_EQ(::stat(workspace.c_str(), &st), 0);
        EXPECT_EQ(st.st_mode & 0777, 0700u);
    }
    EXPECT_FALSE(fs::exists(workspace));
}

TEST_F(ExecutionContextTest, RejectsPathsLeavingTheWorkspace) {
    for (const std::string bad : {"", "/etc/passwd", "../escape.py", "a/../../b.py", "./a.py", "dir/"}) {
        EXPECT_THROW(ExecutionContext::ResolveInside(root_, bad), WorkspaceError) << bad;
    }
    EXPECT_EQ(ExecutionContext::ResolveInside(root_, "pkg/mod.py"), root_ / "pkg" / "mod.py");
}

TEST_F(ExecutionContextTest, ManifestCollisionIsRejected) {
    ExecutionRequest request;
    request.files["requirements.txt"] = "x";
    request.manifest = "y";

    ExecutionContext context(root_, "job-2", std::nullopt);
    EXPECT_THROW(context.Materialize(request, "requirements.txt"), WorkspaceError);
}

TEST_F(ExecutionContextTest, FileUnderFileIsRejected) {
    ExecutionContext context(root_, "job-3", std::nullopt);
    context.WriteFile("a", "file");
    EXPECT_THROW(context.WriteFile("a/b.py", "nested"), WorkspaceError);
}

TEST_F(ExecutionContextTest, RemovesLockedDirectories) {
    fs::path workspace;
    {
        ExecutionContext context(root_, "job-4", std::nullopt);
        workspace = context.Path();
        context.WriteFile("locked/inner/file.txt", "data");
        ASSERT_EQ(::chmod((workspace / "locked" / "inner").c_str(), 0), 0);
        ASSERT_EQ(::chmod((workspace / "locked").c_str(), 0500), 0);
    }
    EXPECT_FALSE(fs::exists(workspace));
}

TEST_F(ExecutionContextTest, PreservedWorkspaceSurvives) {
    fs::path workspace;
    {
        ExecutionContext context(root_, "job-5", std::nullopt, true);
        workspace = context.Path();
    }
    EXPECT_TRUE(fs::exists(workspace));
}
