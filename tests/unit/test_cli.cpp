/**
 * @file test_cli.cpp
 * @brief Unit tests for codecell-run option parsing, configuration layering
 *        and exit codes
 */

#include "codecell/cli/command_line.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include <unistd.h>

using namespace codecell;
using namespace codecell::cli;
namespace fs = std::filesystem;
using json = nlohmann::json;

class CliTest : public ::testing::Test {
protected:
    fs::path temp_dir_;

    void SetUp() override {
        temp_dir_ = fs::temp_directory_path() / ("codecell_test_cli_" + std::to_string(::getpid()));
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    fs::path WriteFile(const std::string& name, const std::string& content) {
        auto path = temp_dir_ / name;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    static std::vector<const char*> Argv(const std::vector<std::string>& args) {
        std::vector<const char*> argv{"codecell-run"};
        for (const auto& arg : args) {
            argv.push_back(arg.c_str());
        }
        return argv;
    }

    int Run(const std::vector<std::string>& args,
            const std::map<std::string, std::string>& env = {},
            const std::string& input = "") {
        auto argv = Argv(args);
        std::istringstream in(input);
        out_.str("");
        return RunCli(static_cast<int>(argv.size()), argv.data(), env, in, out_);
    }

    CommandLineOptions Parse(const std::vector<std::string>& args) {
        auto argv = Argv(args);
        CommandLineOptions options;
        EXPECT_FALSE(ParseCommandLine(static_cast<int>(argv.size()), argv.data(), options).has_value());
        return options;
    }

    std::ostringstream out_;
};

TEST_F(CliTest, BadOptionsAreUsageErrors) {
    EXPECT_EQ(Run({"--bogus"}), kExitUsage);
    EXPECT_EQ(Run({"--report-format", "xml"}), kExitUsage);
    EXPECT_EQ(Run({"--wall-clock", "soon"}), kExitUsage);
    EXPECT_EQ(Run({"--config", (temp_dir_ / "missing.json").string()}), kExitUsage);
}

TEST_F(CliTest, HelpExitsCleanly) {
    EXPECT_EQ(Run({"--help"}), kExitOk);
}

TEST_F(CliTest, MalformedConfigFileIsAUsageError) {
    auto path = WriteFile("broken.json", "{\"limits\": ");
    EXPECT_EQ(Run({"--config", path.string(), "--health"}), kExitUsage);
}

TEST_F(CliTest, HealthWithInvalidConfigIsAUsageError) {
    EXPECT_EQ(Run({"--health", "--workspace-root", "relative/runs"}), kExitUsage);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliTest, HealthOfUnreadyHostIsAHostError) {
    int code = Run({"--health", "--no-pool", "--allow-network",
                    "--workspace-root", (temp_dir_ / "missing").string()});

    EXPECT_EQ(code, kExitHostError);
    auto health = json::parse(out_.str());
    EXPECT_EQ(health["status"], "unhealthy");
    EXPECT_FALSE(health["workspace_root_ready"].get<bool>());
}

TEST_F(CliTest, InvalidRequestIsAUsageError) {
    EXPECT_EQ(Run({"--no-pool", "--allow-network", "--workspace-root", temp_dir_.string()},
                  {}, "not json"),
              kExitUsage);
    EXPECT_EQ(Run({"--no-pool", "--allow-network", "--workspace-root", temp_dir_.string()},
                  {}, R"({"request_id": "x"})"),
              kExitUsage);
}

TEST_F(CliTest, ConfigurationLayersInOrder) {
    auto path = WriteFile("config.json", R"({
        "log_level": "error",
        "limits": {"wall_clock_seconds": 30, "cpu_time_seconds": 5, "memory_bytes": 1048576}
    })");

    // File only
    auto config = BuildConfig(Parse({"--config", path.string()}), {});
    EXPECT_EQ(config.log_level, "error");
    EXPECT_DOUBLE_EQ(config.default_limits.wall_clock_seconds, 30.0);
    EXPECT_DOUBLE_EQ(config.default_limits.cpu_time_seconds, 5.0);

    // Environment over file
    const std::map<std::string, std::string> env{
        {"CODECELL_WALL_CLOCK_SECONDS", "40"},
        {"CODECELL_LOG_LEVEL", "WARN"},
        {"CODECELL_MEMORY_BYTES", "2097152"}
    };
    config = BuildConfig(Parse({"--config", path.string()}), env);
    EXPECT_EQ(config.log_level, "warn");
    EXPECT_DOUBLE_EQ(config.default_limits.wall_clock_seconds, 40.0);
    EXPECT_EQ(config.default_limits.memory_bytes, 2097152u);
    EXPECT_DOUBLE_EQ(config.default_limits.cpu_time_seconds, 5.0);

    // Flags over environment; absent numeric flags leave the layers below alone
    config = BuildConfig(Parse({"--config", path.string(), "--wall-clock", "50",
                                "--log-level", "debug"}), env);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_DOUBLE_EQ(config.default_limits.wall_clock_seconds, 50.0);
    EXPECT_EQ(config.default_limits.memory_bytes, 2097152u);
    EXPECT_DOUBLE_EQ(config.default_limits.cpu_time_seconds, 5.0);
}

TEST_F(CliTest, FlagsSwitchDevelopmentModeAndNetwork) {
    auto options = Parse({"--no-pool", "--allow-network", "--preserve-workspace", "-v"});
    auto config = BuildConfig(options, {{"CODECELL_NETWORK_DISABLED", "true"}});

    EXPECT_FALSE(config.identity.use_pool);
    EXPECT_FALSE(config.identity.require_identity_switch);
    EXPECT_FALSE(config.default_limits.network_disabled);
    EXPECT_TRUE(config.preserve_workspace);
    EXPECT_EQ(config.log_level, "debug");
}

TEST_F(CliTest, LimitsFileOverridesConfiguredLimits) {
    auto config_path = WriteFile("config.json", R"({"limits": {"max_processes": 16}})");
    auto limits_path = WriteFile("limits.json", R"({"max_processes": 4})");

    auto config = BuildConfig(Parse({"--config", config_path.string(),
                                     "--limits", limits_path.string()}), {});
    EXPECT_EQ(config.default_limits.max_processes, 4u);

    config = BuildConfig(Parse({"--limits", limits_path.string(), "--max-processes", "2"}), {});
    EXPECT_EQ(config.default_limits.max_processes, 2u);
}

TEST_F(CliTest, DevelopmentRunWritesTheReport) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "development mode is refused as root";
    }
    auto config_path = WriteFile("config.json", R"({
        "runner": {"command": ["/bin/sh", "run_tests.sh"], "report_file": "", "report_format": "tap"}
    })");
    fs::create_directories(temp_dir_ / "runs");

    int code = Run({"--config", config_path.string(), "--no-pool", "--allow-network",
                    "--workspace-root", (temp_dir_ / "runs").string()},
                   {},
                   R"({"request_id": "cli", "files": {"run_tests.sh": "echo 1..1\necho 'ok 1 - works'\n"}})");

    ASSERT_EQ(code, kExitOk);
    auto report = json::parse(out_.str());
    EXPECT_EQ(report["request_id"], "cli");
    EXPECT_EQ(report["summary"]["passed"], 1);
}
