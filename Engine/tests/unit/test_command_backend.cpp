/**
 * @file test_command_backend.cpp
 * @brief Tests for the process runner and the terraform/terragrunt backend
 *
 * A small shell script stands in for the terraform executable: `state pull`
 * prints ./state.json and `state push -` writes stdin to ./pushed.json, both
 * relative to the directory the backend runs it in.
 */

#include <gtest/gtest.h>
#include <backend/command_backend.hpp>
#include <backend/process.hpp>
#include <state/errors.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cerrno>
#include <sys/wait.h>
#include <unistd.h>

using namespace Terrasplit;

namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream file(path);
    file << content;
}

void write_script(const fs::path& path, const std::string& body) {
    write_file(path, "#!/bin/sh\n" + body);
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
}

const char* kStubTool =
    "if [ \"$1 $2\" = \"state pull\" ]; then cat ./state.json; exit $?; fi\n"
    "if [ \"$1 $2 $3\" = \"state push -\" ]; then cat > ./pushed.json; echo \"$0\" > ./pushed_by; exit 0; fi\n"
    "echo \"unexpected arguments: $*\" >&2\n"
    "exit 64\n";

} // namespace

class CommandBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("terrasplit_backend_" + std::to_string(::getpid()) + "_" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        fs::create_directories(root_ / "bin");
        fs::create_directories(root_ / "live" / "mono");

        write_script(root_ / "bin" / "terraform", kStubTool);
        write_script(root_ / "bin" / "terragrunt", kStubTool);
        write_script(root_ / "bin" / "locked",
                     "echo 'Error acquiring the state lock' >&2\nexit 1\n");

        config_.terraform_bin = (root_ / "bin" / "terraform").string();
        config_.terragrunt_bin = (root_ / "bin" / "terragrunt").string();
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    std::string dir(const std::string& name) const { return (root_ / "live" / name).string(); }

    fs::path root_;
    CommandBackendConfig config_;
};

// ============================================================================
// Process runner
// ============================================================================

TEST(ProcessTest, StdinReachesStdout) {
    ProcessResult result = run_process("cat", {}, "", "hello state\n");
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.stdout_text, "hello state\n");
    EXPECT_TRUE(result.stderr_text.empty());
}

TEST(ProcessTest, LargeInputDoesNotDeadlock) {
    std::string input(4 * 1024 * 1024, 'x');
    ProcessResult result = run_process("cat", {}, "", input);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.stdout_text.size(), input.size());
}

TEST(ProcessTest, ExitStatusAndStderrAreCaptured) {
    ProcessResult result = run_process("sh", {"-c", "echo oops >&2; exit 3"}, "");
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stderr_text, "oops\n");
}

TEST(ProcessTest, WorkingDirectoryIsApplied) {
    ProcessResult result = run_process("pwd", {}, "/");
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.stdout_text, "/\n");
}

TEST(ProcessTest, MissingExecutableExits127) {
    ProcessResult result = run_process("terrasplit-no-such-binary", {}, "");
    EXPECT_EQ(result.exit_code, 127);
    EXPECT_NE(result.stderr_text.find("failed to execute"), std::string::npos);
}

TEST(ProcessTest, ChildIgnoringInputDoesNotKillParent) {
    std::string input(1024 * 1024, 'x');
    ProcessResult result = run_process("true", {}, "", input);
    EXPECT_TRUE(result.succeeded());
}

TEST(ProcessTest, WaitReportsExitStatus) {
    pid_t pid = ::fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) ::_exit(5);

    ChildProcess child(pid);
    int status = child.wait();
    EXPECT_TRUE(child.reaped());
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 5);
}

TEST(ProcessTest, AbandonedChildIsKilledAndReaped) {
    pid_t pid = ::fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        ::pause();
        ::_exit(0);
    }

    {
        ChildProcess child(pid);
        EXPECT_FALSE(child.reaped());
    }

    int status = 0;
    errno = 0;
    EXPECT_EQ(::waitpid(pid, &status, WNOHANG), -1);
    EXPECT_EQ(errno, ECHILD);
}

// ============================================================================
// CommandBackend
// ============================================================================

TEST_F(CommandBackendTest, PullRunsInTheRequestedDirectory) {
    write_file(root_ / "live" / "mono" / "state.json", "{\"serial\": 3}\n");

    CommandBackend backend(config_);
    EXPECT_EQ(backend.pull(dir("mono")), "{\"serial\": 3}\n");
}

TEST_F(CommandBackendTest, PushWritesStateToStdin) {
    CommandBackend backend(config_);
    backend.push(dir("mono"), "{\"serial\": 4}\n");

    EXPECT_EQ(read_file(root_ / "live" / "mono" / "pushed.json"), "{\"serial\": 4}\n");
}

TEST_F(CommandBackendTest, TerragruntDirectoryIsDetected) {
    fs::create_directories(root_ / "live" / "tg");
    write_file(root_ / "live" / "tg" / "terragrunt.hcl", "include \"root\" {}\n");

    CommandBackend backend(config_);
    EXPECT_EQ(backend.detect_tool(dir("tg")), ToolKind::Terragrunt);
    EXPECT_EQ(backend.detect_tool(dir("mono")), ToolKind::Terraform);

    backend.push(dir("tg"), "{}\n");
    EXPECT_NE(read_file(root_ / "live" / "tg" / "pushed_by").find("terragrunt"), std::string::npos);
}

TEST_F(CommandBackendTest, ForcedToolOverridesDetection) {
    fs::create_directories(root_ / "live" / "tg");
    write_file(root_ / "live" / "tg" / "terragrunt.hcl", "\n");

    config_.forced_tool = ToolKind::Terraform;
    CommandBackend backend(config_);
    EXPECT_EQ(backend.detect_tool(dir("tg")), ToolKind::Terraform);
}

TEST_F(CommandBackendTest, FailingCommandIsBackendError) {
    config_.terraform_bin = (root_ / "bin" / "locked").string();
    CommandBackend backend(config_);

    try {
        backend.pull(dir("mono"));
        FAIL() << "expected BackendError";
    } catch (const BackendError& e) {
        EXPECT_EQ(e.exit_code(), 1);
        EXPECT_NE(e.stderr_text().find("state lock"), std::string::npos);
        EXPECT_EQ(e.directory(), dir("mono"));
    }
}

TEST_F(CommandBackendTest, MissingDirectoryIsBackendError) {
    CommandBackend backend(config_);
    EXPECT_THROW(backend.pull(dir("does-not-exist")), BackendError);
}

TEST_F(CommandBackendTest, MissingExecutableIsBackendError) {
    config_.terraform_bin = (root_ / "bin" / "nope").string();
    CommandBackend backend(config_);
    EXPECT_THROW(backend.push(dir("mono"), "{}"), BackendError);
}
