#include <csignal>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "../src/xworker/process.hpp"
#include "../src/xworker/serve.hpp"

using namespace std::string_literals;

namespace xgear {
namespace {
auto make_job(const std::string& data) -> Job {
    return *Job::parse(to_bytes("H:1\0shell\0"s + data));
}
auto run(const std::string& command, const std::string& data) -> std::optional<std::string> {
    return make_shell_function("/bin/sh", command)(make_job(data));
}
} // namespace

TEST(ShellFunction, JobDataOnStdinResultOnStdout) {
    const auto result = run("cat", "hello world");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "hello world");
}

TEST(ShellFunction, InputLargerThanPipeBuffer) {
    auto data = std::string();
    for(auto i = 0; i < 1024 * 1024; i += 1) {
        data += static_cast<char>('a' + i % 26);
    }
    const auto result = run("cat", data);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), data.size());
    EXPECT_EQ(*result, data);
}

TEST(ShellFunction, NonZeroExitThrowsWithStderr) {
    try {
        run("echo broken input >&2; exit 3", "");
        FAIL() << "no exception thrown";
    } catch(const std::runtime_error& e) {
        const auto message = std::string(e.what());
        EXPECT_NE(message.find("exit code 3"), std::string::npos) << message;
        EXPECT_NE(message.find("broken input"), std::string::npos) << message;
    }
}

TEST(ShellFunction, EmptyStdoutIsNoResult) {
    EXPECT_FALSE(run("true", "").has_value());
}

TEST(ShellFunction, ExportsJobEnvironment) {
    const auto result = run("printf '%s %s' \"$XGEAR_JOB_HANDLE\" \"$XGEAR_FUNCTION\"", "");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "H:1 shell");
}

TEST(ShellFunction, KilledBySignalThrows) {
    EXPECT_THROW(run("kill -TERM $$", ""), std::runtime_error);
}

TEST(Process, CollectsOutputsAndExitCode) {
    auto proc = process::Process();
    ASSERT_EQ(proc.open("/bin/sh", "cat; echo err >&2; exit 5").message, nullptr);
    EXPECT_GT(proc.get_pid(), 0);
    const auto result = proc.communicate("in");
    ASSERT_EQ(result.message, nullptr);
    EXPECT_EQ(result.out, "in");
    EXPECT_EQ(result.err, "err\n");
    EXPECT_EQ(result.status.reason, process::ExitReason::Exit);
    EXPECT_EQ(result.status.code, 5);
}

TEST(Process, ChildIgnoringStdinDoesNotBlock) {
    signal(SIGPIPE, SIG_IGN);
    auto proc = process::Process();
    ASSERT_EQ(proc.open("/bin/sh", "exec 0<&-; echo done").message, nullptr);
    const auto result = proc.communicate(std::string(256 * 1024, 'x'));
    EXPECT_EQ(result.out, "done\n");
    EXPECT_EQ(result.status.code, 0);
}
} // namespace xgear
