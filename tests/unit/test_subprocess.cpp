#include "../../src/internal/subprocess/process.hpp"

#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <localexec/errors.hpp>
#include <thread>

#ifndef _WIN32
#include <csignal>
#include <cerrno>
#endif

using namespace localexec::subprocess;

TEST(ProcessTest, SpawnEcho)
{
    Process proc;

#ifdef _WIN32
    proc.spawn("cmd.exe", {"/c", "echo", "Hello"});
#else
    proc.spawn("/bin/echo", {"Hello"});
#endif

    EXPECT_TRUE(proc.is_running() || proc.try_wait().has_value());
    int exit_code = proc.wait();
    EXPECT_EQ(exit_code, 0);
}

TEST(ProcessTest, CaptureStdout)
{
    Process proc;

#ifdef _WIN32
    proc.spawn("cmd.exe", {"/c", "echo", "TestOutput"});
#else
    proc.spawn("/bin/echo", {"TestOutput"});
#endif

    std::string output = proc.stdout_pipe().read_all();
    EXPECT_NE(output.find("TestOutput"), std::string::npos);

    proc.wait();
}

TEST(ProcessTest, WriteStdin)
{
    Process proc;

#ifdef _WIN32
    proc.spawn("findstr", {".*"}); // Acts like cat
#else
    proc.spawn("/bin/cat", {});
#endif

    proc.stdin_pipe().write("Hello\n");
    proc.stdin_pipe().close(); // EOF

    std::string output = proc.stdout_pipe().read_all();
    EXPECT_EQ(output, "Hello\n");

    proc.wait();
}

TEST(ProcessTest, ReadAllUntilEof)
{
    Process proc;

#ifdef _WIN32
    proc.spawn("cmd.exe", {"/c", "echo Line1 && echo Line2"});
#else
    proc.spawn("/bin/sh", {"-c", "echo Line1; echo Line2"});
#endif

    std::string output = proc.stdout_pipe().read_all();
    EXPECT_NE(output.find("Line1"), std::string::npos);
    EXPECT_NE(output.find("Line2"), std::string::npos);
    EXPECT_LT(output.find("Line1"), output.find("Line2"));

    proc.wait();
}

TEST(ProcessTest, Terminate)
{
    Process proc;

#ifdef _WIN32
    proc.spawn("cmd.exe", {"/c", "ping", "-n", "11", "127.0.0.1", ">nul"});
#else
    proc.spawn("/bin/sleep", {"10"});
#endif

    EXPECT_TRUE(proc.is_running());

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    proc.terminate();

    proc.wait();
    EXPECT_FALSE(proc.is_running());
}

TEST(ProcessTest, NonZeroExitStatus)
{
    Process proc;

#ifdef _WIN32
    proc.spawn("cmd.exe", {"/c", "exit 3"});
#else
    proc.spawn("/bin/sh", {"-c", "exit 3"});
#endif

    EXPECT_EQ(proc.wait(), 3);
}

TEST(ProcessTest, MissingExecutableThrowsSpawnError)
{
    Process proc;
    try
    {
        proc.spawn("this_should_not_exist_12345", {});
        FAIL() << "Expected SpawnError";
    }
    catch (const localexec::SpawnError& e)
    {
        EXPECT_NE(e.error_code(), 0);
        EXPECT_NE(std::string(e.what()).find("this_should_not_exist_12345"), std::string::npos);
    }
}

TEST(ProcessTest, MissingWorkingDirectoryThrowsSpawnError)
{
    Process proc;
    ProcessOptions opts;
    opts.working_directory = "/this/directory/should/not/exist_12345";

#ifdef _WIN32
    EXPECT_THROW(proc.spawn("cmd.exe", {"/c", "echo", "x"}, opts), localexec::SpawnError);
#else
    EXPECT_THROW(proc.spawn("/bin/echo", {"x"}, opts), localexec::SpawnError);
#endif
}

TEST(ProcessTest, FindExecutable)
{
#ifdef _WIN32
    auto cmd = find_executable("cmd.exe");
    EXPECT_TRUE(cmd.has_value());
#else
    auto sh = find_executable("sh");
    EXPECT_TRUE(sh.has_value());
#endif

    auto nonexistent = find_executable("this_should_not_exist_12345");
    EXPECT_FALSE(nonexistent.has_value());
}

TEST(ProcessTest, Environment)
{
    Process proc;
    ProcessOptions opts;
    opts.environment["TEST_VAR"] = "test_value";

#ifdef _WIN32
    proc.spawn("cmd.exe", {"/c", "set", "TEST_VAR"}, opts);
#else
    proc.spawn("/bin/sh", {"-c", "echo $TEST_VAR"}, opts);
#endif

    std::string output = proc.stdout_pipe().read_all();
    EXPECT_NE(output.find("test_value"), std::string::npos);

    proc.wait();
}

#ifndef _WIN32
TEST(ProcessTest, EnvironmentOverridesKeepInheritedVariables)
{
    const char* path = std::getenv("PATH");
    ASSERT_NE(path, nullptr);

    Process proc;
    ProcessOptions opts;
    opts.environment["TEST_VAR"] = "test_value";
    proc.spawn("/bin/sh", {"-c", "printf '%s|%s' \"$TEST_VAR\" \"$PATH\""}, opts);

    EXPECT_EQ(proc.stdout_pipe().read_all(), std::string("test_value|") + path);
    EXPECT_EQ(proc.wait(), 0);
}
#endif

TEST(ProcessTest, CommandLineThroughShell)
{
    Process proc;

#ifdef _WIN32
    proc.spawn_command_line("echo first && echo second");
#else
    proc.spawn_command_line("echo first; echo second");
#endif

    std::string output = proc.stdout_pipe().read_all();
    EXPECT_NE(output.find("first"), std::string::npos);
    EXPECT_NE(output.find("second"), std::string::npos);
    EXPECT_EQ(proc.wait(), 0);
}

#ifndef _WIN32
TEST(ProcessTest, CommandLineWithoutShellIsSplitOnWhitespace)
{
    Process proc;
    proc.spawn_command_line("/bin/echo   one   two");

    EXPECT_EQ(proc.stdout_pipe().read_all(), "one two\n");
    EXPECT_EQ(proc.wait(), 0);
}

TEST(ProcessTest, SignalledChildReportsHighStatus)
{
    Process proc;
    proc.spawn("/bin/sleep", {"10"});
    proc.kill();

    EXPECT_EQ(proc.wait(), 128 + SIGKILL);
}

TEST(ProcessTest, DetachedChildCanBeKilled)
{
    Process proc;
    ProcessOptions opts;
    opts.redirect_stdin = false;
    opts.redirect_stdout = false;
    opts.detached = true;
    opts.kill_on_parent_exit = true;
    proc.spawn("/bin/sleep", {"10"}, opts);

    int pid = proc.pid();
    ASSERT_GT(pid, 0);
    EXPECT_TRUE(proc.is_running());

    proc.kill();
    proc.wait();
    EXPECT_EQ(::kill(pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
}

TEST(ProcessTest, KillOnParentExitChildOutlivesSpawningThread)
{
    Process proc;
    ProcessOptions opts;
    opts.redirect_stdin = false;
    opts.redirect_stdout = false;
    opts.detached = true;
    opts.kill_on_parent_exit = true;

    std::thread spawner([&] { proc.spawn("/bin/sleep", {"10"}, opts); });
    spawner.join();

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_TRUE(proc.is_running());
    EXPECT_FALSE(proc.try_wait().has_value());

    proc.kill();
    EXPECT_EQ(proc.wait(), 128 + SIGKILL);
}
#endif

TEST(ProcessTest, EmptyCommandLineThrowsSpawnError)
{
    Process proc;
    EXPECT_THROW(proc.spawn_command_line("   "), localexec::SpawnError);
}

TEST(CommandLineTest, NeedsShellForMetacharacters)
{
    EXPECT_TRUE(needs_shell("echo hi | sort"));
    EXPECT_TRUE(needs_shell("echo hi > out.txt"));
    EXPECT_TRUE(needs_shell("a && b"));
#ifndef _WIN32
    EXPECT_TRUE(needs_shell("echo $HOME"));
    EXPECT_TRUE(needs_shell("ls *.txt"));
    EXPECT_TRUE(needs_shell("echo 'quoted'"));
#endif
}

TEST(CommandLineTest, NeedsShellForLeadingBuiltin)
{
    EXPECT_TRUE(needs_shell("cd /tmp"));
    EXPECT_TRUE(needs_shell("set"));
#ifdef _WIN32
    EXPECT_TRUE(needs_shell("ECHO hi"));
    EXPECT_TRUE(needs_shell("dir"));
#else
    EXPECT_TRUE(needs_shell("export FOO"));
    EXPECT_TRUE(needs_shell("exit 4"));
#endif
}

TEST(CommandLineTest, PlainCommandsSkipShell)
{
    EXPECT_FALSE(needs_shell("hostname"));
    EXPECT_FALSE(needs_shell("uname -a"));
    EXPECT_FALSE(needs_shell(""));
    // A builtin name that is not the first word does not count
    EXPECT_FALSE(needs_shell("git cd"));
}

TEST(CommandLineTest, SplitOnWhitespace)
{
    EXPECT_EQ(split_command_line("  uname\t-a  -r\n"),
              (std::vector<std::string>{"uname", "-a", "-r"}));
    EXPECT_TRUE(split_command_line("").empty());
    EXPECT_TRUE(split_command_line(" \t ").empty());
}
