#include "../test_utils.hpp"

#include <gtest/gtest.h>
#include <localexec/connection.hpp>

using namespace localexec;
using localexec::test::RecordingInvoker;

namespace
{

class StaticOs : public OsInfo
{
  public:
    explicit StaticOs(bool windows) : windows_(windows) {}

    bool is_windows() const override
    {
        return windows_;
    }

    std::string name() const override
    {
        return windows_ ? "windows" : "linux";
    }

  private:
    bool windows_;
};

class CountingSession : public CommandRunner
{
  public:
    explicit CountingSession(int* destroyed) : destroyed_(destroyed) {}
    ~CountingSession() override
    {
        ++*destroyed_;
    }

    CommandResult run_command(const std::string& command) override
    {
        return CommandResult("session:" + command, "", 0);
    }

    RunnerKind kind() const override
    {
        return RunnerKind::Session;
    }

  private:
    int* destroyed_;
};

SessionAcquirer failing_acquirer(int* calls)
{
    return [calls](const LocalOptions&)
    {
        ++*calls;
        return AcquireResult::failure(SessionAcquisitionError("unavailable", 1, 0));
    };
}

} // namespace

TEST(LocalConnectionTest, Identity)
{
    LocalOptions options;
    options.os_detector = [](CommandRunner&) { return std::make_shared<StaticOs>(false); };
    int acquire_calls = 0;
    LocalConnection conn(options, std::make_shared<RecordingInvoker>(),
                         failing_acquirer(&acquire_calls));

    EXPECT_TRUE(conn.is_local());
    EXPECT_EQ(conn.uri(), "local://");
    EXPECT_FALSE(conn.login_command().has_value());
    EXPECT_FALSE(conn.is_closed());
}

TEST(LocalConnectionTest, DetectorUsesPassThroughRunner)
{
    struct Wrapper : CommandWrapper
    {
        std::string run(const std::string& command) override
        {
            return "sudo " + command;
        }
    };

    auto invoker = std::make_shared<RecordingInvoker>(CommandResult("Linux\n", "", 0));
    LocalOptions options;
    options.command_wrapper = std::make_shared<Wrapper>();
    RunnerKind detect_kind = RunnerKind::Session;
    options.os_detector = [&detect_kind](CommandRunner& runner)
    {
        detect_kind = runner.kind();
        CommandResult uname = runner.run_command("uname -s");
        return std::make_shared<StaticOs>(uname.stdout_text.find("Windows") != std::string::npos);
    };
    int acquire_calls = 0;

    LocalConnection conn(options, invoker, failing_acquirer(&acquire_calls));
    conn.run_command("id");

    EXPECT_EQ(detect_kind, RunnerKind::PassThrough);
    EXPECT_EQ(conn.runner_kind(), RunnerKind::Shell);
    EXPECT_EQ(acquire_calls, 0);
    EXPECT_EQ(invoker->calls(), (std::vector<std::string>{"uname -s", "sudo id"}));
}

TEST(LocalConnectionTest, WindowsFallbackToScripted)
{
    LocalOptions options;
    options.os_detector = [](CommandRunner&) { return std::make_shared<StaticOs>(true); };
    options.log_callback = [](LogLevel, const std::string&) {};
    int acquire_calls = 0;

    LocalConnection conn(options, std::make_shared<RecordingInvoker>(),
                         failing_acquirer(&acquire_calls));

    EXPECT_EQ(conn.runner_kind(), RunnerKind::Scripted);
    EXPECT_EQ(acquire_calls, 1);
}

TEST(LocalConnectionTest, CloseReleasesSessionOnce)
{
    LocalOptions options;
    options.os_detector = [](CommandRunner&) { return std::make_shared<StaticOs>(true); };
    int destroyed = 0;
    SessionAcquirer acquirer = [&destroyed](const LocalOptions&)
    { return AcquireResult::success(std::make_unique<CountingSession>(&destroyed)); };

    LocalConnection conn(options, std::make_shared<RecordingInvoker>(), acquirer);
    EXPECT_EQ(conn.runner_kind(), RunnerKind::Session);
    EXPECT_EQ(conn.run_command("dir").stdout_text, "session:dir");

    conn.close();
    EXPECT_EQ(destroyed, 1);
    EXPECT_TRUE(conn.is_closed());

    conn.close();
    EXPECT_EQ(destroyed, 1);
}

TEST(LocalConnectionTest, RunAfterCloseThrows)
{
    LocalOptions options;
    options.os_detector = [](CommandRunner&) { return std::make_shared<StaticOs>(false); };
    int acquire_calls = 0;
    LocalConnection conn(options, std::make_shared<RecordingInvoker>(),
                         failing_acquirer(&acquire_calls));

    conn.close();
    EXPECT_THROW(conn.run_command("echo hi"), ConnectionClosedError);
}

TEST(LocalConnectionTest, NullDetectorResultFallsBackToHost)
{
    LocalOptions options;
    options.enable_session = false;
    options.os_detector = [](CommandRunner&) { return std::shared_ptr<OsInfo>(); };
    int acquire_calls = 0;

    LocalConnection conn(options, std::make_shared<RecordingInvoker>(),
                         failing_acquirer(&acquire_calls));

#ifdef _WIN32
    EXPECT_EQ(conn.runner_kind(), RunnerKind::Scripted);
#else
    EXPECT_EQ(conn.runner_kind(), RunnerKind::Shell);
#endif
}
