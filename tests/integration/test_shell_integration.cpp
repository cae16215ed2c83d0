#include "../test_utils.hpp"

#include <gtest/gtest.h>
#include <localexec/connection.hpp>
#include <localexec/encoding.hpp>
#include <localexec/runner.hpp>

using namespace localexec;

// End-to-end runs through real child processes

#ifndef _WIN32

TEST(ShellIntegrationTest, EchoHello)
{
    LocalConnection conn;
    EXPECT_EQ(conn.runner_kind(), RunnerKind::Shell);
    EXPECT_EQ(conn.run_command("echo hello"), CommandResult("hello\n", "", 0));
}

TEST(ShellIntegrationTest, NonexistentExecutable)
{
    LocalConnection conn;
    EXPECT_EQ(conn.run_command("this_should_not_exist_12345"), CommandResult("", "", 1));
}

TEST(ShellIntegrationTest, ShellFeatures)
{
    LocalConnection conn;
    CommandResult result = conn.run_command("printf 'a\\nb\\n' | wc -l; echo warn >&2; exit 3");

    EXPECT_EQ(result.stdout_text.find_first_not_of(" \t"), result.stdout_text.find('2'));
    EXPECT_EQ(result.stderr_text, "warn\n");
    EXPECT_EQ(result.exit_status, 3);
}

TEST(ShellIntegrationTest, WrapperIsApplied)
{
    struct EnvWrapper : CommandWrapper
    {
        std::string run(const std::string& command) override
        {
            return "env LOCALEXEC_WRAPPED=yes " + command;
        }
    };

    LocalOptions options;
    options.command_wrapper = std::make_shared<EnvWrapper>();
    LocalConnection conn(options);

    EXPECT_EQ(conn.run_command("printenv LOCALEXEC_WRAPPED").stdout_text, "yes\n");
}

TEST(ShellIntegrationTest, CommandsRunInOrder)
{
    LocalConnection conn;
    for (int i = 0; i < 5; ++i)
        EXPECT_EQ(conn.run_command("echo " + std::to_string(i)).stdout_text,
                  std::to_string(i) + "\n");
}

TEST(ShellIntegrationTest, ScriptedRunnerWithFakeHost)
{
    // /bin/echo stands in for the scripting host and prints the command line it received
    auto runner = create_scripted_runner(create_process_invoker(), "/bin/echo");
    CommandResult result = runner->run_command("Get-Date");

    const std::string prefix = "-NoProfile -NonInteractive -EncodedCommand ";
    ASSERT_EQ(result.stdout_text.rfind(prefix, 0), 0u) << result.stdout_text;
    std::string payload = result.stdout_text.substr(prefix.size());
    payload.pop_back(); // newline
    EXPECT_EQ(encoding::decode_script(payload), encoding::quiet_script("Get-Date"));
}

#endif

TEST(ScriptedIntegrationTest, PowerShellOneShot)
{
    SKIP_WITHOUT_POWERSHELL();

    std::string host = subprocess::find_executable("powershell") ? "powershell" : "pwsh";
    auto runner = create_scripted_runner(create_process_invoker(), host);
    CommandResult result = runner->run_command("Write-Output (2 + 3)");

    EXPECT_EQ(result.exit_status, 0);
    EXPECT_NE(result.stdout_text.find("5"), std::string::npos);
}
