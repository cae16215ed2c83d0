#pragma once

#include "../src/internal/subprocess/process.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <localexec/runner.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace localexec::test
{

inline bool is_ci_environment()
{
    const char* ci_vars[] = {
        "CI",                 // Generic (GitHub Actions, GitLab CI, etc.)
        "GITHUB_ACTIONS",     // GitHub Actions
        "GITLAB_CI",          // GitLab CI
        "JENKINS_URL",        // Jenkins
        "BUILDKITE",          // Buildkite
        "TF_BUILD",           // Azure Pipelines
        "APPVEYOR",           // AppVeyor
    };

    for (const char* var : ci_vars)
    {
        const char* value = std::getenv(var);
        if (value != nullptr && value[0] != '\0')
            return true;
    }
    return false;
}

inline bool has_env_flag(const char* name)
{
    const char* value = std::getenv(name);
    return value != nullptr && value[0] != '\0' && std::string(value) != "0";
}

// Path of the stub session server built alongside the tests
inline std::string stub_server_path()
{
    const char* path = std::getenv("LOCALEXEC_STUB_SERVER_PATH");
    return path != nullptr ? std::string(path) : std::string();
}

inline bool is_powershell_available()
{
    return localexec::subprocess::find_executable("powershell").has_value() ||
           localexec::subprocess::find_executable("pwsh").has_value();
}

inline bool should_run_powershell_tests()
{
    if (is_ci_environment())
        return false;
    return has_env_flag("LOCALEXEC_RUN_POWERSHELL_TESTS") && is_powershell_available();
}

// Records every command line and answers with a canned result
class RecordingInvoker : public localexec::ProcessInvoker
{
  public:
    explicit RecordingInvoker(localexec::CommandResult reply = {"", "", 0})
        : reply_(std::move(reply))
    {
    }

    localexec::CommandResult invoke(const std::string& command_line) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(command_line);
        return reply_;
    }

    std::vector<std::string> calls() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

  private:
    localexec::CommandResult reply_;
    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
};

} // namespace localexec::test

#define SKIP_WITHOUT_STUB_SERVER()                                                                 \
    do                                                                                             \
    {                                                                                              \
        if (localexec::test::stub_server_path().empty())                                           \
        {                                                                                          \
            GTEST_SKIP() << "LOCALEXEC_STUB_SERVER_PATH is not set";                               \
        }                                                                                          \
    } while (0)

#define SKIP_WITHOUT_POWERSHELL()                                                                  \
    do                                                                                             \
    {                                                                                              \
        if (!localexec::test::should_run_powershell_tests())                                       \
        {                                                                                          \
            GTEST_SKIP() << "Skipped live PowerShell test (set "                                   \
                            "LOCALEXEC_RUN_POWERSHELL_TESTS=1 and ensure `powershell` "            \
                            "or `pwsh` is in PATH)";                                               \
        }                                                                                          \
    } while (0)
