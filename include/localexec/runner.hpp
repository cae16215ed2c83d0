#ifndef LOCALEXEC_RUNNER_HPP
#define LOCALEXEC_RUNNER_HPP

#include <functional>
#include <localexec/errors.hpp>
#include <localexec/types.hpp>
#include <memory>
#include <optional>
#include <string>

namespace localexec
{

/**
 * Runs a complete command line as a child process and captures its output.
 *
 * Implementations block until the child exits. A child that cannot be started
 * yields CommandResult{"", "", 1} instead of an exception.
 */
class ProcessInvoker
{
  public:
    virtual ~ProcessInvoker() = default;
    virtual CommandResult invoke(const std::string& command_line) = 0;
};

/// Invoker backed by real child processes (working directory and environment from options)
std::shared_ptr<ProcessInvoker> create_process_invoker(const LocalOptions& options = {});

/**
 * One mechanism for executing a command on the local machine.
 *
 * run_command is synchronous; commands on one runner execute in the order
 * they are submitted.
 */
class CommandRunner
{
  public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run_command(const std::string& command) = 0;

    virtual RunnerKind kind() const = 0;
};

// Hands the command verbatim to the invoker
std::unique_ptr<CommandRunner> create_passthrough_runner(std::shared_ptr<ProcessInvoker> invoker);

// Applies the wrapper (if any), then hands the command to the invoker
std::unique_ptr<CommandRunner> create_shell_runner(std::shared_ptr<ProcessInvoker> invoker,
                                                   std::shared_ptr<CommandWrapper> wrapper = nullptr);

// One scripting host process per command, script passed encoded
std::unique_ptr<CommandRunner> create_scripted_runner(std::shared_ptr<ProcessInvoker> invoker,
                                                      const std::string& scripting_host = "powershell");

// Command line the scripted runner invokes for a script
std::string scripted_command_line(const std::string& scripting_host, const std::string& script);

// ============================================================================
// Session acquisition
// ============================================================================

/// Outcome of starting a persistent session: a runner, or the reason there is none
struct AcquireResult
{
    std::unique_ptr<CommandRunner> runner;
    std::optional<SessionAcquisitionError> error;

    bool ok() const
    {
        return runner != nullptr;
    }

    static AcquireResult success(std::unique_ptr<CommandRunner> r)
    {
        AcquireResult result;
        result.runner = std::move(r);
        return result;
    }

    static AcquireResult failure(SessionAcquisitionError e)
    {
        AcquireResult result;
        result.error = std::move(e);
        return result;
    }
};

using SessionAcquirer = std::function<AcquireResult(const LocalOptions& options)>;

/**
 * Launch a session server and connect to its pipe.
 *
 * Polls the endpoint options.session_connect_attempts times, sleeping
 * options.session_connect_interval in between. On failure the server is
 * killed and reaped and the result carries a SessionAcquisitionError.
 */
AcquireResult acquire_session_runner(const LocalOptions& options);

/// Built-in server: PowerShell hosting a named pipe read-execute-respond loop
ServerLaunch powershell_session_server(const std::string& scripting_host,
                                       const SessionEndpoint& endpoint);

// ============================================================================
// Selection
// ============================================================================

/**
 * Choose the runner for a connection once its OS is known.
 *
 * Windows: a session runner if one can be acquired, else a scripted runner.
 * Anything else: a shell runner; the acquirer is never called.
 */
std::unique_ptr<CommandRunner> select_runner(const OsInfo& os, const LocalOptions& options,
                                             std::shared_ptr<ProcessInvoker> invoker,
                                             const SessionAcquirer& acquire = acquire_session_runner);

} // namespace localexec

#endif // LOCALEXEC_RUNNER_HPP
