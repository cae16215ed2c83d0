#ifndef LOCALEXEC_INTERNAL_SESSION_RUNNER_HPP
#define LOCALEXEC_INTERNAL_SESSION_RUNNER_HPP

#include "../subprocess/named_pipe.hpp"
#include "../subprocess/process.hpp"

#include <chrono>
#include <localexec/runner.hpp>
#include <memory>
#include <mutex>
#include <optional>

namespace localexec
{
namespace internal
{

/**
 * Windows fast path: a persistent server process reached over one duplex pipe.
 *
 * Built by acquire_session_runner once the pipe is connected; owns the server
 * from then on. One request is in flight at a time. A desynchronized session
 * (unreadable response, closed pipe, timeout) is torn down and every later
 * command fails with ProtocolError.
 */
class SessionRunner : public CommandRunner
{
  public:
    SessionRunner(std::unique_ptr<subprocess::Process> server, subprocess::NamedPipeClient pipe,
                  SessionEndpoint endpoint,
                  std::optional<std::chrono::milliseconds> response_timeout,
                  std::optional<LogCallback> log_callback);
    ~SessionRunner() override;

    SessionRunner(const SessionRunner&) = delete;
    SessionRunner& operator=(const SessionRunner&) = delete;

    CommandResult run_command(const std::string& command) override;
    RunnerKind kind() const override
    {
        return RunnerKind::Session;
    }

    int server_pid() const;
    const SessionEndpoint& endpoint() const
    {
        return endpoint_;
    }
    bool is_broken() const;

  private:
    // Runs under mutex_; sets stopped when a failure tore the session down
    CommandResult exchange(const std::string& command, bool& stopped);

    // Caller holds mutex_. Returns true if a server was stopped.
    bool teardown();

    std::unique_ptr<subprocess::Process> server_;
    subprocess::NamedPipeClient pipe_;
    SessionEndpoint endpoint_;
    std::optional<std::chrono::milliseconds> response_timeout_;
    std::optional<LogCallback> log_callback_;
    int server_pid_;

    mutable std::mutex mutex_;
    bool broken_ = false;
};

// Stops a session server and reaps it; removes a stale POSIX socket file
void stop_session_server(subprocess::Process& server, const SessionEndpoint& endpoint);

// "localexec_" + 32 hex digits from a cryptographic RNG
std::string generate_session_name();

} // namespace internal
} // namespace localexec

#endif // LOCALEXEC_INTERNAL_SESSION_RUNNER_HPP
