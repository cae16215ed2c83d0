#ifndef LOCALEXEC_CONNECTION_HPP
#define LOCALEXEC_CONNECTION_HPP

#include <localexec/runner.hpp>
#include <localexec/types.hpp>
#include <memory>
#include <optional>
#include <string>

namespace localexec
{

// Runs commands on the machine this process is running on
class LocalConnection
{
  public:
    explicit LocalConnection(const LocalOptions& options = LocalOptions{});
    // Test-only/advanced: inject the invoker and session acquirer.
    LocalConnection(const LocalOptions& options, std::shared_ptr<ProcessInvoker> invoker,
                    SessionAcquirer acquirer);
    ~LocalConnection();

    // No copy, move only
    LocalConnection(const LocalConnection&) = delete;
    LocalConnection& operator=(const LocalConnection&) = delete;
    LocalConnection(LocalConnection&&) noexcept;
    LocalConnection& operator=(LocalConnection&&) noexcept;

    // Throws ConnectionClosedError after close()
    CommandResult run_command(const std::string& command);

    // Releases the runner (and any session server). Safe to call twice.
    void close();
    bool is_closed() const;

    RunnerKind runner_kind() const;

    bool is_local() const
    {
        return true;
    }

    // No interactive login exists for the local machine
    std::optional<std::string> login_command() const
    {
        return std::nullopt;
    }

    std::string uri() const
    {
        return "local://";
    }

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace localexec

#endif // LOCALEXEC_CONNECTION_HPP
