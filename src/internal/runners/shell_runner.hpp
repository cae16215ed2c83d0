#ifndef LOCALEXEC_INTERNAL_SHELL_RUNNER_HPP
#define LOCALEXEC_INTERNAL_SHELL_RUNNER_HPP

#include <localexec/runner.hpp>
#include <memory>

namespace localexec
{
namespace internal
{

// Runs commands verbatim; used while the OS is still unknown
class PassThroughRunner : public CommandRunner
{
  public:
    explicit PassThroughRunner(std::shared_ptr<ProcessInvoker> invoker);

    CommandResult run_command(const std::string& command) override;
    RunnerKind kind() const override
    {
        return RunnerKind::PassThrough;
    }

  private:
    std::shared_ptr<ProcessInvoker> invoker_;
};

// POSIX runner: optional command wrapper, then the invoker
class ShellRunner : public CommandRunner
{
  public:
    ShellRunner(std::shared_ptr<ProcessInvoker> invoker, std::shared_ptr<CommandWrapper> wrapper);

    CommandResult run_command(const std::string& command) override;
    RunnerKind kind() const override
    {
        return RunnerKind::Shell;
    }

  private:
    std::shared_ptr<ProcessInvoker> invoker_;
    std::shared_ptr<CommandWrapper> wrapper_;
};

} // namespace internal
} // namespace localexec

#endif // LOCALEXEC_INTERNAL_SHELL_RUNNER_HPP
