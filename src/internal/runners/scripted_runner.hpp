#ifndef LOCALEXEC_INTERNAL_SCRIPTED_RUNNER_HPP
#define LOCALEXEC_INTERNAL_SCRIPTED_RUNNER_HPP

#include <localexec/runner.hpp>
#include <memory>
#include <string>

namespace localexec
{
namespace internal
{

/**
 * Windows fallback runner.
 *
 * Each command starts a fresh scripting host with the script passed as an
 * -EncodedCommand argument; the host's own stdout, stderr and exit code are
 * the result.
 */
class ScriptedRunner : public CommandRunner
{
  public:
    ScriptedRunner(std::shared_ptr<ProcessInvoker> invoker, std::string scripting_host);

    CommandResult run_command(const std::string& script) override;
    RunnerKind kind() const override
    {
        return RunnerKind::Scripted;
    }

  private:
    std::shared_ptr<ProcessInvoker> invoker_;
    std::string scripting_host_;
};

} // namespace internal
} // namespace localexec

#endif // LOCALEXEC_INTERNAL_SCRIPTED_RUNNER_HPP
