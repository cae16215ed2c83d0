#include "shell_runner.hpp"

#include <stdexcept>

namespace localexec
{
namespace internal
{

PassThroughRunner::PassThroughRunner(std::shared_ptr<ProcessInvoker> invoker)
    : invoker_(std::move(invoker))
{
    if (!invoker_)
        throw std::invalid_argument("PassThroughRunner requires a process invoker");
}

CommandResult PassThroughRunner::run_command(const std::string& command)
{
    return invoker_->invoke(command);
}

ShellRunner::ShellRunner(std::shared_ptr<ProcessInvoker> invoker,
                         std::shared_ptr<CommandWrapper> wrapper)
    : invoker_(std::move(invoker)), wrapper_(std::move(wrapper))
{
    if (!invoker_)
        throw std::invalid_argument("ShellRunner requires a process invoker");
}

CommandResult ShellRunner::run_command(const std::string& command)
{
    if (wrapper_)
        return invoker_->invoke(wrapper_->run(command));
    return invoker_->invoke(command);
}

} // namespace internal

std::unique_ptr<CommandRunner> create_passthrough_runner(std::shared_ptr<ProcessInvoker> invoker)
{
    return std::make_unique<internal::PassThroughRunner>(std::move(invoker));
}

std::unique_ptr<CommandRunner> create_shell_runner(std::shared_ptr<ProcessInvoker> invoker,
                                                   std::shared_ptr<CommandWrapper> wrapper)
{
    return std::make_unique<internal::ShellRunner>(std::move(invoker), std::move(wrapper));
}

} // namespace localexec
