#include "scripted_runner.hpp"

#include <localexec/encoding.hpp>
#include <stdexcept>

namespace localexec
{
namespace internal
{

ScriptedRunner::ScriptedRunner(std::shared_ptr<ProcessInvoker> invoker, std::string scripting_host)
    : invoker_(std::move(invoker)), scripting_host_(std::move(scripting_host))
{
    if (!invoker_)
        throw std::invalid_argument("ScriptedRunner requires a process invoker");
    if (scripting_host_.empty())
        throw std::invalid_argument("ScriptedRunner requires a scripting host");
}

CommandResult ScriptedRunner::run_command(const std::string& script)
{
    return invoker_->invoke(scripted_command_line(scripting_host_, script));
}

} // namespace internal

std::string scripted_command_line(const std::string& scripting_host, const std::string& script)
{
    std::string host = scripting_host;
    if (host.find(' ') != std::string::npos)
        host = "\"" + host + "\"";
    return host + " -NoProfile -NonInteractive -EncodedCommand " + encoding::encode_script(script);
}

std::unique_ptr<CommandRunner> create_scripted_runner(std::shared_ptr<ProcessInvoker> invoker,
                                                      const std::string& scripting_host)
{
    return std::make_unique<internal::ScriptedRunner>(std::move(invoker), scripting_host);
}

} // namespace localexec
