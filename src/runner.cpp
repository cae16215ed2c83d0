#include "internal/log.hpp"

#include <cstdlib>
#include <localexec/runner.hpp>

namespace localexec
{

namespace
{

bool session_disabled_by_environment()
{
    const char* value = std::getenv("LOCALEXEC_DISABLE_SESSION");
    return value != nullptr && value[0] != '\0';
}

} // namespace

std::unique_ptr<CommandRunner> select_runner(const OsInfo& os, const LocalOptions& options,
                                             std::shared_ptr<ProcessInvoker> invoker,
                                             const SessionAcquirer& acquire)
{
    if (!os.is_windows())
        return create_shell_runner(std::move(invoker), options.command_wrapper);

    if (options.enable_session && !session_disabled_by_environment())
    {
        AcquireResult result = acquire(options);
        if (result.ok())
            return std::move(result.runner);

        std::string reason = result.error ? result.error->what() : "unknown error";
        internal::log_message(options.log_callback, LogLevel::Warning,
                              "Could not start a persistent session, running each command in "
                              "its own " +
                                  options.scripting_host + " process: " + reason);
    }

    return create_scripted_runner(std::move(invoker), options.scripting_host);
}

} // namespace localexec
