#include "../subprocess/process.hpp"

#include <exception>
#include <localexec/errors.hpp>
#include <localexec/runner.hpp>
#include <thread>

namespace localexec
{
namespace internal
{

namespace
{

class SubprocessInvoker : public ProcessInvoker
{
  public:
    explicit SubprocessInvoker(subprocess::ProcessOptions options) : options_(std::move(options)) {}

    CommandResult invoke(const std::string& command_line) override
    {
        subprocess::Process proc;
        try
        {
            proc.spawn_command_line(command_line, options_);
        }
        catch (const SpawnError&)
        {
            return CommandResult("", "", 1);
        }

        // Child sees EOF on stdin
        proc.stdin_pipe().close();

        // Drain stderr concurrently so a full pipe on either stream cannot stall the child
        std::string err;
        std::exception_ptr stderr_failure;
        std::thread stderr_reader(
            [&]
            {
                try
                {
                    err = proc.stderr_pipe().read_all();
                }
                catch (...)
                {
                    stderr_failure = std::current_exception();
                }
            });

        std::string out;
        try
        {
            out = proc.stdout_pipe().read_all();
        }
        catch (...)
        {
            proc.kill();
            stderr_reader.join();
            throw;
        }
        stderr_reader.join();

        if (stderr_failure)
        {
            proc.kill();
            std::rethrow_exception(stderr_failure);
        }

        int status = proc.wait();
        return CommandResult(std::move(out), std::move(err), status);
    }

  private:
    subprocess::ProcessOptions options_;
};

} // namespace

} // namespace internal

std::shared_ptr<ProcessInvoker> create_process_invoker(const LocalOptions& options)
{
    subprocess::ProcessOptions proc_opts;
    proc_opts.redirect_stdin = true;
    proc_opts.redirect_stdout = true;
    proc_opts.redirect_stderr = true;
    if (options.working_directory)
        proc_opts.working_directory = *options.working_directory;
    proc_opts.environment = options.environment;

    return std::make_shared<internal::SubprocessInvoker>(std::move(proc_opts));
}

} // namespace localexec
