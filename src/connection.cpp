#include <localexec/connection.hpp>
#include <localexec/errors.hpp>
#include <mutex>

namespace localexec
{

class LocalConnection::Impl
{
  public:
    Impl(const LocalOptions& options, std::shared_ptr<ProcessInvoker> invoker,
         const SessionAcquirer& acquire)
    {
        // OS identity is detected with a runner that applies no wrapper
        auto detect_runner = create_passthrough_runner(invoker);

        std::shared_ptr<OsInfo> os;
        if (options.os_detector)
            os = (*options.os_detector)(*detect_runner);
        if (!os)
            os = std::make_shared<HostOsInfo>();

        runner_ = select_runner(*os, options, std::move(invoker), acquire);
        kind_ = runner_->kind();
    }

    CommandResult run_command(const std::string& command)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!runner_)
            throw ConnectionClosedError("Connection to local:// is closed");
        return runner_->run_command(command);
    }

    void close()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        runner_.reset();
    }

    bool is_closed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return runner_ == nullptr;
    }

    RunnerKind kind() const
    {
        return kind_;
    }

  private:
    mutable std::mutex mutex_;
    std::unique_ptr<CommandRunner> runner_;
    RunnerKind kind_ = RunnerKind::PassThrough;
};

LocalConnection::LocalConnection(const LocalOptions& options)
    : impl_(std::make_unique<Impl>(options, create_process_invoker(options), acquire_session_runner))
{
}

LocalConnection::LocalConnection(const LocalOptions& options,
                                 std::shared_ptr<ProcessInvoker> invoker, SessionAcquirer acquirer)
    : impl_(std::make_unique<Impl>(options, std::move(invoker), acquirer))
{
}

LocalConnection::~LocalConnection() = default;
LocalConnection::LocalConnection(LocalConnection&&) noexcept = default;
LocalConnection& LocalConnection::operator=(LocalConnection&&) noexcept = default;

CommandResult LocalConnection::run_command(const std::string& command)
{
    if (!impl_)
        throw ConnectionClosedError("Connection to local:// is closed");
    return impl_->run_command(command);
}

void LocalConnection::close()
{
    if (impl_)
        impl_->close();
}

bool LocalConnection::is_closed() const
{
    return !impl_ || impl_->is_closed();
}

RunnerKind LocalConnection::runner_kind() const
{
    return impl_ ? impl_->kind() : RunnerKind::PassThrough;
}

} // namespace localexec
