#include "session_runner.hpp"

#include "../log.hpp"

#include <algorithm>
#include <filesystem>
#include <localexec/protocol/session.hpp>
#include <openssl/rand.h>
#include <thread>

namespace localexec
{
namespace internal
{

std::string generate_session_name()
{
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1)
        throw LocalExecError("Failed to generate session identifier");

    static const char hex[] = "0123456789abcdef";
    std::string name = "localexec_";
    for (unsigned char b : bytes)
    {
        name += hex[b >> 4];
        name += hex[b & 0x0f];
    }
    return name;
}

void stop_session_server(subprocess::Process& server, const SessionEndpoint& endpoint)
{
    server.kill();
    server.wait();

#ifndef _WIN32
    // A server killed mid-session leaves its socket file behind
    std::error_code ec;
    std::filesystem::remove(endpoint.path, ec);
#else
    (void)endpoint;
#endif
}

SessionRunner::SessionRunner(std::unique_ptr<subprocess::Process> server,
                             subprocess::NamedPipeClient pipe, SessionEndpoint endpoint,
                             std::optional<std::chrono::milliseconds> response_timeout,
                             std::optional<LogCallback> log_callback)
    : server_(std::move(server)), pipe_(std::move(pipe)), endpoint_(std::move(endpoint)),
      response_timeout_(response_timeout), log_callback_(std::move(log_callback)),
      server_pid_(server_ ? server_->pid() : 0)
{
}

SessionRunner::~SessionRunner()
{
    bool stopped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped = teardown();
    }
    if (stopped)
        log_message(log_callback_, LogLevel::Debug,
                    "Stopped session server pid " + std::to_string(server_pid_));
}

int SessionRunner::server_pid() const
{
    return server_pid_;
}

bool SessionRunner::is_broken() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return broken_;
}

// Log callbacks run outside mutex_ so they may call back into the runner
CommandResult SessionRunner::run_command(const std::string& command)
{
    bool stopped = false;
    try
    {
        return exchange(command, stopped);
    }
    catch (const ProtocolError& e)
    {
        if (stopped)
        {
            log_message(log_callback_, LogLevel::Warning,
                        "Session " + endpoint_.name + " closed: " + e.what());
            log_message(log_callback_, LogLevel::Debug,
                        "Stopped session server pid " + std::to_string(server_pid_));
        }
        throw;
    }
}

CommandResult SessionRunner::exchange(const std::string& command, bool& stopped)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (broken_)
        throw ProtocolError("Session " + endpoint_.name + " is no longer usable");

    std::string request = protocol::encode_request(command);

    try
    {
        pipe_.write_line(request);
    }
    catch (const std::runtime_error& e)
    {
        broken_ = true;
        stopped = teardown();
        throw ProtocolError(std::string("Failed to send request: ") + e.what());
    }

    std::optional<std::string> line;
    try
    {
        line = pipe_.read_line(response_timeout_);
    }
    catch (const std::runtime_error& e)
    {
        broken_ = true;
        stopped = teardown();
        throw ProtocolError(std::string("Failed to read response: ") + e.what());
    }

    if (!line)
    {
        broken_ = true;
        stopped = teardown();
        throw SessionTimeoutError("No response within " +
                                  std::to_string(response_timeout_ ? response_timeout_->count() : 0) +
                                  "ms");
    }

    try
    {
        return protocol::decode_response(*line);
    }
    catch (const ProtocolError&)
    {
        broken_ = true;
        stopped = teardown();
        throw;
    }
}

bool SessionRunner::teardown()
{
    pipe_.close();
    if (!server_)
        return false;
    stop_session_server(*server_, endpoint_);
    server_.reset();
    return true;
}

} // namespace internal

AcquireResult acquire_session_runner(const LocalOptions& options)
{
    SessionEndpoint endpoint;
    try
    {
        endpoint.name = internal::generate_session_name();
    }
    catch (const LocalExecError& e)
    {
        return AcquireResult::failure(SessionAcquisitionError(e.what(), 0, 0));
    }
    endpoint.path = subprocess::named_pipe_path(endpoint.name);

    ServerLaunch launch = options.session_server
                              ? (*options.session_server)(endpoint)
                              : powershell_session_server(options.scripting_host, endpoint);

    subprocess::ProcessOptions proc_opts;
    proc_opts.redirect_stdin = false;
    proc_opts.redirect_stdout = false;
    proc_opts.redirect_stderr = false;
    proc_opts.detached = true;
    proc_opts.kill_on_parent_exit = true;
    if (options.working_directory)
        proc_opts.working_directory = *options.working_directory;
    proc_opts.environment = options.environment;

    auto server = std::make_unique<subprocess::Process>();
    try
    {
        server->spawn(launch.executable, launch.args, proc_opts);
    }
    catch (const SpawnError& e)
    {
        return AcquireResult::failure(SessionAcquisitionError(
            "Failed to start session server '" + launch.executable + "': " + e.what(), 0, 0));
    }

    const int pid = server->pid();
    internal::log_message(options.log_callback, LogLevel::Debug,
                          "Started session server pid " + std::to_string(pid) + " for " +
                              endpoint.path);

    const int max_attempts = std::max(1, options.session_connect_attempts);
    subprocess::NamedPipeClient pipe;
    int attempts = 0;
    bool connected = false;
    std::string reason = "pipe never became connectable";

    while (attempts < max_attempts)
    {
        ++attempts;
        if (pipe.try_connect(endpoint.path))
        {
            connected = true;
            break;
        }

        std::optional<int> status;
        try
        {
            status = server->try_wait();
        }
        catch (const std::runtime_error& e)
        {
            reason = e.what();
            break;
        }
        if (status)
        {
            reason = "server exited with status " + std::to_string(*status);
            break;
        }

        if (attempts < max_attempts)
            std::this_thread::sleep_for(options.session_connect_interval);
    }

    if (!connected)
    {
        internal::stop_session_server(*server, endpoint);
        return AcquireResult::failure(SessionAcquisitionError(
            "Could not connect to session " + endpoint.name + " after " +
                std::to_string(attempts) + " attempt(s): " + reason,
            attempts, pid));
    }

    internal::log_message(options.log_callback, LogLevel::Debug,
                          "Connected to session " + endpoint.name + " after " +
                              std::to_string(attempts) + " attempt(s)");

    return AcquireResult::success(std::make_unique<internal::SessionRunner>(
        std::move(server), std::move(pipe), std::move(endpoint), options.session_response_timeout,
        options.log_callback));
}

} // namespace localexec
