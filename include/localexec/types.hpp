#ifndef LOCALEXEC_TYPES_HPP
#define LOCALEXEC_TYPES_HPP

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace localexec
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

class CommandRunner;

// ============================================================================
// Command results
// ============================================================================

/// Outcome of one command, identical in shape for every runner
struct CommandResult
{
    std::string stdout_text;
    std::string stderr_text;
    int exit_status = 0;

    CommandResult() = default;
    CommandResult(std::string out, std::string err, int status)
        : stdout_text(std::move(out)), stderr_text(std::move(err)), exit_status(status)
    {
    }

    bool success() const
    {
        return exit_status == 0;
    }

    bool operator==(const CommandResult& other) const
    {
        return exit_status == other.exit_status && stdout_text == other.stdout_text &&
               stderr_text == other.stderr_text;
    }

    bool operator!=(const CommandResult& other) const
    {
        return !(*this == other);
    }
};

std::ostream& operator<<(std::ostream& os, const CommandResult& result);

/// Mechanism a runner uses to reach the operating system
enum class RunnerKind
{
    PassThrough,
    Shell,
    Scripted,
    Session
};

const char* to_string(RunnerKind kind);

// ============================================================================
// Collaborators
// ============================================================================

/// Transforms a command before execution (e.g. privilege escalation prefix)
class CommandWrapper
{
  public:
    virtual ~CommandWrapper() = default;
    virtual std::string run(const std::string& command) = 0;
};

/// OS identity as seen by the runner selector
class OsInfo
{
  public:
    virtual ~OsInfo() = default;
    virtual bool is_windows() const = 0;
    virtual std::string name() const = 0;
};

/// OS identity of the machine this library was compiled for
class HostOsInfo : public OsInfo
{
  public:
    bool is_windows() const override;
    std::string name() const override;
};

/// Determines OS identity. The given runner executes commands verbatim and may
/// be used to inspect the machine before the final runner is chosen.
using OsDetector = std::function<std::shared_ptr<OsInfo>(CommandRunner& runner)>;

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel
{
    Debug,
    Warning
};

/// Receives library diagnostics. Without one, warnings go to std::cerr.
using LogCallback = std::function<void(LogLevel level, const std::string& message)>;

// ============================================================================
// Session server launch
// ============================================================================

/// Pipe endpoint of one session
struct SessionEndpoint
{
    std::string name; // Session identifier, e.g. "localexec_3f9c..."
    std::string path; // Platform path a client connects to
};

/// How to start the server process for a session
struct ServerLaunch
{
    std::string executable;
    std::vector<std::string> args;
};

using SessionServerCommand = std::function<ServerLaunch(const SessionEndpoint& endpoint)>;

// ============================================================================
// Options
// ============================================================================

struct LocalOptions
{
    // Applied by the shell runner only
    std::shared_ptr<CommandWrapper> command_wrapper;

    // Scripting host for the scripted runner and the default session server
    std::string scripting_host = "powershell";

    // Try a persistent pipe session before the one-shot scripted runner
    bool enable_session = true;

    // Bounded wait for the session server to create its pipe
    int session_connect_attempts = 100;
    std::chrono::milliseconds session_connect_interval{100};

    // Unset: block until the server answers
    std::optional<std::chrono::milliseconds> session_response_timeout;

    // Replaces the built-in PowerShell pipe server
    std::optional<SessionServerCommand> session_server;

    // Child process settings for invoked commands
    std::optional<std::string> working_directory;
    std::map<std::string, std::string> environment;

    std::optional<LogCallback> log_callback;

    // Defaults to HostOsInfo
    std::optional<OsDetector> os_detector;
};

} // namespace localexec

#endif // LOCALEXEC_TYPES_HPP
