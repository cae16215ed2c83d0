#include <localexec/types.hpp>

namespace localexec
{

std::ostream& operator<<(std::ostream& os, const CommandResult& result)
{
    os << "CommandResult{exit_status=" << result.exit_status << ", stdout=" << json(result.stdout_text)
       << ", stderr=" << json(result.stderr_text) << "}";
    return os;
}

const char* to_string(RunnerKind kind)
{
    switch (kind)
    {
    case RunnerKind::PassThrough:
        return "passthrough";
    case RunnerKind::Shell:
        return "shell";
    case RunnerKind::Scripted:
        return "scripted";
    case RunnerKind::Session:
        return "session";
    }
    return "unknown";
}

bool HostOsInfo::is_windows() const
{
#ifdef _WIN32
    return true;
#else
    return false;
#endif
}

std::string HostOsInfo::name() const
{
#if defined(_WIN32)
    return "windows";
#elif defined(__APPLE__)
    return "darwin";
#elif defined(__linux__)
    return "linux";
#else
    return "unix";
#endif
}

} // namespace localexec
