// Platform-agnostic named pipe client
// Uses conditional compilation to select platform-specific implementation

#ifdef _WIN32
    #include "named_pipe_win32.cpp"
#else
    #include "named_pipe_posix.cpp"
#endif

namespace localexec
{
namespace subprocess
{

NamedPipeClient::NamedPipeClient() : handle_(std::make_unique<NamedPipeHandle>()) {}

NamedPipeClient::~NamedPipeClient()
{
    close();
}

NamedPipeClient::NamedPipeClient(NamedPipeClient&&) noexcept = default;
NamedPipeClient& NamedPipeClient::operator=(NamedPipeClient&&) noexcept = default;

std::optional<std::string> NamedPipeClient::extract_line()
{
    size_t pos = buffer_.find('\n');
    if (pos == std::string::npos)
        return std::nullopt;

    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

std::optional<std::string> NamedPipeClient::read_line(std::optional<std::chrono::milliseconds> timeout)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    auto deadline = std::chrono::steady_clock::now() + timeout.value_or(std::chrono::milliseconds(0));

    for (;;)
    {
        if (auto line = extract_line())
            return line;

        if (timeout)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0 || !wait_readable(remaining))
                return std::nullopt;
        }

        char chunk[4096];
        size_t n = read_some(chunk, sizeof(chunk));
        if (n == 0)
            throw std::runtime_error("Pipe closed by peer");
        buffer_.append(chunk, n);
    }
}

} // namespace subprocess
} // namespace localexec
