#ifndef LOCALEXEC_SUBPROCESS_NAMED_PIPE_HPP
#define LOCALEXEC_SUBPROCESS_NAMED_PIPE_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace localexec
{
namespace subprocess
{

struct NamedPipeHandle;

/**
 * Client end of a duplex, line-oriented pipe owned by another process.
 *
 * Windows: named pipe `\\.\pipe\<name>`.
 * POSIX: Unix-domain stream socket `<temp dir>/<name>.sock`.
 */
class NamedPipeClient
{
  public:
    NamedPipeClient();
    ~NamedPipeClient();

    // No copy, move only
    NamedPipeClient(const NamedPipeClient&) = delete;
    NamedPipeClient& operator=(const NamedPipeClient&) = delete;
    NamedPipeClient(NamedPipeClient&&) noexcept;
    NamedPipeClient& operator=(NamedPipeClient&&) noexcept;

    // One connection attempt. Returns false if the endpoint is not connectable yet.
    bool try_connect(const std::string& path);

    // Write data + '\n' in full. Throws std::runtime_error on failure.
    void write_line(const std::string& line);

    // Read one line without its terminator ('\r' before '\n' is dropped too).
    // Returns std::nullopt when the timeout expires first; no timeout blocks.
    // Throws std::runtime_error on I/O error or when the peer closes the pipe.
    std::optional<std::string> read_line(std::optional<std::chrono::milliseconds> timeout = {});

    void close();
    bool is_open() const;

  private:
    // Wait until the endpoint is readable; false on timeout
    bool wait_readable(std::chrono::milliseconds timeout);
    // Raw read; 0 means peer closed
    size_t read_some(char* buffer, size_t size);
    std::optional<std::string> extract_line();

    std::unique_ptr<NamedPipeHandle> handle_;
    std::string buffer_;
};

// Platform path of the endpoint for a session name
std::string named_pipe_path(const std::string& name);

} // namespace subprocess
} // namespace localexec

#endif // LOCALEXEC_SUBPROCESS_NAMED_PIPE_HPP
