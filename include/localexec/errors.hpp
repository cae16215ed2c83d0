#ifndef LOCALEXEC_ERRORS_HPP
#define LOCALEXEC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace localexec
{

// Base exception
class LocalExecError : public std::runtime_error
{
  public:
    explicit LocalExecError(const std::string& message) : std::runtime_error(message) {}
};

// Executable or interpreter could not be started
class SpawnError : public LocalExecError
{
  public:
    SpawnError(const std::string& message, int error_code)
        : LocalExecError(message), error_code_(error_code)
    {
    }

    // errno on POSIX, GetLastError() on Windows
    int error_code() const
    {
        return error_code_;
    }

  private:
    int error_code_;
};

// Persistent pipe session could not be established.
// Carried by AcquireResult rather than thrown across the selector.
class SessionAcquisitionError : public LocalExecError
{
  public:
    SessionAcquisitionError(const std::string& message, int attempts, int server_pid)
        : LocalExecError(message), attempts_(attempts), server_pid_(server_pid)
    {
    }

    // Number of connect attempts made before giving up
    int attempts() const
    {
        return attempts_;
    }

    // Pid of the server that was launched (and reaped), 0 if none was started
    int server_pid() const
    {
        return server_pid_;
    }

  private:
    int attempts_;
    int server_pid_;
};

// Text that cannot be re-encoded or decoded
class EncodingError : public LocalExecError
{
  public:
    explicit EncodingError(const std::string& message) : LocalExecError(message) {}
};

// Session response that does not match the wire protocol
class ProtocolError : public LocalExecError
{
  public:
    explicit ProtocolError(const std::string& message) : LocalExecError(message) {}
};

// No session response within the configured timeout
class SessionTimeoutError : public ProtocolError
{
  public:
    explicit SessionTimeoutError(const std::string& message) : ProtocolError(message) {}
};

// Command issued on a connection that has been closed
class ConnectionClosedError : public LocalExecError
{
  public:
    explicit ConnectionClosedError(const std::string& message) : LocalExecError(message) {}
};

} // namespace localexec

#endif // LOCALEXEC_ERRORS_HPP
