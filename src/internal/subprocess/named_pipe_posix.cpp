// POSIX named pipe client: Unix-domain stream socket

#include "named_pipe.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace localexec
{
namespace subprocess
{

struct NamedPipeHandle
{
    int fd = -1;

    ~NamedPipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

static std::string pipe_errno_message()
{
    return std::strerror(errno);
}

std::string named_pipe_path(const std::string& name)
{
    return (std::filesystem::temp_directory_path() / (name + ".sock")).string();
}

bool NamedPipeClient::try_connect(const std::string& path)
{
    close();

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path))
        throw std::runtime_error("Socket path too long: " + path);
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0)
        throw std::runtime_error("socket failed: " + pipe_errno_message());

#ifdef SO_NOSIGPIPE
    int one = 1;
    setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0)
    {
        ::close(fd);
        return false; // ENOENT/ECONNREFUSED until the server listens
    }

    handle_->fd = fd;
    buffer_.clear();
    return true;
}

void NamedPipeClient::write_line(const std::string& line)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    std::string data = line + "\n";
    size_t offset = 0;
    while (offset < data.size())
    {
#ifdef MSG_NOSIGNAL
        ssize_t n = ::send(handle_->fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
#else
        ssize_t n = ::send(handle_->fd, data.data() + offset, data.size() - offset, 0);
#endif
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw std::runtime_error("Broken pipe (server closed the session)");
            throw std::runtime_error("Write failed: " + pipe_errno_message());
        }
        offset += static_cast<size_t>(n);
    }
}

bool NamedPipeClient::wait_readable(std::chrono::milliseconds timeout)
{
    pollfd pfd{};
    pfd.fd = handle_->fd;
    pfd.events = POLLIN;

    int result;
    do
        result = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    while (result < 0 && errno == EINTR);

    if (result < 0)
        throw std::runtime_error("poll failed: " + pipe_errno_message());
    return result > 0;
}

size_t NamedPipeClient::read_some(char* buffer, size_t size)
{
    ssize_t n;
    do
        n = ::recv(handle_->fd, buffer, size, 0);
    while (n < 0 && errno == EINTR);

    if (n < 0)
        throw std::runtime_error("Read failed: " + pipe_errno_message());
    return static_cast<size_t>(n);
}

void NamedPipeClient::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool NamedPipeClient::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

} // namespace subprocess
} // namespace localexec
