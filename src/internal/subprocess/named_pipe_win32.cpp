#ifdef _WIN32

#include "named_pipe.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>
#include <windows.h>

namespace localexec
{
namespace subprocess
{

struct NamedPipeHandle
{
    HANDLE handle = INVALID_HANDLE_VALUE;

    ~NamedPipeHandle()
    {
        if (handle != INVALID_HANDLE_VALUE)
            CloseHandle(handle);
    }
};

static std::string pipe_error_message(DWORD error)
{
    LPSTR buffer = nullptr;
    size_t size = FormatMessageA(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr, error, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT), (LPSTR)&buffer, 0, nullptr);
    std::string message(buffer, size);
    LocalFree(buffer);
    return message;
}

std::string named_pipe_path(const std::string& name)
{
    return "\\\\.\\pipe\\" + name;
}

bool NamedPipeClient::try_connect(const std::string& path)
{
    close();

    HANDLE h = CreateFileA(path.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr, OPEN_EXISTING,
                           0, nullptr);
    if (h == INVALID_HANDLE_VALUE)
        return false; // ERROR_FILE_NOT_FOUND / ERROR_PIPE_BUSY until the server is ready

    handle_->handle = h;
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
        DWORD written = 0;
        if (!WriteFile(handle_->handle, data.data() + offset,
                       static_cast<DWORD>(data.size() - offset), &written, nullptr))
            throw std::runtime_error("Write failed: " + pipe_error_message(GetLastError()));
        offset += written;
    }
    FlushFileBuffers(handle_->handle);
}

bool NamedPipeClient::wait_readable(std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
        DWORD available = 0;
        if (!PeekNamedPipe(handle_->handle, nullptr, 0, nullptr, &available, nullptr))
        {
            DWORD error = GetLastError();
            if (error == ERROR_BROKEN_PIPE)
                return true; // let read_some report the close
            throw std::runtime_error("PeekNamedPipe failed: " + pipe_error_message(error));
        }
        if (available > 0)
            return true;
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

size_t NamedPipeClient::read_some(char* buffer, size_t size)
{
    DWORD bytes_read = 0;
    if (!ReadFile(handle_->handle, buffer, static_cast<DWORD>(size), &bytes_read, nullptr))
    {
        DWORD error = GetLastError();
        if (error == ERROR_BROKEN_PIPE || error == ERROR_PIPE_NOT_CONNECTED)
            return 0;
        if (error != ERROR_MORE_DATA)
            throw std::runtime_error("Read failed: " + pipe_error_message(error));
    }
    return bytes_read;
}

void NamedPipeClient::close()
{
    if (handle_ && handle_->handle != INVALID_HANDLE_VALUE)
    {
        CloseHandle(handle_->handle);
        handle_->handle = INVALID_HANDLE_VALUE;
    }
}

bool NamedPipeClient::is_open() const
{
    return handle_ && handle_->handle != INVALID_HANDLE_VALUE;
}

} // namespace subprocess
} // namespace localexec

#endif // _WIN32
