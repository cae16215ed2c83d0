// POSIX implementation of subprocess process management
// For Linux and macOS

#include "process.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <filesystem>
#include <localexec/errors.hpp>
#include <signal.h>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

#ifdef __linux__
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <sys/prctl.h>
#include <thread>
#endif

namespace localexec
{
namespace subprocess
{

// ============================================================================
// ProcessHandle - POSIX implementation
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// ============================================================================
// PipeHandle - POSIX implementation
// ============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

// ============================================================================
// Helper functions
// ============================================================================

static std::string get_errno_message()
{
    return std::strerror(errno);
}

static void close_pair(int (&fds)[2])
{
    if (fds[0] >= 0)
        ::close(fds[0]);
    if (fds[1] >= 0)
        ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

static void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags == -1 || fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1)
        throw std::runtime_error("fcntl FD_CLOEXEC failed: " + get_errno_message());
}

// Child side: report errno through the status pipe and exit
[[noreturn]] static void child_fail(int status_fd)
{
    int err = errno;
    ssize_t ignored = ::write(status_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

static int decode_wait_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

#ifdef __linux__

namespace
{

// Runs jobs on a thread that lives as long as the process
class ForkThread
{
  public:
    static ForkThread& instance()
    {
        // Leaked so the worker is never joined during static destruction
        static ForkThread* worker = new ForkThread();
        return *worker;
    }

    // Blocks until the job ran; rethrows whatever it threw
    void run(const std::function<void()>& job)
    {
        std::packaged_task<void()> task(job);
        std::future<void> done = task.get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            jobs_.push_back(std::move(task));
        }
        cv_.notify_one();
        done.get();
    }

  private:
    ForkThread()
    {
        std::thread([this] { loop(); }).detach();
    }

    void loop()
    {
        for (;;)
        {
            std::packaged_task<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !jobs_.empty(); });
                task = std::move(jobs_.front());
                jobs_.pop_front();
            }
            task();
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::packaged_task<void()>> jobs_;
};

} // namespace

#endif

// ============================================================================
// ReadPipe implementation
// ============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    ssize_t bytes_read;
    do
        bytes_read = ::read(handle_->fd, buffer, size);
    while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0; // No data available (non-blocking)
        throw std::runtime_error("Read failed: " + get_errno_message());
    }

    return static_cast<size_t>(bytes_read);
}

std::string ReadPipe::read_all()
{
    std::string data;
    char buffer[4096];
    while (size_t n = read(buffer, sizeof(buffer)))
        data.append(buffer, n);
    return data;
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// WritePipe implementation
// ============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    ssize_t bytes_written = ::write(handle_->fd, data, size);
    if (bytes_written < 0)
    {
        if (errno == EPIPE)
            throw std::runtime_error("Broken pipe (process closed stdin)");
        throw std::runtime_error("Write failed: " + get_errno_message());
    }

    return static_cast<size_t>(bytes_written);
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// Process implementation
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (is_running())
    {
        terminate();
        wait();
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
#ifdef __linux__
    // PR_SET_PDEATHSIG follows the forking thread, not the process
    if (options.kill_on_parent_exit)
    {
        ForkThread::instance().run([&] { spawn_forked(executable, args, options); });
        return;
    }
#endif
    spawn_forked(executable, args, options);
}

void Process::spawn_forked(const std::string& executable, const std::vector<std::string>& args,
                           const ProcessOptions& options)
{
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    // Child writes errno here if exec fails; closed by a successful exec
    int status_pipe[2] = {-1, -1};

    auto close_all = [&]
    {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
    };

    if (options.redirect_stdin && pipe(stdin_pipe) != 0)
    {
        close_all();
        throw std::runtime_error("Failed to create stdin pipe: " + get_errno_message());
    }
    if (options.redirect_stdout && pipe(stdout_pipe) != 0)
    {
        close_all();
        throw std::runtime_error("Failed to create stdout pipe: " + get_errno_message());
    }
    if (options.redirect_stderr && pipe(stderr_pipe) != 0)
    {
        close_all();
        throw std::runtime_error("Failed to create stderr pipe: " + get_errno_message());
    }
    if (pipe(status_pipe) != 0)
    {
        close_all();
        throw std::runtime_error("Failed to create status pipe: " + get_errno_message());
    }

    try
    {
        set_cloexec(status_pipe[0]);
        set_cloexec(status_pipe[1]);
    }
    catch (...)
    {
        close_all();
        throw;
    }

    // Build argv before forking
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

#ifdef __linux__
    pid_t parent_pid = getpid();
#endif

    pid_t pid = fork();
    if (pid < 0)
    {
        close_all();
        throw std::runtime_error("Failed to fork process: " + get_errno_message());
    }

    if (pid == 0)
    {
        // Child process
        ::close(status_pipe[0]);
        int status_fd = status_pipe[1];

        if (options.detached && setsid() < 0)
            child_fail(status_fd);

#ifdef __linux__
        if (options.kill_on_parent_exit)
        {
            if (prctl(PR_SET_PDEATHSIG, SIGKILL) != 0)
                child_fail(status_fd);
            // Parent may have died before prctl took effect
            if (getppid() != parent_pid)
                _exit(127);
        }
#endif

        int null_fd = -1;
        if (options.detached)
        {
            null_fd = open("/dev/null", O_RDWR);
            if (null_fd < 0)
                child_fail(status_fd);
        }

        if (options.redirect_stdin)
        {
            ::close(stdin_pipe[1]);
            if (dup2(stdin_pipe[0], STDIN_FILENO) < 0)
                child_fail(status_fd);
            ::close(stdin_pipe[0]);
        }
        else if (null_fd >= 0 && dup2(null_fd, STDIN_FILENO) < 0)
        {
            child_fail(status_fd);
        }

        if (options.redirect_stdout)
        {
            ::close(stdout_pipe[0]);
            if (dup2(stdout_pipe[1], STDOUT_FILENO) < 0)
                child_fail(status_fd);
            ::close(stdout_pipe[1]);
        }
        else if (null_fd >= 0 && dup2(null_fd, STDOUT_FILENO) < 0)
        {
            child_fail(status_fd);
        }

        if (options.redirect_stderr)
        {
            ::close(stderr_pipe[0]);
            if (dup2(stderr_pipe[1], STDERR_FILENO) < 0)
                child_fail(status_fd);
            ::close(stderr_pipe[1]);
        }
        else if (null_fd >= 0 && dup2(null_fd, STDERR_FILENO) < 0)
        {
            child_fail(status_fd);
        }

        if (null_fd > STDERR_FILENO)
            ::close(null_fd);

        if (!options.working_directory.empty())
        {
            if (chdir(options.working_directory.c_str()) != 0)
                child_fail(status_fd);
        }

        for (const auto& [key, value] : options.environment)
            setenv(key.c_str(), value.c_str(), 1);

        execvp(executable.c_str(), argv.data());
        child_fail(status_fd);
    }

    // Parent process
    ::close(status_pipe[1]);
    status_pipe[1] = -1;

    int child_errno = 0;
    ssize_t status_bytes;
    do
        status_bytes = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    while (status_bytes < 0 && errno == EINTR);
    close_pair(status_pipe);

    if (status_bytes > 0)
    {
        // exec (or setup before it) failed; reap the child
        close_all();
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        throw SpawnError("Failed to start '" + executable + "': " + std::strerror(child_errno),
                         child_errno);
    }

    if (options.redirect_stdin)
    {
        ::close(stdin_pipe[0]);
        stdin_ = std::make_unique<WritePipe>();
        stdin_->handle_->fd = stdin_pipe[1];
    }

    if (options.redirect_stdout)
    {
        ::close(stdout_pipe[1]);
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->fd = stdout_pipe[0];
    }

    if (options.redirect_stderr)
    {
        ::close(stderr_pipe[1]);
        stderr_ = std::make_unique<ReadPipe>();
        stderr_->handle_->fd = stderr_pipe[0];
    }

    handle_->pid = pid;
    handle_->running = true;
}

void Process::spawn_command_line(const std::string& command_line, const ProcessOptions& options)
{
    if (needs_shell(command_line))
    {
        spawn("/bin/sh", {"-c", command_line}, options);
        return;
    }

    auto words = split_command_line(command_line);
    if (words.empty())
        throw SpawnError("Empty command line", ENOENT);

    std::string executable = words.front();
    words.erase(words.begin());
    spawn(executable, words, options);
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_)
        throw std::runtime_error("stdin not redirected");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_)
        throw std::runtime_error("stdout not redirected");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_)
        throw std::runtime_error("stderr not redirected");
    return *stderr_;
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0)
        return false;

    if (!handle_->running)
        return false;

    // Reap if it already exited so zombies do not count as running
    int status;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);
    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return false;
    }

    return true;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    else if (result == 0)
    {
        return std::nullopt;
    }
    else
    {
        throw std::runtime_error("waitpid failed: " + get_errno_message());
    }
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
        result = waitpid(handle_->pid, &status, 0);
    while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// ============================================================================
// Helper functions
// ============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    fs::path exe_path(name);
    if (exe_path.is_absolute())
    {
        if (fs::exists(exe_path) && access(exe_path.c_str(), X_OK) == 0)
            return name;
        return std::nullopt;
    }

    // If name contains a path separator, treat as relative path
    if (name.find('/') != std::string::npos)
    {
        if (fs::exists(name) && access(name.c_str(), X_OK) == 0)
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
    {
        if (fs::exists(name) && access(name.c_str(), X_OK) == 0)
            return fs::absolute(name).string();
        return std::nullopt;
    }

    std::string path_str(path_env);
    size_t start = 0;
    size_t end;

    // Split PATH by colon on POSIX
    while ((end = path_str.find(':', start)) != std::string::npos)
    {
        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path test_path = fs::path(dir) / name;
            if (fs::exists(test_path) && access(test_path.c_str(), X_OK) == 0)
                return test_path.string();
        }

        start = end + 1;
    }

    // Check last directory
    if (start < path_str.length())
    {
        std::string dir = path_str.substr(start);
        if (!dir.empty())
        {
            fs::path test_path = fs::path(dir) / name;
            if (fs::exists(test_path) && access(test_path.c_str(), X_OK) == 0)
                return test_path.string();
        }
    }

    return std::nullopt;
}

} // namespace subprocess
} // namespace localexec
