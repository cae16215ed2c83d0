#ifdef _WIN32

#include "process.hpp"

#include <algorithm>
#include <filesystem>
#include <localexec/errors.hpp>
#include <sstream>
#include <stdexcept>
#include <windows.h>

namespace localexec
{
namespace subprocess
{

// Platform-specific handle structures
struct PipeHandle
{
    HANDLE handle = INVALID_HANDLE_VALUE;

    ~PipeHandle()
    {
        if (handle != INVALID_HANDLE_VALUE)
            CloseHandle(handle);
    }
};

struct ProcessHandle
{
    HANDLE process_handle = INVALID_HANDLE_VALUE;
    HANDLE thread_handle = INVALID_HANDLE_VALUE;
    DWORD process_id = 0;
    bool running = false;
    int exit_code = -1;

    ~ProcessHandle()
    {
        if (thread_handle != INVALID_HANDLE_VALUE)
            CloseHandle(thread_handle);
        if (process_handle != INVALID_HANDLE_VALUE)
            CloseHandle(process_handle);
    }
};

// =============================================================================
// Job Object for child process cleanup
// =============================================================================

// Children assigned here die with the job handle, i.e. when this process exits
// for any reason.
static HANDLE get_child_process_job()
{
    static HANDLE job = []() -> HANDLE {
        HANDLE h = CreateJobObjectA(nullptr, nullptr);
        if (h)
        {
            JOBOBJECT_EXTENDED_LIMIT_INFORMATION info = {};
            info.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
            SetInformationJobObject(h, JobObjectExtendedLimitInformation, &info, sizeof(info));
        }
        return h;
    }();
    return job;
}

static std::string format_error_message(DWORD error)
{
    if (error == 0)
        return "No error";

    LPSTR buffer = nullptr;
    size_t size = FormatMessageA(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr, error, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT), (LPSTR)&buffer, 0, nullptr);

    std::string message(buffer, size);
    LocalFree(buffer);
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r'))
        message.pop_back();
    return message;
}

static std::string get_last_error_message()
{
    return format_error_message(GetLastError());
}

// Helper function to quote argument if needed
static std::string quote_if_needed(const std::string& arg)
{
    bool needs_quotes = arg.empty();
    if (!needs_quotes)
    {
        for (char c : arg)
        {
            // Space, tab, and cmd.exe special characters
            if (c == ' ' || c == '\t' || c == '"' || c == '{' || c == '}' || c == '(' || c == ')' ||
                c == '[' || c == ']' || c == '<' || c == '>' || c == '|' || c == '&' || c == '^' ||
                c == '%' || c == '!' || c == ',' || c == ';' || c == '=' || c == ':')
            {
                needs_quotes = true;
                break;
            }
        }
    }

    if (!needs_quotes)
        return arg;

    std::string result = "\"";
    for (char c : arg)
        if (c == '"')
            result += "\\\"";
        else if (c == '\\')
            result += "\\\\";
        else
            result += c;
    result += "\"";
    return result;
}

// ReadPipe implementation
ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&& other) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&& other) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    DWORD bytes_read = 0;
    BOOL success =
        ReadFile(handle_->handle, buffer, static_cast<DWORD>(size), &bytes_read, nullptr);

    if (!success)
    {
        DWORD error = GetLastError();
        if (error == ERROR_BROKEN_PIPE)
            return 0; // EOF
        throw std::runtime_error("Read failed: " + format_error_message(error));
    }

    return bytes_read;
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
    if (handle_ && handle_->handle != INVALID_HANDLE_VALUE)
    {
        CloseHandle(handle_->handle);
        handle_->handle = INVALID_HANDLE_VALUE;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->handle != INVALID_HANDLE_VALUE;
}

// WritePipe implementation
WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&& other) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&& other) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    DWORD bytes_written = 0;
    BOOL success =
        WriteFile(handle_->handle, data, static_cast<DWORD>(size), &bytes_written, nullptr);

    if (!success)
        throw std::runtime_error("Write failed: " + get_last_error_message());

    return bytes_written;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::close()
{
    if (handle_ && handle_->handle != INVALID_HANDLE_VALUE)
    {
        CloseHandle(handle_->handle);
        handle_->handle = INVALID_HANDLE_VALUE;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->handle != INVALID_HANDLE_VALUE;
}

// Process implementation
Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (is_running())
    {
        terminate();
        wait();
    }
}

Process::Process(Process&& other) noexcept = default;
Process& Process::operator=(Process&& other) noexcept = default;

namespace
{

std::string build_environment_block(const ProcessOptions& options, bool& provide_env_block)
{
    std::string env_block;
    provide_env_block = !options.environment.empty();
    if (!provide_env_block)
        return env_block;

    std::map<std::string, std::string> env_map;

    char* env_strings = GetEnvironmentStringsA();
    if (env_strings)
    {
        char* current = env_strings;
        while (*current != '\0')
        {
            std::string entry(current);
            size_t eq_pos = entry.find('=');
            if (eq_pos != std::string::npos && eq_pos > 0)
                env_map[entry.substr(0, eq_pos)] = entry.substr(eq_pos + 1);
            current += entry.length() + 1;
        }
        FreeEnvironmentStringsA(env_strings);
    }

    for (const auto& [key, value] : options.environment)
        env_map[key] = value;

    for (const auto& [key, value] : env_map)
        env_block += key + "=" + value + '\0';
    env_block += '\0';
    return env_block;
}

} // namespace

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    std::ostringstream cmdline;
    cmdline << quote_if_needed(executable);
    for (const auto& arg : args)
        cmdline << " " << quote_if_needed(arg);

    spawn_command_line_raw(cmdline.str(), options);
}

void Process::spawn_command_line(const std::string& command_line, const ProcessOptions& options)
{
    if (split_command_line(command_line).empty())
        throw SpawnError("Empty command line", ERROR_INVALID_PARAMETER);

    if (needs_shell(command_line))
        spawn_command_line_raw("cmd.exe /c " + command_line, options);
    else
        spawn_command_line_raw(command_line, options);
}

void Process::spawn_command_line_raw(const std::string& command_line, const ProcessOptions& options)
{
    SECURITY_ATTRIBUTES sa;
    sa.nLength = sizeof(SECURITY_ATTRIBUTES);
    sa.bInheritHandle = TRUE;
    sa.lpSecurityDescriptor = nullptr;

    HANDLE stdin_read = INVALID_HANDLE_VALUE;
    HANDLE stdin_write = INVALID_HANDLE_VALUE;
    HANDLE stdout_read = INVALID_HANDLE_VALUE;
    HANDLE stdout_write = INVALID_HANDLE_VALUE;
    HANDLE stderr_read = INVALID_HANDLE_VALUE;
    HANDLE stderr_write = INVALID_HANDLE_VALUE;
    HANDLE null_handle = INVALID_HANDLE_VALUE;

    auto close_child_ends = [&]
    {
        if (stdin_read != INVALID_HANDLE_VALUE)
            CloseHandle(stdin_read);
        if (stdout_write != INVALID_HANDLE_VALUE)
            CloseHandle(stdout_write);
        if (stderr_write != INVALID_HANDLE_VALUE)
            CloseHandle(stderr_write);
        if (null_handle != INVALID_HANDLE_VALUE)
            CloseHandle(null_handle);
        stdin_read = stdout_write = stderr_write = null_handle = INVALID_HANDLE_VALUE;
    };
    auto close_parent_ends = [&]
    {
        if (stdin_write != INVALID_HANDLE_VALUE)
            CloseHandle(stdin_write);
        if (stdout_read != INVALID_HANDLE_VALUE)
            CloseHandle(stdout_read);
        if (stderr_read != INVALID_HANDLE_VALUE)
            CloseHandle(stderr_read);
        stdin_write = stdout_read = stderr_read = INVALID_HANDLE_VALUE;
    };
    auto fail = [&](const std::string& what)
    {
        std::string message = what + ": " + get_last_error_message();
        close_child_ends();
        close_parent_ends();
        throw std::runtime_error(message);
    };

    if (options.redirect_stdin)
    {
        if (!CreatePipe(&stdin_read, &stdin_write, &sa, 0))
            fail("Failed to create stdin pipe");
        SetHandleInformation(stdin_write, HANDLE_FLAG_INHERIT, 0);
    }

    if (options.redirect_stdout)
    {
        if (!CreatePipe(&stdout_read, &stdout_write, &sa, 0))
            fail("Failed to create stdout pipe");
        SetHandleInformation(stdout_read, HANDLE_FLAG_INHERIT, 0);
    }

    if (options.redirect_stderr)
    {
        if (!CreatePipe(&stderr_read, &stderr_write, &sa, 0))
            fail("Failed to create stderr pipe");
        SetHandleInformation(stderr_read, HANDLE_FLAG_INHERIT, 0);
    }

    // Streams that are not redirected go to NUL so the child stays off our console
    bool need_null = !options.redirect_stderr || (options.detached && (!options.redirect_stdin ||
                                                                       !options.redirect_stdout));
    if (need_null)
    {
        null_handle = CreateFileA("NUL", GENERIC_READ | GENERIC_WRITE,
                                  FILE_SHARE_READ | FILE_SHARE_WRITE, &sa, OPEN_EXISTING,
                                  FILE_ATTRIBUTE_NORMAL, nullptr);
    }

    bool provide_env_block = false;
    std::string env_block = build_environment_block(options, provide_env_block);

    std::vector<HANDLE> handles_to_inherit;
    if (stdin_read != INVALID_HANDLE_VALUE)
        handles_to_inherit.push_back(stdin_read);
    if (stdout_write != INVALID_HANDLE_VALUE)
        handles_to_inherit.push_back(stdout_write);
    if (stderr_write != INVALID_HANDLE_VALUE)
        handles_to_inherit.push_back(stderr_write);
    if (null_handle != INVALID_HANDLE_VALUE)
        handles_to_inherit.push_back(null_handle);

    auto pick = [&](bool redirected, HANDLE pipe_end, DWORD std_id) -> HANDLE
    {
        if (redirected)
            return pipe_end;
        if (null_handle != INVALID_HANDLE_VALUE && (options.detached || std_id == STD_ERROR_HANDLE))
            return null_handle;
        return GetStdHandle(std_id);
    };

    // Explicit handle list keeps unrelated inheritable handles out of the child
    STARTUPINFOEXA si;
    ZeroMemory(&si, sizeof(si));
    si.StartupInfo.cb = sizeof(si);
    si.StartupInfo.dwFlags = STARTF_USESTDHANDLES;
    si.StartupInfo.hStdInput = pick(options.redirect_stdin, stdin_read, STD_INPUT_HANDLE);
    si.StartupInfo.hStdOutput = pick(options.redirect_stdout, stdout_write, STD_OUTPUT_HANDLE);
    si.StartupInfo.hStdError = pick(options.redirect_stderr, stderr_write, STD_ERROR_HANDLE);

    SIZE_T attr_size = 0;
    InitializeProcThreadAttributeList(nullptr, 1, 0, &attr_size);
    si.lpAttributeList = (LPPROC_THREAD_ATTRIBUTE_LIST)HeapAlloc(GetProcessHeap(), 0, attr_size);
    if (!si.lpAttributeList)
        fail("Failed to allocate attribute list");

    if (!InitializeProcThreadAttributeList(si.lpAttributeList, 1, 0, &attr_size))
    {
        HeapFree(GetProcessHeap(), 0, si.lpAttributeList);
        fail("Failed to init attribute list");
    }

    if (!handles_to_inherit.empty())
    {
        if (!UpdateProcThreadAttribute(
                si.lpAttributeList, 0, PROC_THREAD_ATTRIBUTE_HANDLE_LIST, handles_to_inherit.data(),
                handles_to_inherit.size() * sizeof(HANDLE), nullptr, nullptr))
        {
            DeleteProcThreadAttributeList(si.lpAttributeList);
            HeapFree(GetProcessHeap(), 0, si.lpAttributeList);
            fail("Failed to update attribute list");
        }
    }

    PROCESS_INFORMATION pi;
    ZeroMemory(&pi, sizeof(pi));

    DWORD creation_flags = EXTENDED_STARTUPINFO_PRESENT | CREATE_NO_WINDOW;
    if (options.detached)
        creation_flags |= CREATE_NEW_PROCESS_GROUP;

    std::string mutable_cmdline = command_line;
    BOOL success = CreateProcessA(
        nullptr, mutable_cmdline.data(), nullptr, nullptr, TRUE, creation_flags,
        provide_env_block ? const_cast<char*>(env_block.data()) : nullptr,
        options.working_directory.empty() ? nullptr : options.working_directory.c_str(),
        (LPSTARTUPINFOA)&si, &pi);
    DWORD create_error = success ? 0 : GetLastError();

    DeleteProcThreadAttributeList(si.lpAttributeList);
    HeapFree(GetProcessHeap(), 0, si.lpAttributeList);

    close_child_ends();

    if (!success)
    {
        close_parent_ends();
        throw SpawnError("Failed to create process '" + command_line +
                             "': " + format_error_message(create_error),
                         static_cast<int>(create_error));
    }

    if (stdin_write != INVALID_HANDLE_VALUE)
    {
        stdin_ = std::make_unique<WritePipe>();
        stdin_->handle_->handle = stdin_write;
    }
    if (stdout_read != INVALID_HANDLE_VALUE)
    {
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->handle = stdout_read;
    }
    if (stderr_read != INVALID_HANDLE_VALUE)
    {
        stderr_ = std::make_unique<ReadPipe>();
        stderr_->handle_->handle = stderr_read;
    }

    handle_->process_handle = pi.hProcess;
    handle_->thread_handle = pi.hThread;
    handle_->process_id = pi.dwProcessId;
    handle_->running = true;

    if (options.kill_on_parent_exit)
    {
        HANDLE job = get_child_process_job();
        if (job)
            AssignProcessToJobObject(job, pi.hProcess);
    }
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
    if (!handle_->running)
        return false;

    DWORD exit_code;
    if (GetExitCodeProcess(handle_->process_handle, &exit_code))
        return exit_code == STILL_ACTIVE;
    return false;
}

std::optional<int> Process::try_wait()
{
    if (!handle_->running)
        return handle_->exit_code;

    DWORD result = WaitForSingleObject(handle_->process_handle, 0);
    if (result == WAIT_OBJECT_0)
    {
        DWORD exit_code;
        if (GetExitCodeProcess(handle_->process_handle, &exit_code))
        {
            handle_->exit_code = static_cast<int>(exit_code);
            handle_->running = false;
            return handle_->exit_code;
        }
    }

    return std::nullopt;
}

int Process::wait()
{
    if (!handle_->running)
        return handle_->exit_code;

    WaitForSingleObject(handle_->process_handle, INFINITE);

    DWORD exit_code;
    if (GetExitCodeProcess(handle_->process_handle, &exit_code))
        handle_->exit_code = static_cast<int>(exit_code);
    else
        handle_->exit_code = -1;

    handle_->running = false;
    return handle_->exit_code;
}

void Process::terminate()
{
    if (handle_->running && handle_->process_handle != INVALID_HANDLE_VALUE)
        TerminateProcess(handle_->process_handle, 1);
}

void Process::kill()
{
    terminate(); // On Windows, terminate and kill are the same
}

int Process::pid() const
{
    return static_cast<int>(handle_->process_id);
}

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    fs::path exe_path(name);
    if (exe_path.is_absolute() && fs::exists(exe_path))
        return name;

    std::vector<std::string> extensions = {".exe", ".cmd", ".bat", ""};

    for (const auto& ext : extensions)
    {
        fs::path test_path = name + ext;
        if (fs::exists(test_path))
            return test_path.string();
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    std::string path_str(path_env);
    size_t start = 0;
    size_t end;

    // Split PATH by semicolon on Windows
    while ((end = path_str.find(';', start)) != std::string::npos)
    {
        std::string dir = path_str.substr(start, end - start);

        for (const auto& ext : extensions)
        {
            fs::path test_path = fs::path(dir) / (name + ext);
            if (fs::exists(test_path))
                return test_path.string();
        }

        start = end + 1;
    }

    if (start < path_str.length())
    {
        std::string dir = path_str.substr(start);
        for (const auto& ext : extensions)
        {
            fs::path test_path = fs::path(dir) / (name + ext);
            if (fs::exists(test_path))
                return test_path.string();
        }
    }

    return std::nullopt;
}

} // namespace subprocess
} // namespace localexec

#endif // _WIN32
