#ifndef LOCALEXEC_SUBPROCESS_PROCESS_HPP
#define LOCALEXEC_SUBPROCESS_PROCESS_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace localexec
{
namespace subprocess
{

// Forward declarations for platform-specific types
struct ProcessHandle;
struct PipeHandle;

// Pipe for reading from subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    // No copy, move only
    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    // Read up to size bytes, returns actual bytes read
    // Returns 0 on EOF, throws on error
    size_t read(char* buffer, size_t size);

    // Read until EOF
    std::string read_all();

    // Close the pipe
    void close();

    // Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// Pipe for writing to subprocess
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    // No copy, move only
    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    // Write data to pipe
    size_t write(const char* data, size_t size);

    // Write string to pipe
    size_t write(const std::string& data);

    // Close the pipe
    void close();

    // Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// Process configuration
struct ProcessOptions
{
    std::string working_directory;
    std::map<std::string, std::string> environment;
    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = false;

    // Own session/process group; non-redirected streams go to the null device
    bool detached = false;

    // Child is killed when this process dies (job object / parent-death signal).
    // On Linux such children are forked from a process-lifetime thread, since the
    // parent-death signal fires when the forking thread exits.
    bool kill_on_parent_exit = false;
};

// Main Process class
class Process
{
  public:
    Process();
    ~Process();

    // No copy, move only
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    // Spawn a process. Throws SpawnError if the executable cannot be started.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    // Spawn a complete command line the way a shell-out would: through the
    // system shell when it needs one, otherwise directly.
    void spawn_command_line(const std::string& command_line, const ProcessOptions& options = {});

    // Get pipes (only valid if redirected)
    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();
    ReadPipe& stderr_pipe();

    // Process control
    bool is_running() const;
    std::optional<int> try_wait(); // Non-blocking wait, returns exit code if done
    int wait();                    // Blocking wait, returns exit code
    void terminate();              // Graceful termination (SIGTERM/close)
    void kill();                   // Forceful kill (SIGKILL/TerminateProcess)

    // Process ID
    int pid() const;

  private:
#ifdef _WIN32
    void spawn_command_line_raw(const std::string& command_line, const ProcessOptions& options);
#else
    void spawn_forked(const std::string& executable, const std::vector<std::string>& args,
                      const ProcessOptions& options);
#endif

    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

// True if the command line must be interpreted by the system shell
// (metacharacters, or a leading shell builtin/reserved word)
bool needs_shell(const std::string& command_line);

// Split a shell-free command line on whitespace
std::vector<std::string> split_command_line(const std::string& command_line);

// Helper function to find executable in PATH
std::optional<std::string> find_executable(const std::string& name);

} // namespace subprocess
} // namespace localexec

#endif // LOCALEXEC_SUBPROCESS_PROCESS_HPP
