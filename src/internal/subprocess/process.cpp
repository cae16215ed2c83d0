// Platform-agnostic process implementation
// Uses conditional compilation to select platform-specific implementation

#ifdef _WIN32
    #include "process_win32.cpp"
#else
    #include "process_posix.cpp"
#endif

#include <algorithm>
#include <cctype>

namespace localexec
{
namespace subprocess
{

namespace
{

#ifdef _WIN32
constexpr const char* SHELL_METACHARACTERS = "|&<>^%\n";
const char* const SHELL_BUILTINS[] = {
    "assoc", "break", "call", "cd",    "chdir", "cls",   "color", "copy", "date",
    "del",   "dir",   "echo", "erase", "exit", "for",   "ftype", "goto",  "if",   "md",
    "mkdir", "mklink", "move", "path", "pause", "popd",  "prompt", "pushd", "rd",
    "rem",   "ren",   "rename", "rmdir", "set", "setlocal", "shift", "start", "time",
    "title", "type",  "ver",  "verify", "vol",
};
#else
constexpr const char* SHELL_METACHARACTERS = "*?{}[]<>()~&|\\$;'`\"\n#=%";
const char* const SHELL_BUILTINS[] = {
    "!",     ".",      ":",        "break",  "case",  "cd",       "continue", "do",
    "done",  "elif",   "else",     "esac",   "eval",  "exec",     "exit",     "export",
    "fi",    "for",    "if",       "in",     "readonly", "return", "set",     "shift",
    "source", "then",  "times",    "trap",   "ulimit", "umask",   "unset",    "until",
    "wait",  "while",
};
#endif

bool is_space(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

#ifdef _WIN32
std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
#endif

} // namespace

bool needs_shell(const std::string& command_line)
{
    if (command_line.find_first_of(SHELL_METACHARACTERS) != std::string::npos)
        return true;

    auto words = split_command_line(command_line);
    if (words.empty())
        return false;

#ifdef _WIN32
    std::string first = lower(words.front());
#else
    const std::string& first = words.front();
#endif
    for (const char* builtin : SHELL_BUILTINS)
        if (first == builtin)
            return true;

    return false;
}

std::vector<std::string> split_command_line(const std::string& command_line)
{
    std::vector<std::string> words;
    size_t i = 0;
    while (i < command_line.size())
    {
        while (i < command_line.size() && is_space(command_line[i]))
            ++i;
        size_t start = i;
        while (i < command_line.size() && !is_space(command_line[i]))
            ++i;
        if (i > start)
            words.push_back(command_line.substr(start, i - start));
    }
    return words;
}

} // namespace subprocess
} // namespace localexec
