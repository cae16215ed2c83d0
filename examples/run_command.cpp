/**
 * @file run_command.cpp
 * @brief Run commands on the local machine
 *
 * Usage: run_command [--no-session] [--verbose] <command>...
 *
 * Each remaining argument is run as one command on a single connection, so
 * on Windows every command after the first reuses the PowerShell session.
 */

#include <cstring>
#include <iostream>
#include <localexec/localexec.hpp>
#include <string>
#include <vector>

int main(int argc, char* argv[])
{
    localexec::LocalOptions options;
    std::vector<std::string> commands;
    bool verbose = false;

    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--no-session") == 0)
            options.enable_session = false;
        else if (std::strcmp(argv[i], "--verbose") == 0)
            verbose = true;
        else
            commands.push_back(argv[i]);
    }

    if (commands.empty())
    {
        std::cerr << "Usage: " << argv[0] << " [--no-session] [--verbose] <command>...\n";
        return 2;
    }

    if (verbose)
    {
        options.log_callback = [](localexec::LogLevel level, const std::string& message)
        {
            std::cerr << (level == localexec::LogLevel::Warning ? "[warn] " : "[debug] ")
                      << message << "\n";
        };
    }

    int last_status = 0;
    try
    {
        localexec::LocalConnection conn(options);
        if (verbose)
            std::cerr << "[debug] localexec " << localexec::version_string() << ", runner "
                      << localexec::to_string(conn.runner_kind()) << "\n";

        for (const auto& command : commands)
        {
            localexec::CommandResult result = conn.run_command(command);
            std::cout << result.stdout_text;
            std::cerr << result.stderr_text;
            last_status = result.exit_status;
        }
    }
    catch (const localexec::ProtocolError& e)
    {
        std::cerr << "Session error: " << e.what() << "\n";
        return 1;
    }
    catch (const localexec::EncodingError& e)
    {
        std::cerr << "Command is not valid UTF-8: " << e.what() << "\n";
        return 1;
    }
    catch (const localexec::LocalExecError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return last_status;
}
