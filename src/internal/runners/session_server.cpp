#include <localexec/encoding.hpp>
#include <localexec/protocol/session.hpp>
#include <localexec/runner.hpp>
#include <sstream>

namespace localexec
{

namespace
{

// Read-execute-respond loop behind a named pipe. Mirrors protocol::encode_response:
// one base64(UTF-8 JSON) line per base64(UTF-8 script) line. A closed client ends the loop.
std::string build_server_script(const std::string& pipe_name)
{
    std::ostringstream script;
    script << "$ErrorActionPreference = 'Stop'\n"
           << "$pipeServer = New-Object System.IO.Pipes.NamedPipeServerStream('" << pipe_name
           << "')\n"
           << "$pipeReader = New-Object System.IO.StreamReader($pipeServer)\n"
           << "$pipeWriter = New-Object System.IO.StreamWriter($pipeServer)\n"
           << "$pipeServer.WaitForConnection()\n"
           << "while ($true) {\n"
           << "  $request = $pipeReader.ReadLine()\n"
           << "  if ($null -eq $request) { break }\n"
           << "  $command = [System.Text.Encoding]::UTF8.GetString("
              "[System.Convert]::FromBase64String($request))\n"
           << "  $scriptBlock = $ExecutionContext.InvokeCommand.NewScriptBlock($command)\n"
           << "  try {\n"
           << "    $stdout = & $scriptBlock | Out-String\n"
           << "    $result = @{ '" << protocol::FIELD_STDOUT << "' = [string]$stdout; '"
           << protocol::FIELD_STDERR << "' = ''; '" << protocol::FIELD_EXIT_STATUS << "' = 0 }\n"
           << "  } catch {\n"
           << "    $stderr = $_ | Out-String\n"
           << "    $result = @{ '" << protocol::FIELD_STDOUT << "' = ''; '"
           << protocol::FIELD_STDERR << "' = [string]$stderr; '" << protocol::FIELD_EXIT_STATUS
           << "' = 1 }\n"
           << "  }\n"
           << "  $resultJSON = $result | ConvertTo-Json -Compress\n"
           << "  $encodedResult = [System.Convert]::ToBase64String("
              "[System.Text.Encoding]::UTF8.GetBytes($resultJSON))\n"
           << "  $pipeWriter.WriteLine($encodedResult)\n"
           << "  $pipeWriter.Flush()\n"
           << "}\n";
    return script.str();
}

} // namespace

ServerLaunch powershell_session_server(const std::string& scripting_host,
                                       const SessionEndpoint& endpoint)
{
    // -EncodedCommand wants base64(UTF-16LE); the preamble is harmless here
    ServerLaunch launch;
    launch.executable = scripting_host;
    launch.args = {"-NoProfile",      "-ExecutionPolicy", "bypass",
                   "-NonInteractive", "-EncodedCommand",
                   encoding::encode_script(build_server_script(endpoint.name))};
    return launch;
}

} // namespace localexec
