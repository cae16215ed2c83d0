// Stand-in session server for tests: speaks the session line protocol over a
// Unix-domain socket. Usage: stub_session_server <socket path> [--delay-ms N]
//
// Commands with special behavior:
//   fail       exit status 1 with text on stderr
//   garbage    a response line that is not base64
//   badschema  a response missing two fields
//   hang       no response
//   quit       close the connection without responding

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <localexec/encoding.hpp>
#include <localexec/protocol/session.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

namespace
{

bool write_line(int fd, const std::string& line)
{
    std::string data = line + "\n";
    size_t offset = 0;
    while (offset < data.size())
    {
        ssize_t n = ::write(fd, data.data() + offset, data.size() - offset);
        if (n <= 0)
            return false;
        offset += static_cast<size_t>(n);
    }
    return true;
}

bool read_line(int fd, std::string& line)
{
    line.clear();
    char c;
    for (;;)
    {
        ssize_t n = ::read(fd, &c, 1);
        if (n <= 0)
            return false;
        if (c == '\n')
            return true;
        line += c;
    }
}

std::string strip_preamble(const std::string& script)
{
    const std::string preamble = localexec::encoding::QUIET_PROGRESS_PREAMBLE;
    if (script.compare(0, preamble.size(), preamble) == 0)
        return script.substr(preamble.size());
    return script;
}

} // namespace

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        std::fprintf(stderr, "usage: %s <socket path> [--delay-ms N]\n", argv[0]);
        return 2;
    }

    std::string path = argv[1];
    int delay_ms = 0;
    for (int i = 2; i + 1 < argc; ++i)
    {
        if (std::strcmp(argv[i], "--delay-ms") == 0)
            delay_ms = std::atoi(argv[i + 1]);
    }

    if (delay_ms > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));

    int listener = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (listener < 0)
        return 1;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path))
        return 1;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    ::unlink(path.c_str());

    if (::bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(listener, 1) != 0)
        return 1;

    int client = ::accept(listener, nullptr, nullptr);
    ::close(listener);
    ::unlink(path.c_str());
    if (client < 0)
        return 1;

    std::string request;
    while (read_line(client, request))
    {
        std::string command;
        try
        {
            command = strip_preamble(localexec::protocol::decode_request(request));
        }
        catch (const std::exception& e)
        {
            command = std::string("undecodable: ") + e.what();
        }

        std::string response;
        if (command == "quit")
        {
            break;
        }
        else if (command == "hang")
        {
            continue;
        }
        else if (command == "garbage")
        {
            response = "!!!not-base64!!!";
        }
        else if (command == "badschema")
        {
            response = localexec::encoding::base64_encode("{\"stdout\":\"x\"}");
        }
        else if (command == "fail")
        {
            response = localexec::protocol::encode_response({"", "boom\n", 1});
        }
        else
        {
            response = localexec::protocol::encode_response({"reply:" + command + "\n", "", 0});
        }

        if (!write_line(client, response))
            break;
    }

    ::close(client);
    return 0;
}
