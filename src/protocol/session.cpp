#include <localexec/encoding.hpp>
#include <localexec/errors.hpp>
#include <localexec/protocol/session.hpp>

namespace localexec
{
namespace protocol
{

std::string encode_request(const std::string& command)
{
    return encoding::encode_session_script(command);
}

std::string decode_request(const std::string& line)
{
    return encoding::decode_session_script(line);
}

std::string encode_response(const CommandResult& result)
{
    json payload = {{FIELD_STDOUT, result.stdout_text},
                    {FIELD_STDERR, result.stderr_text},
                    {FIELD_EXIT_STATUS, result.exit_status}};
    return encoding::base64_encode(payload.dump());
}

CommandResult decode_response(const std::string& line)
{
    std::string text;
    try
    {
        text = encoding::base64_decode(line);
    }
    catch (const EncodingError& e)
    {
        throw ProtocolError(std::string("Session response is not base64: ") + e.what());
    }

    json payload;
    try
    {
        payload = json::parse(text);
    }
    catch (const json::exception& e)
    {
        throw ProtocolError(std::string("Session response is not JSON: ") + e.what());
    }

    if (!payload.is_object())
        throw ProtocolError("Session response is not a JSON object");

    auto require = [&payload](const char* field) -> const json&
    {
        auto it = payload.find(field);
        if (it == payload.end())
            throw ProtocolError(std::string("Session response missing field '") + field + "'");
        return *it;
    };

    const json& out = require(FIELD_STDOUT);
    const json& err = require(FIELD_STDERR);
    const json& status = require(FIELD_EXIT_STATUS);

    if (payload.size() != 3)
        throw ProtocolError("Session response has unexpected fields: " + payload.dump());

    if (!out.is_string())
        throw ProtocolError("Session response field 'stdout' is not a string");
    if (!err.is_string())
        throw ProtocolError("Session response field 'stderr' is not a string");
    if (!status.is_number_integer())
        throw ProtocolError("Session response field 'exitstatus' is not an integer");

    return CommandResult(out.get<std::string>(), err.get<std::string>(), status.get<int>());
}

} // namespace protocol
} // namespace localexec
