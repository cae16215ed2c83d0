#ifndef LOCALEXEC_PROTOCOL_SESSION_HPP
#define LOCALEXEC_PROTOCOL_SESSION_HPP

#include <localexec/types.hpp>
#include <string>

namespace localexec
{
namespace protocol
{

// Payload field names of a session response
constexpr const char* FIELD_STDOUT = "stdout";
constexpr const char* FIELD_STDERR = "stderr";
constexpr const char* FIELD_EXIT_STATUS = "exitstatus";

/**
 * Session wire protocol.
 *
 * One duplex pipe, newline-delimited lines, one request then one response:
 *   client -> server: base64(UTF-8(quiet preamble + command))
 *   server -> client: base64(UTF-8(JSON {"stdout": str, "stderr": str, "exitstatus": int}))
 */

// Request line for a command (no trailing newline)
std::string encode_request(const std::string& command);

// Command script carried by a request line (quiet preamble included)
std::string decode_request(const std::string& line);

// Response line for a result (no trailing newline)
std::string encode_response(const CommandResult& result);

// Strictly decode a response line. Throws ProtocolError if the line is not
// base64, not JSON, or does not match the three-field schema.
CommandResult decode_response(const std::string& line);

} // namespace protocol
} // namespace localexec

#endif // LOCALEXEC_PROTOCOL_SESSION_HPP
