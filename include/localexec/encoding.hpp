#ifndef LOCALEXEC_ENCODING_HPP
#define LOCALEXEC_ENCODING_HPP

#include <string>

namespace localexec
{
namespace encoding
{

// Keeps PowerShell progress records out of the captured streams
constexpr const char* QUIET_PROGRESS_PREAMBLE = "$ProgressPreference='SilentlyContinue';";

// QUIET_PROGRESS_PREAMBLE + command
std::string quiet_script(const std::string& command);

// Transcoding; malformed input throws EncodingError
std::u16string utf8_to_utf16(const std::string& text);
std::string utf16_to_utf8(const std::u16string& text);

// Code units <-> little-endian byte string
std::string to_utf16le_bytes(const std::u16string& text);
std::u16string from_utf16le_bytes(const std::string& bytes);

// Standard alphabet, padded, no line breaks
std::string base64_encode(const std::string& bytes);
std::string base64_decode(const std::string& encoded);

/**
 * Encode a command for a one-shot scripting host invocation
 * (`-EncodedCommand`): base64 of the UTF-16LE quiet script.
 * The result is a single token with no whitespace.
 */
std::string encode_script(const std::string& command);

// Inverse of encode_script; returns the quiet script
std::string decode_script(const std::string& encoded);

/**
 * Encode a command for the session pipe: base64 of the UTF-8 quiet script.
 * The session server decodes UTF-8, so no UTF-16 step is applied.
 */
std::string encode_session_script(const std::string& command);

// Inverse of encode_session_script; returns the quiet script
std::string decode_session_script(const std::string& encoded);

} // namespace encoding
} // namespace localexec

#endif // LOCALEXEC_ENCODING_HPP
