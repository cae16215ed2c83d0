#include <localexec/encoding.hpp>
#include <localexec/errors.hpp>
#include <openssl/evp.h>
#include <vector>

namespace localexec
{
namespace encoding
{

namespace
{

std::string byte_offset_message(const char* what, size_t offset)
{
    return std::string(what) + " at byte offset " + std::to_string(offset);
}

bool is_base64_char(unsigned char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '+' || c == '/';
}

} // namespace

std::string quiet_script(const std::string& command)
{
    return QUIET_PROGRESS_PREAMBLE + command;
}

std::u16string utf8_to_utf16(const std::string& text)
{
    std::u16string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size())
    {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        char32_t cp;
        size_t length;
        char32_t min_value;

        if (lead < 0x80)
        {
            cp = lead;
            length = 1;
            min_value = 0;
        }
        else if ((lead & 0xE0) == 0xC0)
        {
            cp = lead & 0x1F;
            length = 2;
            min_value = 0x80;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            cp = lead & 0x0F;
            length = 3;
            min_value = 0x800;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            cp = lead & 0x07;
            length = 4;
            min_value = 0x10000;
        }
        else
        {
            throw EncodingError(byte_offset_message("Invalid UTF-8 lead byte", i));
        }

        if (i + length > text.size())
            throw EncodingError(byte_offset_message("Truncated UTF-8 sequence", i));

        for (size_t k = 1; k < length; ++k)
        {
            unsigned char cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80)
                throw EncodingError(byte_offset_message("Invalid UTF-8 continuation byte", i + k));
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (cp < min_value)
            throw EncodingError(byte_offset_message("Overlong UTF-8 sequence", i));
        if (cp >= 0xD800 && cp <= 0xDFFF)
            throw EncodingError(byte_offset_message("UTF-8 encoded surrogate", i));
        if (cp > 0x10FFFF)
            throw EncodingError(byte_offset_message("Code point above U+10FFFF", i));

        if (cp >= 0x10000)
        {
            cp -= 0x10000;
            result.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
            result.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
        }
        else
        {
            result.push_back(static_cast<char16_t>(cp));
        }

        i += length;
    }

    return result;
}

std::string utf16_to_utf8(const std::u16string& text)
{
    std::string result;
    result.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i)
    {
        char32_t cp = text[i];

        if (cp >= 0xD800 && cp <= 0xDBFF)
        {
            if (i + 1 >= text.size() || text[i + 1] < 0xDC00 || text[i + 1] > 0xDFFF)
                throw EncodingError("Unpaired high surrogate at index " + std::to_string(i));
            cp = 0x10000 + ((cp - 0xD800) << 10) + (text[i + 1] - 0xDC00);
            ++i;
        }
        else if (cp >= 0xDC00 && cp <= 0xDFFF)
        {
            throw EncodingError("Unpaired low surrogate at index " + std::to_string(i));
        }

        if (cp < 0x80)
        {
            result.push_back(static_cast<char>(cp));
        }
        else if (cp < 0x800)
        {
            result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else if (cp < 0x10000)
        {
            result.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else
        {
            result.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    return result;
}

std::string to_utf16le_bytes(const std::u16string& text)
{
    std::string bytes;
    bytes.reserve(text.size() * 2);
    for (char16_t unit : text)
    {
        bytes.push_back(static_cast<char>(unit & 0xFF));
        bytes.push_back(static_cast<char>((unit >> 8) & 0xFF));
    }
    return bytes;
}

std::u16string from_utf16le_bytes(const std::string& bytes)
{
    if (bytes.size() % 2 != 0)
        throw EncodingError("UTF-16LE byte string has odd length " +
                            std::to_string(bytes.size()));

    std::u16string text;
    text.reserve(bytes.size() / 2);
    for (size_t i = 0; i < bytes.size(); i += 2)
    {
        auto lo = static_cast<unsigned char>(bytes[i]);
        auto hi = static_cast<unsigned char>(bytes[i + 1]);
        text.push_back(static_cast<char16_t>(lo | (hi << 8)));
    }
    return text;
}

std::string base64_encode(const std::string& bytes)
{
    if (bytes.empty())
        return {};

    // 4 output chars per 3 input bytes, plus NUL written by EVP_EncodeBlock
    std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(bytes.data()),
                                  static_cast<int>(bytes.size()));
    if (written < 0)
        throw EncodingError("base64 encoding failed");

    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
}

std::string base64_decode(const std::string& encoded)
{
    if (encoded.empty())
        return {};

    if (encoded.size() % 4 != 0)
        throw EncodingError("base64 input length " + std::to_string(encoded.size()) +
                            " is not a multiple of 4");

    // EVP_DecodeBlock tolerates whitespace and does not report padding; validate up front
    size_t padding = 0;
    for (size_t i = 0; i < encoded.size(); ++i)
    {
        auto c = static_cast<unsigned char>(encoded[i]);
        if (c == '=')
        {
            if (i < encoded.size() - 2)
                throw EncodingError(byte_offset_message("Misplaced base64 padding", i));
            ++padding;
        }
        else if (padding > 0 || !is_base64_char(c))
        {
            throw EncodingError(byte_offset_message("Invalid base64 character", i));
        }
    }

    std::vector<unsigned char> out(3 * (encoded.size() / 4));
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0)
        throw EncodingError("base64 decoding failed");

    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<size_t>(written) - padding);
}

std::string encode_script(const std::string& command)
{
    return base64_encode(to_utf16le_bytes(utf8_to_utf16(quiet_script(command))));
}

std::string decode_script(const std::string& encoded)
{
    return utf16_to_utf8(from_utf16le_bytes(base64_decode(encoded)));
}

std::string encode_session_script(const std::string& command)
{
    std::string script = quiet_script(command);
    utf8_to_utf16(script); // validate only; the pipe carries UTF-8
    return base64_encode(script);
}

std::string decode_session_script(const std::string& encoded)
{
    std::string script = base64_decode(encoded);
    utf8_to_utf16(script);
    return script;
}

} // namespace encoding
} // namespace localexec
