#include "indevolt/net/rpc/url_encoding.hpp"

#include <cctype>

namespace indevolt
{

std::string url_encode(const std::string& text)
{
    static constexpr char hex_digits[] = "0123456789ABCDEF";

    std::string encoded;
    encoded.reserve(text.size() * 3);
    for (char character : text)
    {
        auto byte = static_cast<unsigned char>(character);
        if (std::isalnum(byte) != 0 || byte == '-' || byte == '.' || byte == '_' || byte == '~')
        {
            encoded += character;
        }
        else
        {
            encoded += '%';
            encoded += hex_digits[byte >> 4];
            encoded += hex_digits[byte & 0x0F];
        }
    }
    return encoded;
}

} // namespace indevolt
