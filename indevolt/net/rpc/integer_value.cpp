#include "indevolt/net/rpc/integer_value.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace indevolt
{

namespace
{

bool is_space(char character)
{
    return std::isspace(static_cast<unsigned char>(character)) != 0;
}

std::int64_t parse_integer(const std::string& text)
{
    std::size_t begin = 0;
    std::size_t end   = text.size();
    while (begin < end && is_space(text[begin]))
    {
        ++begin;
    }
    while (end > begin && is_space(text[end - 1]))
    {
        --end;
    }

    std::size_t digits = begin;
    if (digits < end && (text[digits] == '+' || text[digits] == '-'))
    {
        ++digits;
    }
    if (digits == end)
    {
        throw std::invalid_argument("Not an integer: '" + text + "'");
    }
    for (std::size_t index = digits; index < end; ++index)
    {
        if (std::isdigit(static_cast<unsigned char>(text[index])) == 0)
        {
            throw std::invalid_argument("Not an integer: '" + text + "'");
        }
    }

    // std::stoll throws std::out_of_range past 64 bits
    return static_cast<std::int64_t>(std::stoll(text.substr(begin, end - begin)));
}

std::int64_t checked_integer(unsigned long long value)
{
    if (value > static_cast<unsigned long long>(std::numeric_limits<std::int64_t>::max()))
    {
        throw std::out_of_range("Integer out of range: " + std::to_string(value));
    }
    return static_cast<std::int64_t>(value);
}

} // namespace

IntegerValue::IntegerValue(unsigned long value) : _value(checked_integer(value))
{
}

IntegerValue::IntegerValue(unsigned long long value) : _value(checked_integer(value))
{
}

std::int64_t IntegerValue::to_integer() const
{
    if (const auto* number = std::get_if<std::int64_t>(&_value))
    {
        return *number;
    }
    return parse_integer(std::get<std::string>(_value));
}

} // namespace indevolt
