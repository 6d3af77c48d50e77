#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace indevolt
{

/**
 * @brief A point identifier or register value given either as a number or as its decimal text.
 *
 * Example: IntegerValue("47016").to_integer() == IntegerValue(47016).to_integer()
 */
class IntegerValue
{
public:
    IntegerValue(int value) : _value(static_cast<std::int64_t>(value)) {}
    IntegerValue(long value) : _value(static_cast<std::int64_t>(value)) {}
    IntegerValue(long long value) : _value(static_cast<std::int64_t>(value)) {}
    IntegerValue(unsigned int value) : _value(static_cast<std::int64_t>(value)) {}
    /// @throws std::out_of_range if the value doesn't fit a signed 64-bit integer
    IntegerValue(unsigned long value);
    /// @throws std::out_of_range if the value doesn't fit a signed 64-bit integer
    IntegerValue(unsigned long long value);
    IntegerValue(const char* text) : _value(std::string(text)) {}
    IntegerValue(std::string text) : _value(std::move(text)) {}

    /**
     * @brief Converts to an integer.
     *
     * Text may carry surrounding whitespace and a leading sign, nothing else.
     * @throws std::invalid_argument if the text isn't a decimal integer
     * @throws std::out_of_range if it doesn't fit 64 bits
     */
    std::int64_t to_integer() const;

private:
    std::variant<std::int64_t, std::string> _value;
};

} // namespace indevolt
