#include "indevolt/net/rpc/integer_value.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace indevolt
{

TEST(IntegerValueTest, NumbersPassThrough)
{
    EXPECT_EQ(IntegerValue(47016).to_integer(), 47016);
    EXPECT_EQ(IntegerValue(-5).to_integer(), -5);
    EXPECT_EQ(IntegerValue(4294967296LL).to_integer(), 4294967296LL);
}

TEST(IntegerValueTest, UnsignedNumbersAreAccepted)
{
    EXPECT_EQ(IntegerValue(std::size_t {7101}).to_integer(), 7101);
    EXPECT_EQ(IntegerValue(std::uint64_t {47016}).to_integer(), 47016);
    EXPECT_EQ(IntegerValue(9223372036854775807ULL).to_integer(), std::numeric_limits<std::int64_t>::max());
}

TEST(IntegerValueTest, UnsignedNumbersBeyondSixtyFourBitsAreOutOfRange)
{
    EXPECT_THROW(IntegerValue(std::numeric_limits<std::uint64_t>::max()), std::out_of_range);
    EXPECT_THROW(IntegerValue(9223372036854775808ULL), std::out_of_range);
}

TEST(IntegerValueTest, DecimalTextIsConverted)
{
    EXPECT_EQ(IntegerValue("7101").to_integer(), 7101);
    EXPECT_EQ(IntegerValue(std::string("100")).to_integer(), 100);
    EXPECT_EQ(IntegerValue(" 42\n").to_integer(), 42);
    EXPECT_EQ(IntegerValue("+7").to_integer(), 7);
    EXPECT_EQ(IntegerValue("-700").to_integer(), -700);
}

TEST(IntegerValueTest, OtherTextIsRejected)
{
    EXPECT_THROW(IntegerValue("").to_integer(), std::invalid_argument);
    EXPECT_THROW(IntegerValue("   ").to_integer(), std::invalid_argument);
    EXPECT_THROW(IntegerValue("-").to_integer(), std::invalid_argument);
    EXPECT_THROW(IntegerValue("12a").to_integer(), std::invalid_argument);
    EXPECT_THROW(IntegerValue("4.2").to_integer(), std::invalid_argument);
    EXPECT_THROW(IntegerValue("0x10").to_integer(), std::invalid_argument);
    EXPECT_THROW(IntegerValue("1 2").to_integer(), std::invalid_argument);
}

TEST(IntegerValueTest, TextBeyondSixtyFourBitsIsOutOfRange)
{
    EXPECT_THROW(IntegerValue("99999999999999999999").to_integer(), std::out_of_range);
}

} // namespace indevolt
