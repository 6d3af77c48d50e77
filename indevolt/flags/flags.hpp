#pragma once

#include <cstdint>
#include <type_traits>

namespace indevolt
{

/**
 * Bit set indexed by the values of an enum.
 *
 * Not synchronized: the owner guards it with the same mutex that protects the state it describes.
 */
template <typename FlagType>
class Flags
{
    static_assert(std::is_enum<FlagType>::value, "FlagType must be an enum");

public:
    Flags() = default;

    void set_flag(FlagType flag) { _flags |= bit(flag); }

    void clear_flag(FlagType flag) { _flags &= ~bit(flag); }

    bool get_flag(FlagType flag) const { return (_flags & bit(flag)) != 0; }

    /**
     * Check whether any of the given flags is set
     * @param flags Flags to test
     * @return true if at least one of them is set
     */
    template <typename... Rest>
    bool any_of(FlagType flag, Rest... rest) const
    {
        if constexpr (sizeof...(rest) == 0)
        {
            return get_flag(flag);
        }
        else
        {
            return get_flag(flag) || any_of(rest...);
        }
    }

private:
    static std::uint32_t bit(FlagType flag) { return 1U << static_cast<std::uint32_t>(flag); }

    std::uint32_t _flags = 0;
};

} // namespace indevolt
