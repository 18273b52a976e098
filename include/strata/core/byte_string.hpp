#pragma once

#include <strata/config.hpp>

#include <intx/intx.hpp>

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>

STRATA_NAMESPACE_BEGIN

using byte_string = std::basic_string<unsigned char>;

using byte_string_view = std::basic_string_view<unsigned char>;

inline byte_string_view to_byte_string_view(std::string_view const s)
{
    return {reinterpret_cast<unsigned char const *>(s.data()), s.size()};
}

template <size_t N>
constexpr byte_string_view to_byte_string_view(unsigned char const (&a)[N])
{
    return {&a[0], N};
}

inline std::string_view to_string_view(byte_string_view const b)
{
    return {reinterpret_cast<char const *>(b.data()), b.size()};
}

inline byte_string to_big_endian_byte_string(std::unsigned_integral auto num)
{
    num = intx::to_big_endian(num);
    return byte_string{
        reinterpret_cast<byte_string::value_type *>(&num), sizeof(num)};
}

STRATA_NAMESPACE_END
