#pragma once

#include <strata/core/address.hpp>
#include <strata/core/assert.h>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/rlp/config.hpp>

#include <concepts>
#include <vector>

STRATA_RLP_NAMESPACE_BEGIN

inline byte_string const EMPTY_STRING = {0x80};

inline byte_string_view zeroless_view(byte_string_view const string_view)
{
    auto b = string_view.begin();
    auto const e = string_view.end();
    while (b < e && *b == 0) {
        ++b;
    }
    return {b, e};
}

inline byte_string to_big_compact(unsigned_integral auto n)
{
    n = intx::to_big_endian(n);
    return byte_string(
        zeroless_view({reinterpret_cast<unsigned char *>(&n), sizeof(n)}));
}

inline byte_string encode_string2(byte_string_view const string_view)
{
    byte_string result;
    auto const size = string_view.size();
    if (size == 1 && string_view[0] <= 0x7f) {
        result = string_view;
    }
    else if (size > 55) {
        auto const size_str = to_big_compact(size);
        STRATA_ASSERT(size_str.size() <= 8u);
        result.push_back(0xb7 + static_cast<unsigned char>(size_str.size()));
        result += size_str;
        result += string_view;
    }
    else {
        result.push_back(0x80 + static_cast<unsigned char>(size));
        result += string_view;
    }
    return result;
}

inline byte_string encode_unsigned(unsigned_integral auto const n)
{
    return encode_string2(to_big_compact(n));
}

inline byte_string encode_address(Address const &a)
{
    return encode_string2(to_byte_string_view(a));
}

inline byte_string encode_bytes32(bytes32_t const &b)
{
    return encode_string2(to_byte_string_view(b));
}

inline byte_string encode_list_payload(byte_string_view const payload)
{
    byte_string result;
    auto const size = payload.size();
    if (size > 55) {
        auto const size_str = to_big_compact(size);
        STRATA_ASSERT(size_str.size() <= 8u);
        result += (0xf7 + static_cast<unsigned char>(size_str.size()));
        result += size_str;
    }
    else {
        result += (0xc0 + static_cast<unsigned char>(size));
    }
    result += payload;
    return result;
}

template <std::convertible_to<byte_string>... Args>
byte_string encode_list2(Args const &...args)
{
    byte_string payload;
    ([&] { payload += args; }(), ...);
    return encode_list_payload(payload);
}

inline byte_string encode_list2(std::vector<byte_string> const &items)
{
    byte_string payload;
    for (auto const &item : items) {
        payload += item;
    }
    return encode_list_payload(payload);
}

STRATA_RLP_NAMESPACE_END
