#pragma once

#include <strata/core/address.hpp>
#include <strata/core/assert.h>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/core/likely.h>
#include <strata/core/result.hpp>
#include <strata/rlp/config.hpp>
#include <strata/rlp/decode_error.hpp>

#include <boost/outcome/try.hpp>

#include <cstring>
#include <optional>

STRATA_RLP_NAMESPACE_BEGIN

template <unsigned_integral T>
constexpr Result<T> decode_raw_num(byte_string_view const enc)
{
    if (STRATA_UNLIKELY(enc.size() > sizeof(T))) {
        return DecodeError::Overflow;
    }

    if (enc.empty()) {
        return T{0};
    }

    if (enc[0] == 0) {
        return DecodeError::LeadingZero;
    }

    T result{};
    std::memcpy(
        &intx::as_bytes(result)[sizeof(T) - enc.size()],
        enc.data(),
        enc.size());
    result = intx::to_big_endian(result);
    return result;
}

constexpr Result<size_t> decode_length(byte_string_view const enc)
{
    return decode_raw_num<size_t>(enc);
}

constexpr Result<byte_string_view> parse_string_metadata(byte_string_view &enc)
{
    size_t i = 0;
    size_t end = 0;

    if (STRATA_UNLIKELY(enc.empty())) {
        return DecodeError::InputTooShort;
    }

    if (STRATA_UNLIKELY(enc[0] >= 0xc0)) {
        return DecodeError::TypeUnexpected;
    }

    if (enc[0] < 0x80) // [0x00, 0x7f]
    {
        end = i + 1;
    }
    else if (enc[0] < 0xb8) // [0x80, 0xb7]
    {
        ++i;
        uint8_t const length = enc[0] - 0x80;
        end = i + length;
    }
    else // [0xb8, 0xbf]
    {
        ++i;
        uint8_t const length_of_length = enc[0] - 0xb7;

        if (STRATA_UNLIKELY(i + length_of_length >= enc.size())) {
            return DecodeError::InputTooShort;
        }

        BOOST_OUTCOME_TRY(
            auto const length, decode_length(enc.substr(i, length_of_length)));
        i += length_of_length;
        end = i + length;
    }

    if (STRATA_UNLIKELY(end > enc.size() || end < i)) {
        return DecodeError::InputTooShort;
    }

    auto const payload = enc.substr(i, end - i);
    enc = enc.substr(end);
    return payload;
}

constexpr Result<byte_string_view> parse_list_metadata(byte_string_view &enc)
{
    size_t i = 0;
    size_t length;
    ++i;

    if (STRATA_UNLIKELY(enc.empty())) {
        return DecodeError::InputTooShort;
    }

    if (STRATA_UNLIKELY(enc[0] < 0xc0)) {
        return DecodeError::TypeUnexpected;
    }

    if (enc[0] < 0xf8) {
        length = enc[0] - 0xc0;
    }
    else {
        size_t const length_of_length = enc[0] - 0xf7;

        if (STRATA_UNLIKELY(i + length_of_length >= enc.size())) {
            return DecodeError::InputTooShort;
        }

        BOOST_OUTCOME_TRY(
            length, decode_length(enc.substr(i, length_of_length)));
        i += length_of_length;
    }
    auto const end = i + length;

    if (STRATA_UNLIKELY(end > enc.size() || end < i)) {
        return DecodeError::InputTooShort;
    }

    auto const payload = enc.substr(i, end - i);
    enc = enc.substr(end);
    return payload;
}

constexpr Result<byte_string_view> decode_string(byte_string_view &enc)
{
    return parse_string_metadata(enc);
}

template <unsigned_integral T>
constexpr Result<T> decode_unsigned(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const payload, parse_string_metadata(enc));
    return decode_raw_num<T>(payload);
}

inline Result<Address> decode_address(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const payload, parse_string_metadata(enc));
    if (STRATA_UNLIKELY(payload.size() != sizeof(Address))) {
        return DecodeError::ArrayLengthUnexpected;
    }
    Address address;
    std::memcpy(address.bytes, payload.data(), sizeof(Address));
    return address;
}

// an empty string decodes to no address, used for contract creation
inline Result<std::optional<Address>>
decode_optional_address(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const payload, parse_string_metadata(enc));
    if (payload.empty()) {
        return std::optional<Address>{};
    }
    if (STRATA_UNLIKELY(payload.size() != sizeof(Address))) {
        return DecodeError::ArrayLengthUnexpected;
    }
    Address address;
    std::memcpy(address.bytes, payload.data(), sizeof(Address));
    return std::optional<Address>{address};
}

inline Result<bytes32_t> decode_bytes32(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const payload, parse_string_metadata(enc));
    if (STRATA_UNLIKELY(payload.size() != sizeof(bytes32_t))) {
        return DecodeError::ArrayLengthUnexpected;
    }
    bytes32_t result;
    std::memcpy(result.bytes, payload.data(), sizeof(bytes32_t));
    return result;
}

STRATA_RLP_NAMESPACE_END
