#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/core/receipt.hpp>
#include <strata/core/transaction.hpp>
#include <strata/rlp/decode.hpp>
#include <strata/rlp/decode_error.hpp>
#include <strata/rlp/encode2.hpp>
#include <strata/rlp/log_rlp.hpp>
#include <strata/rlp/transaction_rlp.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using namespace strata;
using namespace strata::rlp;

namespace
{
    constexpr auto a = 0x5353535353535353535353535353535353535353_address;
    constexpr auto topic1 =
        0x1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c_bytes32;
    constexpr auto topic2 =
        0x00000000000000000000000000000000000000000000000000000000cafebabe_bytes32;
}

TEST(Rlp, DecodeUnsigned)
{
    auto res = decode_length(byte_string({0x0f}));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.assume_value(), 15);
    res = decode_length(byte_string({0x04, 0x00}));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.assume_value(), 1024);
    res = decode_length(byte_string({0xff, 0xff}));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.assume_value(), 65535);

    res = decode_length(byte_string({0x00, 0x01}));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DecodeError::LeadingZero);

    auto const overflow = decode_raw_num<uint8_t>(byte_string({0x01, 0x00}));
    ASSERT_TRUE(overflow.has_error());
    EXPECT_EQ(overflow.assume_error(), DecodeError::Overflow);
}

TEST(Rlp, EncodeString)
{
    EXPECT_EQ(encode_string2(byte_string{}), byte_string({0x80}));
    EXPECT_EQ(encode_string2(byte_string({0x7f})), byte_string({0x7f}));
    EXPECT_EQ(encode_string2(byte_string({0x80})), byte_string({0x81, 0x80}));

    std::string const long_string =
        "Lorem ipsum dolor sit amet, consectetur adipisicing elit";
    auto const encoding = encode_string2(to_byte_string_view(long_string));
    ASSERT_EQ(encoding.size(), long_string.size() + 2);
    EXPECT_EQ(encoding[0], 0xb8);
    EXPECT_EQ(encoding[1], long_string.size());

    byte_string_view enc{encoding};
    auto const decoded = decode_string(enc);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(to_string_view(decoded.assume_value()), long_string);
    EXPECT_TRUE(enc.empty());
}

TEST(Rlp, EncodeUnsigned)
{
    EXPECT_EQ(encode_unsigned(0u), byte_string({0x80}));
    EXPECT_EQ(encode_unsigned(15u), byte_string({0x0f}));
    EXPECT_EQ(encode_unsigned(1024u), byte_string({0x82, 0x04, 0x00}));

    uint256_t const big{0x0102030405060708ull};
    auto const encoding = encode_unsigned(big);
    byte_string_view enc{encoding};
    auto const decoded = decode_unsigned<uint256_t>(enc);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.assume_value(), big);
}

TEST(Rlp, DecodeListErrors)
{
    {
        byte_string const truncated{0xc3, 0x01, 0x02};
        byte_string_view enc{truncated};
        auto const res = parse_list_metadata(enc);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::InputTooShort);
    }
    {
        byte_string const not_a_list{0x83, 0x01, 0x02, 0x03};
        byte_string_view enc{not_a_list};
        auto const res = parse_list_metadata(enc);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::TypeUnexpected);
    }
    {
        byte_string const short_address{0x82, 0x01, 0x02};
        byte_string_view enc{short_address};
        auto const res = decode_address(enc);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::ArrayLengthUnexpected);
    }
}

TEST(Rlp, Log)
{
    Log const log{
        .data = byte_string({0xde, 0xad, 0xbe, 0xef}),
        .topics = {topic1, topic2},
        .address = a};

    auto const encoding = encode_log(log);
    byte_string_view enc{encoding};
    auto const decoded = decode_log(enc);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.assume_value(), log);
    EXPECT_TRUE(enc.empty());

    auto const trailing = encode_list_payload(
        encode_address(a) + encode_list2(encode_bytes32(topic1)) +
        encode_string2(log.data) + encode_unsigned(1u));
    byte_string_view trailing_enc{trailing};
    auto const rejected = decode_log(trailing_enc);
    ASSERT_TRUE(rejected.has_error());
    EXPECT_EQ(rejected.assume_error(), DecodeError::InputTooLong);
}

// https://eips.ethereum.org/EIPS/eip-155
TEST(Rlp, Eip155SigningPayload)
{
    Transaction tx{
        .sc = {.chain_id = 1},
        .nonce = 9,
        .gas_price = 20'000'000'000,
        .gas_limit = 21'000,
        .to = 0x3535353535353535353535353535353535353535_address,
        .value = uint256_t{1'000'000'000'000'000'000ull},
        .data = {}};

    auto const encoding = encode_transaction_for_signing(tx);
    auto const expected = evmc::from_hex(
        "ec098504a817c800825208943535353535353535353535353535353535353535880d"
        "e0b6b3a764000080018080");
    ASSERT_TRUE(expected.has_value());
    EXPECT_EQ(encoding, *expected);
}

TEST(Rlp, DecodeTransaction)
{
    Transaction tx{
        .sc = {.r = 0x1234, .s = 0x5678, .chain_id = 1, .odd_y_parity = true},
        .nonce = 3,
        .gas_price = 10,
        .gas_limit = 100'000,
        .to = std::nullopt,
        .value = 7,
        .data = byte_string({0x60, 0x00})};

    auto const encoding = encode_transaction(tx);
    byte_string_view enc{encoding};
    auto const decoded = decode_transaction(enc);
    ASSERT_TRUE(decoded.has_value());
    auto const &result = decoded.assume_value();
    EXPECT_EQ(result.nonce, 3);
    EXPECT_EQ(result.gas_limit, 100'000);
    EXPECT_FALSE(result.to.has_value());
    EXPECT_EQ(result.value, 7);
    EXPECT_EQ(result.data, tx.data);
    EXPECT_EQ(result.sc.chain_id, uint256_t{1});
    EXPECT_TRUE(result.sc.odd_y_parity);
    EXPECT_EQ(result.sc.r, 0x1234);
    EXPECT_EQ(result.sc.s, 0x5678);
}

TEST(Rlp, DecodeTransactionBadV)
{
    auto const encoding = encode_list2(
        encode_unsigned(0u),
        encode_unsigned(0u),
        encode_unsigned(21'000u),
        EMPTY_STRING,
        encode_unsigned(0u),
        EMPTY_STRING,
        encode_unsigned(30u),
        encode_unsigned(1u),
        encode_unsigned(1u));
    byte_string_view enc{encoding};
    auto const decoded = decode_transaction(enc);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.assume_error(), DecodeError::TypeUnexpected);
}
