#include <strata/core/account_id.hpp>
#include <strata/core/address.hpp>
#include <strata/core/balance.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/core/keccak.hpp>
#include <strata/core/signature.hpp>
#include <strata/core/wei.hpp>

#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <string_view>

using namespace strata;
using namespace intx::literals;

TEST(AccountId, valid)
{
    EXPECT_TRUE(is_valid_account_id("ab"));
    EXPECT_TRUE(is_valid_account_id("alice.near"));
    EXPECT_TRUE(is_valid_account_id("a-b_c.d0"));
    EXPECT_TRUE(is_valid_account_id(std::string(64, 'a')));
}

TEST(AccountId, invalid)
{
    EXPECT_FALSE(is_valid_account_id(""));
    EXPECT_FALSE(is_valid_account_id("a"));
    EXPECT_FALSE(is_valid_account_id(std::string(65, 'a')));
    EXPECT_FALSE(is_valid_account_id("Alice"));
    EXPECT_FALSE(is_valid_account_id(".alice"));
    EXPECT_FALSE(is_valid_account_id("alice."));
    EXPECT_FALSE(is_valid_account_id("al..ice"));
    EXPECT_FALSE(is_valid_account_id("al-_ice"));
    EXPECT_FALSE(is_valid_account_id("al ice"));
    EXPECT_FALSE(is_valid_account_id("alice:near"));
}

TEST(Address, host_account)
{
    auto const hash = keccak256(std::string_view{"alice.near"});
    auto const address = host_account_to_address("alice.near");
    EXPECT_EQ(
        to_byte_string_view(address),
        byte_string_view(hash.bytes + 12, 20));
    EXPECT_NE(address, host_account_to_address("bob.near"));
}

TEST(Keccak, empty)
{
    EXPECT_EQ(to_bytes(keccak256(byte_string_view{})), NULL_HASH);
}

TEST(Wei, arithmetic)
{
    auto const max = Wei{std::numeric_limits<uint256_t>::max()};
    EXPECT_FALSE(max.checked_add(Wei::from_u64(1)).has_value());
    EXPECT_EQ(
        Wei::from_u64(2).checked_add(Wei::from_u64(3)), Wei::from_u64(5));
    EXPECT_FALSE(Wei::from_u64(2).checked_sub(Wei::from_u64(3)).has_value());
    EXPECT_EQ(
        Wei::from_u64(3).checked_sub(Wei::from_u64(3)), Wei::zero());

    EXPECT_EQ(Wei::from_eth(2), Wei{2'000'000'000'000'000'000_u256});
    EXPECT_EQ(Wei::from_eth(0), Wei::zero());
    EXPECT_FALSE(Wei::from_eth(std::numeric_limits<uint256_t>::max() / 1000)
                     .has_value());
}

TEST(Wei, into_u128)
{
    EXPECT_EQ(Wei::from_u64(7).try_into_u128(), uint128_t{7});
    EXPECT_EQ(Wei{uint256_t{UINT128_MAX}}.try_into_u128(), UINT128_MAX);
    EXPECT_FALSE(
        Wei{uint256_t{UINT128_MAX} + 1}.try_into_u128().has_value());
}

TEST(Balance, checked)
{
    EXPECT_EQ(Balance{1}.checked_add(Balance{2}), Balance{3});
    EXPECT_FALSE(Balance{UINT128_MAX}.checked_add(Balance{1}).has_value());
    EXPECT_EQ(Balance{3}.checked_sub(Balance{3}), Balance{});
    EXPECT_FALSE(Balance{2}.checked_sub(Balance{3}).has_value());
    EXPECT_TRUE(Balance{}.is_zero());
    EXPECT_TRUE(Fee{1} < Fee{2});
}

TEST(Signature, v)
{
    SignatureAndChain sc;
    EXPECT_TRUE(sc.from_v(27));
    EXPECT_FALSE(sc.odd_y_parity);
    EXPECT_FALSE(sc.chain_id.has_value());
    EXPECT_EQ(get_v(sc), 27);

    EXPECT_TRUE(sc.from_v(28));
    EXPECT_TRUE(sc.odd_y_parity);
    EXPECT_EQ(get_v(sc), 28);

    EXPECT_TRUE(sc.from_v(37));
    EXPECT_FALSE(sc.odd_y_parity);
    ASSERT_TRUE(sc.chain_id.has_value());
    EXPECT_EQ(*sc.chain_id, 1);
    EXPECT_EQ(get_v(sc), 37);

    EXPECT_TRUE(sc.from_v(2'626'323'144));
    EXPECT_TRUE(sc.odd_y_parity);
    EXPECT_EQ(*sc.chain_id, 1'313'161'554);

    EXPECT_FALSE(sc.from_v(0));
    EXPECT_FALSE(sc.from_v(29));
    EXPECT_FALSE(sc.from_v(34));
}

TEST(Signature, recover)
{
    // EIP-155 example transaction
    SignatureAndChain sc{
        .r = 0x28ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276_u256,
        .s = 0x67cbe9d8997f761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83_u256,
        .chain_id = 1,
        .odd_y_parity = false};
    auto const hash =
        0xdaf5a779ae972f972197303d7b574746c7ef83eadac0f2791ad23db92e4c8e53_bytes32;

    auto const sender = recover_address(hash, sc);
    ASSERT_TRUE(sender.has_value());
    EXPECT_EQ(*sender, 0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f_address);

    sc.s = 0;
    EXPECT_FALSE(recover_address(hash, sc).has_value());
}
