#pragma once

#include <strata/config.hpp>
#include <strata/core/int.hpp>

#include <optional>

STRATA_NAMESPACE_BEGIN

// Bridged funds held on the host side, 128 bits wide
template <class Tag>
class Amount128
{
    uint128_t amount_{0};

public:
    constexpr Amount128() = default;

    explicit constexpr Amount128(uint128_t const amount)
        : amount_{amount}
    {
    }

    constexpr uint128_t into_u128() const
    {
        return amount_;
    }

    constexpr bool is_zero() const
    {
        return amount_ == 0;
    }

    constexpr std::optional<Amount128> checked_add(Amount128 const rhs) const
    {
        if (amount_ > UINT128_MAX - rhs.amount_) {
            return std::nullopt;
        }
        return Amount128{amount_ + rhs.amount_};
    }

    constexpr std::optional<Amount128> checked_sub(Amount128 const rhs) const
    {
        if (amount_ < rhs.amount_) {
            return std::nullopt;
        }
        return Amount128{amount_ - rhs.amount_};
    }

    friend constexpr bool
    operator==(Amount128 const &, Amount128 const &) = default;

    friend constexpr bool operator<(Amount128 const &a, Amount128 const &b)
    {
        return a.amount_ < b.amount_;
    }
};

struct BalanceTag;
struct FeeTag;

using Balance = Amount128<BalanceTag>;
using Fee = Amount128<FeeTag>;

STRATA_NAMESPACE_END
