#include <strata/core/int.hpp>
#include <strata/core/wei.hpp>

#include <optional>

STRATA_NAMESPACE_BEGIN

std::optional<Wei> Wei::from_eth(uint256_t const &amount)
{
    if (amount != 0 && amount > UINT256_MAX / eth_to_wei) {
        return std::nullopt;
    }
    return Wei{amount * eth_to_wei};
}

std::optional<Wei> Wei::checked_add(Wei const &rhs) const
{
    auto const [sum, carry] = intx::addc(amount_, rhs.amount_);
    if (carry) {
        return std::nullopt;
    }
    return Wei{sum};
}

std::optional<Wei> Wei::checked_sub(Wei const &rhs) const
{
    if (amount_ < rhs.amount_) {
        return std::nullopt;
    }
    return Wei{amount_ - rhs.amount_};
}

std::optional<uint128_t> Wei::try_into_u128() const
{
    if (amount_ > uint256_t{UINT128_MAX}) {
        return std::nullopt;
    }
    return static_cast<uint128_t>(amount_);
}

STRATA_NAMESPACE_END
