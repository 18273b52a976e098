#pragma once

#include <strata/core/address.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/evm/config.hpp>

#include <intx/intx.hpp>

#include <cstddef>

STRATA_EVM_NAMESPACE_BEGIN

constexpr auto stack_limit = 1024ul;

// Top of a frame's word stack, passed by value to every instruction. The
// stack grows upwards and the frame loop has already checked the height the
// instruction needs.
class StackPointer
{
    uint256_t *ptr_;

public:
    explicit StackPointer(uint256_t *const ptr) noexcept
        : ptr_{ptr}
    {
    }

    uint256_t const &pop() noexcept
    {
        return *ptr_--;
    }

    // the low 160 bits of the top word
    Address pop_address() noexcept
    {
        return intx::be::trunc<Address>(pop());
    }

    bytes32_t pop_bytes32() noexcept
    {
        return intx::be::store<bytes32_t>(pop());
    }

    void push(uint256_t const &v) noexcept
    {
        *++ptr_ = v;
    }

    void push_address(Address const &a) noexcept
    {
        push(intx::be::load<uint256_t>(a));
    }

    void push_bytes32(bytes32_t const &b) noexcept
    {
        push(intx::be::load<uint256_t>(b));
    }

    // n-th item from the top, 0 being the top
    uint256_t &at(size_t const n) noexcept
    {
        return *(ptr_ - n);
    }
};

static_assert(sizeof(StackPointer) == 8);
static_assert(alignof(StackPointer) == 8);

STRATA_EVM_NAMESPACE_END
