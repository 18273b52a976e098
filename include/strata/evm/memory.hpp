#pragma once

#include <strata/core/byte_string.hpp>
#include <strata/core/int.hpp>
#include <strata/evm/config.hpp>
#include <strata/evm/fee_schedule.hpp>

#include <cstddef>
#include <cstdint>

STRATA_EVM_NAMESPACE_BEGIN

enum class Status;

// 9.1. Zero initialized, grows a word at a time and is paid for on growth
class Memory
{
    byte_string bytes_;

public:
    // no gas limit can pay for anything larger
    static constexpr uint64_t max_size = uint64_t{1} << 32;

    // Eqn. 326, C_mem for a memory of the given number of words
    static constexpr uint64_t cost(uint64_t const words) noexcept
    {
        return memory_cost * words + words * words / 512;
    }

    Memory();

    size_t size() const
    {
        return bytes_.size();
    }

    // Makes [offset, offset + size) addressable, charging the growth to
    // gas_left. An empty range never grows memory.
    Status
    expand(uint64_t &gas_left, uint256_t const &offset, uint256_t const &size);

    // the range must already be addressable
    byte_string_view read(size_t offset, size_t size) const;
    void write(size_t offset, size_t size, byte_string_view);

    // writes src[src_offset, src_offset + size) padding with zeros past the
    // end of src
    void write_padded(
        size_t offset, size_t size, byte_string_view src,
        uint256_t const &src_offset);
};

STRATA_EVM_NAMESPACE_END
