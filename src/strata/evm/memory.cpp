#include <strata/core/assert.h>
#include <strata/evm/config.hpp>
#include <strata/evm/fee_schedule.hpp>
#include <strata/evm/memory.hpp>
#include <strata/evm/status.hpp>

#include <algorithm>
#include <cstdint>

STRATA_EVM_NAMESPACE_BEGIN

Memory::Memory()
{
    bytes_.reserve(128 * word_size);
}

Status Memory::expand(
    uint64_t &gas_left, uint256_t const &offset, uint256_t const &size)
{
    if (size == 0) {
        return Status::Success;
    }
    if (offset >= max_size || size >= max_size ||
        offset + size > max_size) {
        return Status::OutOfGas;
    }

    auto const end = static_cast<uint64_t>(offset + size);
    if (end <= bytes_.size()) {
        return Status::Success;
    }

    auto const words = round_up_bytes_to_words(end);
    auto const charge = cost(words) - cost(bytes_.size() / word_size);
    if (charge > gas_left) {
        return Status::OutOfGas;
    }
    gas_left -= charge;
    bytes_.resize(words * word_size, 0);
    return Status::Success;
}

byte_string_view Memory::read(size_t const offset, size_t const size) const
{
    STRATA_ASSERT(offset + size <= bytes_.size());
    return byte_string_view{bytes_}.substr(offset, size);
}

void Memory::write(
    size_t const offset, size_t const size, byte_string_view const data)
{
    STRATA_ASSERT(size <= data.size());
    STRATA_ASSERT(offset + size <= bytes_.size());
    std::copy_n(data.data(), size, bytes_.data() + offset);
}

void Memory::write_padded(
    size_t const offset, size_t const size, byte_string_view const src,
    uint256_t const &src_offset)
{
    STRATA_ASSERT(offset + size <= bytes_.size());

    size_t copied = 0;
    if (src_offset < src.size()) {
        auto const begin = static_cast<size_t>(src_offset);
        copied = std::min(size, src.size() - begin);
        std::copy_n(src.data() + begin, copied, bytes_.data() + offset);
    }
    std::fill_n(bytes_.data() + offset + copied, size - copied, 0);
}

STRATA_EVM_NAMESPACE_END
