#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/evm/revision.hpp>
#include <strata/evm/status.hpp>
#include <strata/precompiles/precompile_registry.hpp>

#include <silkpre/precompile.h>

#include <evmc/evmc.h>

#include <cstddef>
#include <cstdint>
#include <cstdlib>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

// silkpre numbers its contracts from address 0x01
template <size_t I>
uint64_t silkpre_gas(byte_string_view const input, evm::Revision const rev)
{
    return kSilkpreContracts[I - 1].gas(
        input.data(), input.size(), static_cast<evmc_revision>(rev));
}

template <size_t I>
PrecompileOutput silkpre_run(PrecompileCall const &call)
{
    auto const output =
        kSilkpreContracts[I - 1].run(call.input.data(), call.input.size());
    if (!output.data) {
        return {.status = evm::Status::PrecompileFailure, .output = {}};
    }
    PrecompileOutput result{
        .status = evm::Status::Success,
        .output = byte_string{output.data, output.size}};
    std::free(output.data);
    return result;
}

template <size_t I>
PrecompileRegistry::Entry
silkpre_entry(char const *const name, evm::Revision const since)
{
    return {
        .name = name,
        .since = since,
        .gas = &silkpre_gas<I>,
        .run = &silkpre_run<I>};
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

PrecompileRegistry make_standard_registry()
{
    using evm::Revision;

    PrecompileRegistry registry;
    registry.add(Address{1}, silkpre_entry<1>("ecrecover", Revision::Frontier));
    registry.add(Address{2}, silkpre_entry<2>("sha256", Revision::Frontier));
    registry.add(Address{3}, silkpre_entry<3>("ripemd160", Revision::Frontier));
    registry.add(Address{4}, silkpre_entry<4>("identity", Revision::Frontier));
    registry.add(Address{5}, silkpre_entry<5>("modexp", Revision::Byzantium));
    registry.add(Address{6}, silkpre_entry<6>("bn254_add", Revision::Byzantium));
    registry.add(Address{7}, silkpre_entry<7>("bn254_mul", Revision::Byzantium));
    registry.add(
        Address{8}, silkpre_entry<8>("bn254_pairing", Revision::Byzantium));
    registry.add(Address{9}, silkpre_entry<9>("blake2f", Revision::Istanbul));
    return registry;
}

STRATA_NAMESPACE_END
