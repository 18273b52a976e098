#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/evm/revision.hpp>
#include <strata/precompiles/precompile_registry.hpp>

#include <vector>

STRATA_NAMESPACE_BEGIN

void PrecompileRegistry::add(Address const &address, Entry const &entry)
{
    entries_.insert_or_assign(address, entry);
}

PrecompileRegistry::Entry const *
PrecompileRegistry::find(Address const &address, evm::Revision const rev) const
{
    auto const it = entries_.find(address);
    if (it == entries_.end() || rev < it->second.since) {
        return nullptr;
    }
    return &it->second;
}

std::vector<Address>
PrecompileRegistry::active_addresses(evm::Revision const rev) const
{
    std::vector<Address> addresses;
    for (auto const &[address, entry] : entries_) {
        if (rev >= entry.since) {
            addresses.push_back(address);
        }
    }
    return addresses;
}

PrecompileRegistry const &default_registry()
{
    static PrecompileRegistry const registry = [] {
        auto r = make_standard_registry();
        register_host_precompiles(r);
        return r;
    }();
    return registry;
}

STRATA_NAMESPACE_END
