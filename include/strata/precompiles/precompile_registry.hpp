#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/int.hpp>
#include <strata/evm/revision.hpp>
#include <strata/evm/status.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <vector>

STRATA_NAMESPACE_BEGIN

class State;
struct HostContext;

struct PrecompileCall
{
    evm::Revision rev;
    byte_string_view input;
    Address caller;
    Address address;
    uint256_t value;
    bool is_static;
    State &state;
    HostContext const &host;
};

struct PrecompileOutput
{
    evm::Status status;
    byte_string output;
};

// Fixed-address contracts served without running the interpreter. A hit
// charges gas_fn up front; a failing run consumes all forwarded gas.
class PrecompileRegistry
{
public:
    using GasFunction = uint64_t (*)(byte_string_view input, evm::Revision);
    using RunFunction = PrecompileOutput (*)(PrecompileCall const &);

    struct Entry
    {
        char const *name;
        evm::Revision since;
        GasFunction gas;
        RunFunction run;
    };

private:
    ankerl::unordered_dense::map<Address, Entry> entries_{};

public:
    // replaces any entry already at the address
    void add(Address const &, Entry const &);

    // nullptr when nothing is registered or the entry is not active yet
    Entry const *find(Address const &, evm::Revision) const;

    // addresses of the entries active at rev, warm from the start of a
    // transaction under EIP-2929
    std::vector<Address> active_addresses(evm::Revision) const;

    size_t size() const
    {
        return entries_.size();
    }
};

// ecrecover, sha256, ripemd160, identity, modexp, bn254 add/mul/pairing and
// blake2f at 0x01 through 0x09
PrecompileRegistry make_standard_registry();

Address const &exit_to_host_address();
Address const &exit_to_ethereum_address();
Address const &predecessor_account_id_address();
Address const &current_account_id_address();

void register_host_precompiles(PrecompileRegistry &);

// standard and host precompiles together
PrecompileRegistry const &default_registry();

STRATA_NAMESPACE_END
