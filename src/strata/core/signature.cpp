#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/core/signature.hpp>

#include <silkpre/ecdsa.h>

#include <intx/intx.hpp>

#include <secp256k1.h>

#include <cstdint>
#include <memory>
#include <optional>

STRATA_NAMESPACE_BEGIN

uint256_t get_v(SignatureAndChain const &sc) noexcept
{
    if (sc.chain_id.has_value()) {
        return (*sc.chain_id * 2) + 35 + (sc.odd_y_parity ? 1 : 0);
    }
    return sc.odd_y_parity ? 28 : 27;
}

bool SignatureAndChain::from_v(uint256_t const &v)
{
    if (v == 28) {
        odd_y_parity = true;
        chain_id.reset();
    }
    else if (v == 27) {
        odd_y_parity = false;
        chain_id.reset();
    }
    else if (v >= 35) {
        auto const tmp = v - 35;
        odd_y_parity = (tmp & 1) != 0;
        chain_id = tmp >> 1;
    }
    else {
        return false;
    }
    return true;
}

std::optional<Address>
recover_address(bytes32_t const &hash, SignatureAndChain const &sc)
{
    uint8_t signature[sizeof(sc.r) * 2];
    intx::be::unsafe::store(signature, sc.r);
    intx::be::unsafe::store(signature + sizeof(sc.r), sc.s);

    thread_local std::unique_ptr<
        secp256k1_context,
        decltype(&secp256k1_context_destroy)> const
        context(
            secp256k1_context_create(SILKPRE_SECP256K1_CONTEXT_FLAGS),
            &secp256k1_context_destroy);

    Address result{};
    if (!silkpre_recover_address(
            result.bytes,
            hash.bytes,
            signature,
            sc.odd_y_parity,
            context.get())) {
        return std::nullopt;
    }
    return result;
}

STRATA_NAMESPACE_END
