#include <strata/config.hpp>
#include <strata/core/assert.h>
#include <strata/core/transaction.hpp>
#include <strata/evm/fee_schedule.hpp>
#include <strata/evm/revision.hpp>
#include <strata/execution/transaction_gas.hpp>

#include <algorithm>
#include <cstdint>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

constexpr uint64_t tx_cost = 21'000;
constexpr uint64_t tx_create_cost = 32'000;
constexpr uint64_t tx_data_zero_cost = 4;

template <evm::Revision rev>
constexpr uint64_t tx_data_non_zero_cost()
{
    // EIP-2028
    if constexpr (rev < evm::Revision::Istanbul) {
        return 68;
    }
    else {
        return 16;
    }
}

template <evm::Revision rev>
uint64_t g_data(Transaction const &tx) noexcept
{
    auto const zeros = static_cast<uint64_t>(
        std::count(tx.data.begin(), tx.data.end(), 0));
    auto const non_zeros = tx.data.size() - zeros;
    return zeros * tx_data_zero_cost + non_zeros * tx_data_non_zero_cost<rev>();
}

template <evm::Revision rev>
uint64_t intrinsic_gas(Transaction const &tx) noexcept
{
    uint64_t gas = tx_cost + g_data<rev>(tx);
    if (!tx.to.has_value()) {
        // EIP-2
        if constexpr (rev >= evm::Revision::Homestead) {
            gas += tx_create_cost;
        }
        // EIP-3860
        if constexpr (rev >= evm::Revision::Shanghai) {
            gas += evm::round_up_bytes_to_words(tx.data.size()) *
                   evm::initcode_word_cost;
        }
    }
    return gas;
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

// YP Eqn. 60
uint64_t intrinsic_gas(evm::Revision const rev, Transaction const &tx) noexcept
{
    switch (rev) {
    case evm::Revision::Frontier:
        return intrinsic_gas<evm::Revision::Frontier>(tx);
    case evm::Revision::Homestead:
        return intrinsic_gas<evm::Revision::Homestead>(tx);
    case evm::Revision::TangerineWhistle:
        return intrinsic_gas<evm::Revision::TangerineWhistle>(tx);
    case evm::Revision::SpuriousDragon:
        return intrinsic_gas<evm::Revision::SpuriousDragon>(tx);
    case evm::Revision::Byzantium:
        return intrinsic_gas<evm::Revision::Byzantium>(tx);
    case evm::Revision::Constantinople:
        return intrinsic_gas<evm::Revision::Constantinople>(tx);
    case evm::Revision::Petersburg:
        return intrinsic_gas<evm::Revision::Petersburg>(tx);
    case evm::Revision::Istanbul:
        return intrinsic_gas<evm::Revision::Istanbul>(tx);
    case evm::Revision::Berlin:
        return intrinsic_gas<evm::Revision::Berlin>(tx);
    case evm::Revision::London:
        return intrinsic_gas<evm::Revision::London>(tx);
    case evm::Revision::Paris:
        return intrinsic_gas<evm::Revision::Paris>(tx);
    case evm::Revision::Shanghai:
        return intrinsic_gas<evm::Revision::Shanghai>(tx);
    }
    STRATA_ABORT("unknown revision");
}

STRATA_NAMESPACE_END
