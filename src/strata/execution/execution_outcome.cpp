#include <strata/config.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/execution/execution_outcome.hpp>
#include <strata/rlp/encode2.hpp>
#include <strata/rlp/log_rlp.hpp>

#include <cstdint>
#include <utility>
#include <vector>

STRATA_NAMESPACE_BEGIN

byte_string encode_outcome(ExecutionOutcome const &outcome)
{
    std::vector<byte_string> logs;
    logs.reserve(outcome.logs.size());
    for (auto const &log : outcome.logs) {
        logs.emplace_back(rlp::encode_log(log));
    }

    return rlp::encode_list2(
        rlp::encode_unsigned(
            static_cast<uint64_t>(std::to_underlying(outcome.status))),
        rlp::encode_unsigned(outcome.gas_used),
        rlp::encode_string2(outcome.output),
        rlp::encode_list2(logs),
        outcome.created.has_value() ? rlp::encode_address(*outcome.created)
                                    : rlp::EMPTY_STRING);
}

STRATA_NAMESPACE_END
