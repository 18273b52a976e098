#include <strata/core/byte_string.hpp>
#include <strata/core/int.hpp>
#include <strata/core/likely.h>
#include <strata/core/result.hpp>
#include <strata/engine/engine_error.hpp>
#include <strata/engine/engine_state.hpp>
#include <strata/rlp/decode.hpp>
#include <strata/rlp/decode_error.hpp>
#include <strata/rlp/encode2.hpp>
#include <strata/state/keys.hpp>
#include <strata/state/state.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>

STRATA_NAMESPACE_BEGIN

byte_string encode_engine_state(EngineState const &state)
{
    return rlp::encode_list2(
        rlp::encode_unsigned(state.chain_id),
        rlp::encode_string2(to_byte_string_view(state.owner_id)),
        rlp::encode_string2(to_byte_string_view(state.bridge_provider_id)),
        rlp::encode_unsigned(state.upgrade_delay_blocks));
}

Result<EngineState> decode_engine_state(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto payload, rlp::parse_list_metadata(enc));

    EngineState state;
    BOOST_OUTCOME_TRY(
        state.chain_id, rlp::decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(auto const owner, rlp::decode_string(payload));
    state.owner_id = to_string_view(owner);
    BOOST_OUTCOME_TRY(auto const provider, rlp::decode_string(payload));
    state.bridge_provider_id = to_string_view(provider);
    BOOST_OUTCOME_TRY(
        state.upgrade_delay_blocks, rlp::decode_unsigned<uint64_t>(payload));

    if (STRATA_UNLIKELY(!payload.empty())) {
        return rlp::DecodeError::InputTooLong;
    }
    return state;
}

Result<EngineState> load_engine_state(State &state)
{
    auto const value = state.read_raw(config_key(engine_state_key));
    if (!value.has_value()) {
        return EngineError::NotInitialized;
    }
    byte_string_view enc{*value};
    return decode_engine_state(enc);
}

void save_engine_state(State &state, EngineState const &engine_state)
{
    state.write_raw(
        config_key(engine_state_key), encode_engine_state(engine_state));
}

STRATA_NAMESPACE_END
