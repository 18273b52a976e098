#include <strata/core/assert.h>
#include <strata/core/byte_string.hpp>
#include <strata/core/result.hpp>
#include <strata/engine/engine_error.hpp>
#include <strata/engine/upgrade.hpp>
#include <strata/rlp/decode.hpp>
#include <strata/rlp/encode2.hpp>
#include <strata/state/keys.hpp>
#include <strata/state/state.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <optional>

STRATA_NAMESPACE_BEGIN

uint64_t get_upgrade_index(State &state)
{
    auto const value = state.read_raw(config_key(upgrade_index_key));
    if (!value.has_value()) {
        return no_pending_upgrade;
    }
    byte_string_view enc{*value};
    auto const index = rlp::decode_unsigned<uint64_t>(enc);
    STRATA_ASSERT(index.has_value() && enc.empty());
    return index.value();
}

void stage_upgrade(
    State &state, byte_string_view const code, uint64_t const unlock_index)
{
    state.write_raw(config_key(upgrade_code_key), code);
    state.write_raw(
        config_key(upgrade_index_key), rlp::encode_unsigned(unlock_index));
    LOG_INFO(
        "staged upgrade of {} bytes, unlocks at block {}",
        code.size(),
        unlock_index);
}

Result<void> deploy_upgrade(State &state, uint64_t const block_index)
{
    auto const code = state.read_raw(config_key(upgrade_code_key));
    if (!code.has_value()) {
        return EngineError::NoPendingUpgrade;
    }
    auto const unlock_index = get_upgrade_index(state);
    if (block_index < unlock_index) {
        return EngineError::NotReady;
    }
    state.write_raw(config_key(engine_code_key), *code);
    state.remove_raw(config_key(upgrade_code_key));
    state.remove_raw(config_key(upgrade_index_key));
    LOG_INFO(
        "deployed upgrade of {} bytes at block {}", code->size(), block_index);
    return outcome::success();
}

std::optional<byte_string> get_engine_code(State &state)
{
    return state.read_raw(config_key(engine_code_key));
}

STRATA_NAMESPACE_END
