#pragma once

#include <strata/core/byte_string.hpp>
#include <strata/core/receipt.hpp>
#include <strata/core/result.hpp>
#include <strata/rlp/config.hpp>

STRATA_RLP_NAMESPACE_BEGIN

// [address, [topics], data]
byte_string encode_log(Log const &);

Result<Log> decode_log(byte_string_view &);

STRATA_RLP_NAMESPACE_END
