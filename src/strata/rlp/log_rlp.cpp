#include <strata/core/byte_string.hpp>
#include <strata/core/likely.h>
#include <strata/core/receipt.hpp>
#include <strata/core/result.hpp>
#include <strata/rlp/config.hpp>
#include <strata/rlp/decode.hpp>
#include <strata/rlp/decode_error.hpp>
#include <strata/rlp/encode2.hpp>
#include <strata/rlp/log_rlp.hpp>

#include <boost/outcome/try.hpp>

#include <vector>

STRATA_RLP_NAMESPACE_BEGIN

byte_string encode_log(Log const &log)
{
    std::vector<byte_string> topics;
    topics.reserve(log.topics.size());
    for (auto const &topic : log.topics) {
        topics.emplace_back(encode_bytes32(topic));
    }
    return encode_list2(
        encode_address(log.address),
        encode_list2(topics),
        encode_string2(log.data));
}

Result<Log> decode_log(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));

    Log log;
    BOOST_OUTCOME_TRY(log.address, decode_address(payload));
    BOOST_OUTCOME_TRY(auto topics, parse_list_metadata(payload));
    while (!topics.empty()) {
        BOOST_OUTCOME_TRY(auto const topic, decode_bytes32(topics));
        log.topics.push_back(topic);
    }
    BOOST_OUTCOME_TRY(auto const data, decode_string(payload));
    log.data = data;

    if (STRATA_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }
    return log;
}

STRATA_RLP_NAMESPACE_END
