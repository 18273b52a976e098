#include <strata/bridge/deposit.hpp>
#include <strata/bridge/erc20.hpp>
#include <strata/bridge/deposit_error.hpp>
#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/core/keccak.hpp>
#include <strata/core/receipt.hpp>
#include <strata/core/transaction.hpp>
#include <strata/engine/args.hpp>
#include <strata/engine/engine.hpp>
#include <strata/engine/engine_error.hpp>
#include <strata/engine/engine_state.hpp>
#include <strata/engine/meta_call.hpp>
#include <strata/engine/upgrade.hpp>
#include <strata/evm/revision.hpp>
#include <strata/evm/status.hpp>
#include <strata/execution/create_contract_address.hpp>
#include <strata/host/host_context.hpp>
#include <strata/host/in_memory_host_store.hpp>
#include <strata/rlp/decode.hpp>
#include <strata/rlp/decode_error.hpp>
#include <strata/rlp/log_rlp.hpp>
#include <strata/rlp/transaction_rlp.hpp>
#include <strata/state/state.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

using namespace strata;

namespace
{
    constexpr uint64_t chain_id = 1313161554;
    constexpr std::string_view engine_id = "engine.near";
    constexpr std::string_view owner_id = "owner.near";
    constexpr std::string_view bridge_id = "bridge.near";

    // EIP-155 example key
    constexpr auto key1 =
        0x4646464646464646464646464646464646464646464646464646464646464646_bytes32;
    constexpr auto key2 =
        0x0101010101010101010101010101010101010101010101010101010101010101_bytes32;

    byte_string from_hex(std::string_view const hex)
    {
        return evmc::from_hex(hex).value();
    }

    auto const secp256k1n = intx::from_string<uint256_t>(
        "0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141");

    // first input byte 0x01 increments slot 0, anything else decrements it
    auto const counter_code = from_hex(
        "60003560f81c600114601657600160005403600055005b6001600054016000550"
        "0");

    // copies the 0x21 byte counter runtime after it and returns it
    auto const counter_init = from_hex("6021600c60003960216000f3") + counter_code;

    // sstore(0, 1) then revert
    auto const revert_code = from_hex("600160005560006000fd");

    // returns the block number as a word
    auto const number_code = from_hex("4360005260206000f3");

    bytes32_t slot(uint64_t const n)
    {
        return intx::be::store<bytes32_t>(uint256_t{n});
    }

    byte_string address_bytes(Address const &address)
    {
        return byte_string{to_byte_string_view(address)};
    }

    class Signer
    {
        std::unique_ptr<secp256k1_context, decltype(&secp256k1_context_destroy)>
            context_{
                secp256k1_context_create(SECP256K1_CONTEXT_SIGN),
                &secp256k1_context_destroy};
        bytes32_t key_;

    public:
        explicit Signer(bytes32_t const &key)
            : key_{key}
        {
        }

        Address address() const
        {
            secp256k1_pubkey pubkey;
            EXPECT_EQ(
                secp256k1_ec_pubkey_create(context_.get(), &pubkey, key_.bytes),
                1);
            unsigned char serialized[65];
            size_t size = sizeof(serialized);
            secp256k1_ec_pubkey_serialize(
                context_.get(),
                serialized,
                &size,
                &pubkey,
                SECP256K1_EC_UNCOMPRESSED);
            auto const hash =
                keccak256(byte_string_view{serialized + 1, size - 1});
            Address result;
            std::memcpy(result.bytes, hash.bytes + 12, sizeof(Address));
            return result;
        }

        // r, s and the recovery id
        std::tuple<uint256_t, uint256_t, int> sign(bytes32_t const &hash) const
        {
            secp256k1_ecdsa_recoverable_signature signature;
            EXPECT_EQ(
                secp256k1_ecdsa_sign_recoverable(
                    context_.get(),
                    &signature,
                    hash.bytes,
                    key_.bytes,
                    nullptr,
                    nullptr),
                1);
            unsigned char compact[64];
            int recid = 0;
            secp256k1_ecdsa_recoverable_signature_serialize_compact(
                context_.get(), compact, &recid, &signature);
            return {
                intx::be::unsafe::load<uint256_t>(compact),
                intx::be::unsafe::load<uint256_t>(compact + 32),
                recid};
        }

        byte_string sign_transaction(Transaction tx) const
        {
            auto const hash =
                to_bytes(keccak256(rlp::encode_transaction_for_signing(tx)));
            auto const [r, s, recid] = sign(hash);
            tx.sc.r = r;
            tx.sc.s = s;
            tx.sc.odd_y_parity = recid == 1;
            return rlp::encode_transaction(tx);
        }

        // the same signature with s mirrored into the upper half
        byte_string sign_transaction_high_s(Transaction tx) const
        {
            auto const hash =
                to_bytes(keccak256(rlp::encode_transaction_for_signing(tx)));
            auto const [r, s, recid] = sign(hash);
            tx.sc.r = r;
            tx.sc.s = secp256k1n - s;
            tx.sc.odd_y_parity = recid != 1;
            return rlp::encode_transaction(tx);
        }

        byte_string sign_meta_call(MetaCallArgs args) const
        {
            auto const hash = meta_call_message(args);
            auto const [r, s, recid] = sign(hash);
            args.r = r;
            args.s = s;
            args.v = 27 + recid;
            return encode_meta_call_args(args);
        }
    };

    struct Outcome
    {
        evm::Status status;
        uint64_t gas_used;
        byte_string output;
        size_t logs;
        std::optional<Address> created;
    };

    Outcome decode_outcome(byte_string_view enc)
    {
        auto payload = rlp::parse_list_metadata(enc).value();
        Outcome outcome{};
        outcome.status = static_cast<evm::Status>(
            rlp::decode_unsigned<uint64_t>(payload).value());
        outcome.gas_used = rlp::decode_unsigned<uint64_t>(payload).value();
        outcome.output = byte_string{rlp::decode_string(payload).value()};
        auto logs = rlp::parse_list_metadata(payload).value();
        while (!logs.empty()) {
            EXPECT_TRUE(rlp::decode_log(logs).has_value());
            ++outcome.logs;
        }
        auto const created = rlp::decode_string(payload).value();
        if (!created.empty()) {
            Address address;
            std::memcpy(address.bytes, created.data(), sizeof(Address));
            outcome.created = address;
        }
        EXPECT_TRUE(payload.empty());
        EXPECT_TRUE(enc.empty());
        return outcome;
    }

    bytes32_t address_topic(Address const &address)
    {
        bytes32_t topic{};
        std::memcpy(topic.bytes + 12, address.bytes, sizeof(Address));
        return topic;
    }

    byte_string word(uint256_t const &n)
    {
        return byte_string{to_byte_string_view(intx::be::store<bytes32_t>(n))};
    }

    // RLP Deposited(address,string,uint256,uint256) log
    byte_string deposit_args(
        std::string_view const recipient, uint256_t const &amount,
        uint256_t const &fee)
    {
        Log log{
            .data = word(3 * 32) + word(amount) + word(fee) +
                    word(recipient.size()),
            .topics =
                {deposited_event_signature(),
                 address_topic(
                     0x00000000000000000000000000000000000000ee_address)},
            .address = {}};
        log.data += to_byte_string_view(recipient);
        log.data.resize(log.data.size() + (32 - recipient.size() % 32) % 32);
        return rlp::encode_log(log);
    }

    byte_string erc20_input(
        uint32_t const selector, std::optional<Address> const &to = {},
        std::optional<uint256_t> const amount = {})
    {
        byte_string input{
            static_cast<unsigned char>(selector >> 24),
            static_cast<unsigned char>(selector >> 16),
            static_cast<unsigned char>(selector >> 8),
            static_cast<unsigned char>(selector)};
        if (to.has_value()) {
            input += to_byte_string_view(address_topic(*to));
        }
        if (amount.has_value()) {
            input += word(*amount);
        }
        return input;
    }

    std::string eth_recipient(std::string_view const relayer, Address const &a)
    {
        return std::string{relayer} + ":0x" +
               evmc::hex(to_byte_string_view(a));
    }

    struct EngineTest : public ::testing::Test
    {
        InMemoryHostStore store;

        Engine engine(
            std::string_view const predecessor, uint64_t const block_index = 10,
            EngineOptions const options = {})
        {
            return Engine{
                store,
                HostContext{
                    .block_index = block_index,
                    .block_timestamp = 1'700'000'000,
                    .predecessor_account_id = std::string{predecessor},
                    .current_account_id = std::string{engine_id}},
                options};
        }

        void SetUp() override
        {
            auto const res = engine(engine_id).init(encode_engine_state(
                EngineState{
                    .chain_id = chain_id,
                    .owner_id = std::string{owner_id},
                    .bridge_provider_id = std::string{bridge_id},
                    .upgrade_delay_blocks = 5}));
            ASSERT_TRUE(res.has_value());
        }

        Address deploy(std::string_view const predecessor, byte_string_view init)
        {
            auto const res = engine(predecessor).deploy_code(init);
            EXPECT_TRUE(res.has_value());
            auto const outcome = decode_outcome(res.value());
            EXPECT_EQ(outcome.status, evm::Status::Success);
            EXPECT_TRUE(outcome.created.has_value());
            return outcome.created.value_or(Address{});
        }

        Outcome call(
            std::string_view const predecessor, Address const &contract,
            byte_string_view const input)
        {
            auto const res = engine(predecessor).call(encode_call_args(
                CallArgs{.contract = contract, .value = 0, .input = byte_string{input}}));
            EXPECT_TRUE(res.has_value());
            return decode_outcome(res.value());
        }

        bytes32_t storage(Address const &address, uint64_t const n)
        {
            auto const res = engine("alice.near")
                                 .get_storage_at(encode_get_storage_at_args(
                                     {.address = address, .key = slot(n)}));
            EXPECT_TRUE(res.has_value());
            bytes32_t value{};
            std::memcpy(value.bytes, res.value().data(), sizeof(bytes32_t));
            return value;
        }

        uint256_t nonce(Address const &address)
        {
            auto const res =
                engine("alice.near").get_nonce(address_bytes(address));
            EXPECT_TRUE(res.has_value());
            return intx::be::unsafe::load<uint256_t>(res.value().data());
        }

        uint256_t balance(Address const &address)
        {
            auto const res =
                engine("alice.near").get_balance(address_bytes(address));
            EXPECT_TRUE(res.has_value());
            return intx::be::unsafe::load<uint256_t>(res.value().data());
        }
    };
}

TEST(EngineInit, requires_engine_account)
{
    InMemoryHostStore store;
    auto const args = encode_engine_state(EngineState{
        .chain_id = chain_id,
        .owner_id = "owner.near",
        .bridge_provider_id = "bridge.near",
        .upgrade_delay_blocks = 0});

    Engine outsider{
        store,
        HostContext{
            .block_index = 1,
            .block_timestamp = 0,
            .predecessor_account_id = "mallory.near",
            .current_account_id = "engine.near"},
        {}};
    EXPECT_EQ(outsider.init(args).assume_error(), EngineError::NotAllowed);
    EXPECT_EQ(outsider.get_owner().assume_error(), EngineError::NotInitialized);
    EXPECT_EQ(
        outsider.call(encode_call_args({})).assume_error(),
        EngineError::NotInitialized);
    EXPECT_TRUE(store.data().empty());

    Engine self{
        store,
        HostContext{
            .block_index = 1,
            .block_timestamp = 0,
            .predecessor_account_id = "engine.near",
            .current_account_id = "engine.near"},
        {}};
    EXPECT_EQ(
        self.init(from_hex("c0")).assume_error(), EngineError::ArgumentParse);
    EXPECT_EQ(
        self.init(args + byte_string{0x80}).assume_error(),
        EngineError::ArgumentParse);
    ASSERT_TRUE(self.init(args).has_value());
    EXPECT_EQ(self.init(args).assume_error(), EngineError::AlreadyInitialized);
}

TEST_F(EngineTest, getters)
{
    auto e = engine("alice.near");
    EXPECT_EQ(to_string_view(e.get_owner().value()), owner_id);
    EXPECT_EQ(to_string_view(e.get_bridge_provider().value()), bridge_id);
    EXPECT_EQ(e.get_chain_id().value(), word(chain_id));
    EXPECT_FALSE(e.get_version().value().empty());
    EXPECT_EQ(
        e.get_upgrade_index().value(),
        to_big_endian_byte_string(no_pending_upgrade));

    EXPECT_EQ(
        e.get_balance(from_hex("0011")).assume_error(),
        EngineError::ArgumentParse);
    EXPECT_EQ(
        e.get_code(byte_string(21, 0)).assume_error(),
        EngineError::ArgumentParse);
    EXPECT_TRUE(e.get_code(byte_string(20, 0)).value().empty());
}

TEST_F(EngineTest, upgrade)
{
    auto const code = from_hex("deadbeef");

    EXPECT_EQ(
        engine("alice.near").stage_upgrade(code).assume_error(),
        EngineError::NotAllowed);
    EXPECT_EQ(
        engine(owner_id).deploy_upgrade().assume_error(),
        EngineError::NoPendingUpgrade);

    ASSERT_TRUE(engine(owner_id, 10).stage_upgrade(code).has_value());
    EXPECT_EQ(
        engine("alice.near").get_upgrade_index().value(),
        to_big_endian_byte_string(uint64_t{15}));

    EXPECT_EQ(
        engine(owner_id, 14).deploy_upgrade().assume_error(),
        EngineError::NotReady);
    EXPECT_EQ(
        engine("alice.near", 15).deploy_upgrade().assume_error(),
        EngineError::NotAllowed);
    ASSERT_TRUE(engine(owner_id, 15).deploy_upgrade().has_value());

    EXPECT_EQ(
        engine("alice.near").get_upgrade_index().value(),
        to_big_endian_byte_string(no_pending_upgrade));
    State state{store};
    EXPECT_EQ(get_engine_code(state), code);
    EXPECT_EQ(
        engine(owner_id, 20).deploy_upgrade().assume_error(),
        EngineError::NoPendingUpgrade);
}

TEST_F(EngineTest, upgrade_index_saturates)
{
    ASSERT_TRUE(engine(owner_id, UINT64_MAX - 2)
                    .stage_upgrade(from_hex("00"))
                    .has_value());
    EXPECT_EQ(
        engine("alice.near").get_upgrade_index().value(),
        to_big_endian_byte_string(uint64_t{UINT64_MAX}));
}

TEST_F(EngineTest, deploy_and_call)
{
    auto const alice = host_account_to_address("alice.near");
    auto const counter = deploy("alice.near", counter_init);
    EXPECT_EQ(counter, create_contract_address(alice, 0));
    EXPECT_EQ(nonce(alice), 1);
    EXPECT_EQ(
        engine("bob.near").get_code(address_bytes(counter)).value(),
        counter_code);

    byte_string const increment{0x01};
    byte_string const decrement{0x02};
    EXPECT_EQ(call("bob.near", counter, increment).status, evm::Status::Success);
    EXPECT_EQ(call("bob.near", counter, increment).status, evm::Status::Success);
    EXPECT_EQ(storage(counter, 0), slot(2));

    // plain calls do not consume the caller nonce
    EXPECT_EQ(nonce(host_account_to_address("bob.near")), 0);

    EXPECT_EQ(call("bob.near", counter, decrement).status, evm::Status::Success);
    EXPECT_EQ(storage(counter, 0), slot(1));

    EXPECT_EQ(
        engine("bob.near").call(from_hex("c3808080")).assume_error(),
        EngineError::ArgumentParse);
}

TEST_F(EngineTest, revert_outcome)
{
    auto const contract =
        deploy("alice.near", from_hex("600a600c600039600a6000f3") + revert_code);

    auto const outcome = call("alice.near", contract, {});
    EXPECT_EQ(outcome.status, evm::Status::Revert);
    EXPECT_GT(outcome.gas_used, 0);
    EXPECT_EQ(storage(contract, 0), bytes32_t{});
}

TEST_F(EngineTest, view_persists_nothing)
{
    auto const counter = deploy("alice.near", counter_init);

    auto const res = engine("alice.near")
                         .view(encode_view_args(ViewArgs{
                             .sender = host_account_to_address("alice.near"),
                             .contract = counter,
                             .value = 0,
                             .input = byte_string{0x01}}));
    ASSERT_TRUE(res.has_value());
    // the write itself is a static mode violation
    EXPECT_EQ(decode_outcome(res.value()).status, evm::Status::StaticModeViolation);

    auto const number = deploy("alice.near", from_hex("6009600c60003960096000f3") + number_code);
    auto const before_view = store.data();
    auto const number_res = engine("alice.near", 42).view(encode_view_args(
        ViewArgs{.sender = {}, .contract = number, .value = 0, .input = {}}));
    ASSERT_TRUE(number_res.has_value());
    auto const outcome = decode_outcome(number_res.value());
    EXPECT_EQ(outcome.status, evm::Status::Success);
    EXPECT_EQ(outcome.output, word(42));
    EXPECT_EQ(store.data(), before_view);
    EXPECT_EQ(storage(counter, 0), bytes32_t{});
}

TEST_F(EngineTest, raw_call)
{
    Signer const signer{key1};
    auto const sender = signer.address();
    EXPECT_EQ(sender, 0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f_address);

    auto const counter = deploy("alice.near", counter_init);

    Transaction tx{
        .sc = {.chain_id = chain_id},
        .nonce = 0,
        .gas_price = 1,
        .gas_limit = 100'000,
        .to = counter,
        .value = 0,
        .data = byte_string{0x01}};

    auto const res = engine("relayer.near").raw_call(signer.sign_transaction(tx));
    ASSERT_TRUE(res.has_value());
    auto const outcome = decode_outcome(res.value());
    EXPECT_EQ(outcome.status, evm::Status::Success);
    EXPECT_GT(outcome.gas_used, 21'016);
    EXPECT_EQ(storage(counter, 0), slot(1));
    EXPECT_EQ(nonce(sender), 1);

    // replay
    EXPECT_EQ(
        engine("relayer.near")
            .raw_call(signer.sign_transaction(tx))
            .assume_error(),
        EngineError::IncorrectNonce);

    tx.nonce = 1;
    tx.sc.chain_id = 1;
    EXPECT_EQ(
        engine("relayer.near")
            .raw_call(signer.sign_transaction(tx))
            .assume_error(),
        EngineError::InvalidChainId);

    tx.sc.chain_id = chain_id;
    tx.gas_limit = 21'015;
    EXPECT_EQ(
        engine("relayer.near")
            .raw_call(signer.sign_transaction(tx))
            .assume_error(),
        EngineError::IntrinsicGas);

    EXPECT_EQ(
        engine("relayer.near").raw_call(from_hex("c0")).assume_error(),
        EngineError::ArgumentParse);
    EXPECT_EQ(nonce(sender), 1);
    EXPECT_EQ(storage(counter, 0), slot(1));
}

TEST_F(EngineTest, raw_call_create)
{
    Signer const signer{key1};
    auto const sender = signer.address();

    Transaction const tx{
        .sc = {.chain_id = chain_id},
        .nonce = 0,
        .gas_price = 0,
        .gas_limit = 1'000'000,
        .to = std::nullopt,
        .value = 0,
        .data = counter_init};
    auto const res = engine("relayer.near").raw_call(signer.sign_transaction(tx));
    ASSERT_TRUE(res.has_value());
    auto const outcome = decode_outcome(res.value());
    ASSERT_EQ(outcome.status, evm::Status::Success);
    ASSERT_TRUE(outcome.created.has_value());
    EXPECT_EQ(*outcome.created, create_contract_address(sender, 0));
    EXPECT_EQ(nonce(sender), 1);
}

TEST_F(EngineTest, raw_call_value_exceeds_balance)
{
    Signer const signer{key1};
    auto const sender = signer.address();

    Transaction tx{
        .sc = {.chain_id = chain_id},
        .nonce = 0,
        .gas_price = 0,
        .gas_limit = 1'000'000,
        .to = std::nullopt,
        .value = 1,
        .data = counter_init};
    auto const before = store.data();
    EXPECT_EQ(
        engine("relayer.near")
            .raw_call(signer.sign_transaction(tx))
            .assume_error(),
        EngineError::InsufficientBalance);
    EXPECT_EQ(store.data(), before);
    EXPECT_EQ(nonce(sender), 0);

    tx.to = 0x5555555555555555555555555555555555555555_address;
    tx.data = {};
    EXPECT_EQ(
        engine("relayer.near")
            .raw_call(signer.sign_transaction(tx))
            .assume_error(),
        EngineError::InsufficientBalance);
    EXPECT_EQ(store.data(), before);
}

TEST_F(EngineTest, raw_call_high_s)
{
    Signer const signer{key1};
    auto const sender = signer.address();
    auto const counter = deploy("alice.near", counter_init);

    Transaction const tx{
        .sc = {.chain_id = chain_id},
        .nonce = 0,
        .gas_price = 0,
        .gas_limit = 100'000,
        .to = counter,
        .value = 0,
        .data = byte_string{0x01}};
    auto const high_s = signer.sign_transaction_high_s(tx);
    EXPECT_EQ(
        engine("relayer.near").raw_call(high_s).assume_error(),
        EngineError::InvalidSignature);
    EXPECT_EQ(nonce(sender), 0);
    EXPECT_EQ(storage(counter, 0), bytes32_t{});

    // before Homestead the mirrored signature recovers the same sender
    EngineOptions frontier;
    frontier.revision = evm::Revision::Frontier;
    auto const res = engine("relayer.near", 10, frontier).raw_call(high_s);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(decode_outcome(res.value()).status, evm::Status::Success);
    EXPECT_EQ(nonce(sender), 1);
    EXPECT_EQ(storage(counter, 0), slot(1));
}

TEST_F(EngineTest, failed_deploy_consumes_nonce)
{
    auto const alice = host_account_to_address("alice.near");

    auto const reverted = engine("alice.near").deploy_code(revert_code);
    ASSERT_TRUE(reverted.has_value());
    auto const revert_outcome = decode_outcome(reverted.value());
    EXPECT_EQ(revert_outcome.status, evm::Status::Revert);
    EXPECT_FALSE(revert_outcome.created.has_value());
    EXPECT_EQ(nonce(alice), 1);
    EXPECT_TRUE(engine("alice.near")
                    .get_code(address_bytes(create_contract_address(alice, 0)))
                    .value()
                    .empty());

    // jumpdest, jump back to it forever
    EngineOptions options;
    options.call_gas_limit = 100'000;
    auto const looped =
        engine("alice.near", 10, options).deploy_code(from_hex("5b600056"));
    ASSERT_TRUE(looped.has_value());
    auto const loop_outcome = decode_outcome(looped.value());
    EXPECT_EQ(loop_outcome.status, evm::Status::OutOfGas);
    EXPECT_EQ(loop_outcome.gas_used, 100'000);
    EXPECT_FALSE(loop_outcome.created.has_value());
    EXPECT_EQ(nonce(alice), 2);

    // the next deployment takes the following address
    EXPECT_EQ(
        deploy("alice.near", counter_init), create_contract_address(alice, 2));
}

TEST_F(EngineTest, deposit)
{
    auto const args = deposit_args("carol.near", 1'000, 10);
    EXPECT_EQ(
        engine("mallory.near").deposit(args).assume_error(),
        EngineError::NotAllowed);
    EXPECT_EQ(
        engine(bridge_id).deposit(from_hex("c0")).assume_error(),
        DepositError::RlpFailed);

    ASSERT_TRUE(engine(bridge_id).deposit(args).has_value());
    ASSERT_TRUE(engine(bridge_id).deposit(args).has_value());

    byte_string expected(16, 0);
    expected[14] = 0x07;
    expected[15] = 0xd0;
    EXPECT_EQ(
        engine("alice.near").get_bridged_balance(to_byte_string_view("carol.near")).value(),
        expected);
    EXPECT_EQ(engine("alice.near").get_bridged_supply().value(), expected);
    EXPECT_EQ(
        engine("alice.near")
            .get_bridged_balance(to_byte_string_view("Carol"))
            .assume_error(),
        EngineError::ArgumentParse);

    auto const max = (uint256_t{1} << 128) - 1;
    EXPECT_EQ(
        engine(bridge_id)
            .deposit(deposit_args("dave.near", max, 0))
            .assume_error(),
        EngineError::BalanceOverflow);
    EXPECT_EQ(engine("alice.near").get_bridged_supply().value(), expected);
}

TEST_F(EngineTest, deposit_to_address)
{
    auto const recipient = 0x2222222222222222222222222222222222222222_address;
    ASSERT_TRUE(engine(bridge_id)
                    .deposit(deposit_args(
                        eth_recipient("relayer.near", recipient), 1'000, 10))
                    .has_value());
    EXPECT_EQ(balance(recipient), 990);
    EXPECT_EQ(balance(host_account_to_address("relayer.near")), 10);
    EXPECT_EQ(engine("alice.near").get_bridged_supply().value(), byte_string(16, 0));
}

TEST_F(EngineTest, deploy_erc20_token)
{
    auto const engine_address = host_account_to_address(engine_id);
    auto e = engine("alice.near");

    auto const res = e.deploy_erc20_token(to_byte_string_view("token.near"));
    ASSERT_TRUE(res.has_value());
    ASSERT_EQ(res.value().size(), sizeof(Address));
    Address token;
    std::memcpy(token.bytes, res.value().data(), sizeof(Address));
    EXPECT_EQ(token, create_contract_address(engine_address, 0));
    EXPECT_FALSE(e.get_code(address_bytes(token)).value().empty());

    EXPECT_EQ(
        e.get_erc20_from_host_token(to_byte_string_view("token.near")).value(),
        address_bytes(token));
    EXPECT_EQ(
        to_string_view(e.get_host_token_from_erc20(address_bytes(token)).value()),
        "token.near");

    auto const before = store.data();
    EXPECT_EQ(
        e.deploy_erc20_token(to_byte_string_view("token.near")).assume_error(),
        EngineError::TokenAlreadyRegistered);
    EXPECT_EQ(
        e.deploy_erc20_token(to_byte_string_view("Token")).assume_error(),
        EngineError::ArgumentParse);
    EXPECT_EQ(store.data(), before);

    EXPECT_EQ(
        e.get_erc20_from_host_token(to_byte_string_view("other.near"))
            .assume_error(),
        EngineError::TokenNotFound);
    EXPECT_EQ(
        e.get_host_token_from_erc20(address_bytes(engine_address))
            .assume_error(),
        EngineError::TokenNotFound);
    EXPECT_EQ(
        e.get_host_token_from_erc20(from_hex("00")).assume_error(),
        EngineError::ArgumentParse);

    auto const second =
        e.dispatch("deploy_erc20_token", to_byte_string_view("other.near"));
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(
        second.value(),
        address_bytes(create_contract_address(engine_address, 1)));
}

TEST_F(EngineTest, erc20_mint)
{
    auto const token_bytes =
        engine("alice.near")
            .deploy_erc20_token(to_byte_string_view("token.near"))
            .value();
    Address token;
    std::memcpy(token.bytes, token_bytes.data(), sizeof(Address));
    auto const alice = host_account_to_address("alice.near");

    // the engine account is the token admin
    auto const minted =
        call(engine_id, token, erc20_input(erc20_mint_selector, alice, 10));
    EXPECT_EQ(minted.status, evm::Status::Success);
    EXPECT_EQ(minted.logs, 1);

    EXPECT_EQ(
        call("bob.near", token, erc20_input(erc20_balance_of_selector, alice))
            .output,
        word(10));
    EXPECT_EQ(
        call("bob.near", token, erc20_input(erc20_total_supply_selector))
            .output,
        word(10));
}

TEST_F(EngineTest, erc20_mint_not_admin)
{
    auto const token_bytes =
        engine("alice.near")
            .deploy_erc20_token(to_byte_string_view("token.near"))
            .value();
    Address token;
    std::memcpy(token.bytes, token_bytes.data(), sizeof(Address));
    auto const alice = host_account_to_address("alice.near");

    auto const minted =
        call("alice.near", token, erc20_input(erc20_mint_selector, alice, 10));
    EXPECT_EQ(minted.status, evm::Status::Revert);
    EXPECT_EQ(minted.logs, 0);

    EXPECT_EQ(
        call("bob.near", token, erc20_input(erc20_balance_of_selector, alice))
            .output,
        word(0));
    EXPECT_EQ(
        call("bob.near", token, erc20_input(erc20_total_supply_selector))
            .output,
        word(0));
}

TEST_F(EngineTest, erc20_transfer)
{
    auto const token_bytes =
        engine("alice.near")
            .deploy_erc20_token(to_byte_string_view("token.near"))
            .value();
    Address token;
    std::memcpy(token.bytes, token_bytes.data(), sizeof(Address));
    auto const alice = host_account_to_address("alice.near");
    auto const bob = host_account_to_address("bob.near");
    ASSERT_EQ(
        call(engine_id, token, erc20_input(erc20_mint_selector, alice, 10))
            .status,
        evm::Status::Success);

    auto const sent =
        call("alice.near", token, erc20_input(erc20_transfer_selector, bob, 4));
    EXPECT_EQ(sent.status, evm::Status::Success);
    EXPECT_EQ(sent.output, word(1));
    EXPECT_EQ(sent.logs, 1);

    auto const overdrawn =
        call("alice.near", token, erc20_input(erc20_transfer_selector, bob, 7));
    EXPECT_EQ(overdrawn.status, evm::Status::Revert);

    EXPECT_EQ(
        call("bob.near", token, erc20_input(erc20_balance_of_selector, alice))
            .output,
        word(6));
    EXPECT_EQ(
        call("bob.near", token, erc20_input(erc20_balance_of_selector, bob))
            .output,
        word(4));
    EXPECT_EQ(
        call("bob.near", token, erc20_input(erc20_total_supply_selector))
            .output,
        word(10));
    EXPECT_EQ(
        call("bob.near", token, from_hex("12345678")).status,
        evm::Status::Revert);
}

TEST_F(EngineTest, meta_call)
{
    Signer const signer{key2};
    auto const from = signer.address();
    auto const relayer = host_account_to_address("relayer.near");
    ASSERT_TRUE(engine(bridge_id)
                    .deposit(deposit_args(eth_recipient("x.near", from), 1'000, 0))
                    .has_value());
    auto const counter = deploy("alice.near", counter_init);

    MetaCallArgs args{
        .sender = from,
        .chain_id = chain_id,
        .verifying_contract = host_account_to_address(engine_id),
        .v = 0,
        .r = 0,
        .s = 0,
        .nonce = 0,
        .fee_amount = 100,
        .fee_address = {},
        .contract = counter,
        .value = 0,
        .input = byte_string{0x01}};

    auto const res = engine("relayer.near").meta_call(signer.sign_meta_call(args));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(decode_outcome(res.value()).status, evm::Status::Success);
    EXPECT_EQ(storage(counter, 0), slot(1));
    EXPECT_EQ(nonce(from), 1);
    EXPECT_EQ(balance(from), 900);
    EXPECT_EQ(balance(relayer), 100);

    // replay
    EXPECT_EQ(
        engine("relayer.near")
            .meta_call(signer.sign_meta_call(args))
            .assume_error(),
        EngineError::IncorrectNonce);

    // the fee goes to an explicit address
    args.nonce = 1;
    args.fee_address = 0x3333333333333333333333333333333333333333_address;
    ASSERT_TRUE(
        engine("relayer.near").meta_call(signer.sign_meta_call(args)).has_value());
    EXPECT_EQ(balance(args.fee_address), 100);
    EXPECT_EQ(storage(counter, 0), slot(2));

    args.nonce = 2;
    args.fee_amount = 801;
    EXPECT_EQ(
        engine("relayer.near")
            .meta_call(signer.sign_meta_call(args))
            .assume_error(),
        EngineError::InsufficientBalance);
    EXPECT_EQ(nonce(from), 2);
}

TEST_F(EngineTest, meta_call_signature)
{
    Signer const signer{key2};
    auto const counter = deploy("alice.near", counter_init);
    MetaCallArgs const args{
        .sender = signer.address(),
        .chain_id = chain_id,
        .verifying_contract = host_account_to_address(engine_id),
        .v = 0,
        .r = 0,
        .s = 0,
        .nonce = 0,
        .fee_amount = 0,
        .fee_address = {},
        .contract = counter,
        .value = 0,
        .input = byte_string{0x01}};

    auto signed_args = signer.sign_meta_call(args);
    byte_string_view view{signed_args};
    auto decoded = decode_meta_call_args(view).value();
    EXPECT_EQ(verify_meta_call(chain_id, host_account_to_address(engine_id), decoded).value(), signer.address());

    // EIP-155 style v is rejected
    decoded.v = 37;
    EXPECT_EQ(
        engine("relayer.near")
            .meta_call(encode_meta_call_args(decoded))
            .assume_error(),
        EngineError::InvalidSignature);

    // does not recover
    decoded.v = 27;
    decoded.r = 0;
    EXPECT_EQ(
        engine("relayer.near")
            .meta_call(encode_meta_call_args(decoded))
            .assume_error(),
        EngineError::InvalidSignature);
    EXPECT_EQ(storage(counter, 0), bytes32_t{});
}

TEST_F(EngineTest, meta_call_wrong_domain)
{
    Signer const signer{key2};
    auto const from = signer.address();
    ASSERT_TRUE(engine(bridge_id)
                    .deposit(deposit_args(eth_recipient("x.near", from), 1'000, 0))
                    .has_value());
    auto const counter = deploy("alice.near", counter_init);
    MetaCallArgs const args{
        .sender = from,
        .chain_id = chain_id,
        .verifying_contract = host_account_to_address(engine_id),
        .v = 0,
        .r = 0,
        .s = 0,
        .nonce = 0,
        .fee_amount = 10,
        .fee_address = {},
        .contract = counter,
        .value = 0,
        .input = byte_string{0x01}};
    auto const before = store.data();

    auto other_chain = args;
    other_chain.chain_id = 1;
    EXPECT_EQ(
        engine("relayer.near")
            .meta_call(signer.sign_meta_call(other_chain))
            .assume_error(),
        EngineError::InvalidSignature);

    auto other_engine = args;
    other_engine.verifying_contract = host_account_to_address("other.near");
    EXPECT_EQ(
        engine("relayer.near")
            .meta_call(signer.sign_meta_call(other_engine))
            .assume_error(),
        EngineError::InvalidSignature);

    // the envelope names someone other than the signer
    auto other_sender = args;
    other_sender.sender = Signer{key1}.address();
    EXPECT_EQ(
        engine("relayer.near")
            .meta_call(signer.sign_meta_call(other_sender))
            .assume_error(),
        EngineError::InvalidSignature);

    // a valid envelope submitted to another engine account
    Engine elsewhere{
        store,
        HostContext{
            .block_index = 10,
            .block_timestamp = 1'700'000'000,
            .predecessor_account_id = "relayer.near",
            .current_account_id = "other.near"},
        {}};
    EXPECT_EQ(
        elsewhere.meta_call(signer.sign_meta_call(args)).assume_error(),
        EngineError::InvalidSignature);

    EXPECT_EQ(store.data(), before);
    EXPECT_EQ(nonce(from), 0);
    EXPECT_EQ(balance(from), 1'000);

    ASSERT_TRUE(
        engine("relayer.near").meta_call(signer.sign_meta_call(args)).has_value());
    EXPECT_EQ(nonce(from), 1);
}

TEST_F(EngineTest, meta_call_inner_revert_keeps_nonce)
{
    Signer const signer{key2};
    auto const from = signer.address();
    ASSERT_TRUE(engine(bridge_id)
                    .deposit(deposit_args(eth_recipient("x.near", from), 1'000, 0))
                    .has_value());
    auto const contract =
        deploy("alice.near", from_hex("600a600c600039600a6000f3") + revert_code);

    MetaCallArgs const args{
        .sender = from,
        .chain_id = chain_id,
        .verifying_contract = host_account_to_address(engine_id),
        .v = 0,
        .r = 0,
        .s = 0,
        .nonce = 0,
        .fee_amount = 50,
        .fee_address = {},
        .contract = contract,
        .value = 0,
        .input = {}};
    auto const res = engine("relayer.near").meta_call(signer.sign_meta_call(args));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(decode_outcome(res.value()).status, evm::Status::Revert);
    EXPECT_EQ(nonce(from), 1);
    EXPECT_EQ(balance(from), 950);
    EXPECT_EQ(storage(contract, 0), bytes32_t{});
}

TEST_F(EngineTest, benchmark)
{
    auto const genesis = 0x4444444444444444444444444444444444444444_address;
    auto const chain_args = encode_begin_chain_args(
        BeginChainArgs{.chain_id = 7, .genesis_alloc = {{genesis, 5'000}}});

    EXPECT_EQ(
        engine(owner_id).begin_chain(chain_args).assume_error(),
        EngineError::BenchmarkDisabled);

    EngineOptions options;
    options.benchmark_mode = true;
    EXPECT_EQ(
        engine("alice.near", 10, options).begin_chain(chain_args).assume_error(),
        EngineError::NotAllowed);
    ASSERT_TRUE(engine(owner_id, 10, options).begin_chain(chain_args).has_value());
    EXPECT_EQ(balance(genesis), 5'000);
    EXPECT_EQ(engine("alice.near").get_chain_id().value(), word(7));

    ASSERT_TRUE(engine(owner_id, 10, options)
                    .begin_block(encode_begin_block_args(BeginBlockArgs{
                        .hash = slot(0xabc),
                        .coinbase = genesis,
                        .timestamp = 1,
                        .number = 777,
                        .difficulty = 0,
                        .gas_limit = 10'000'000}))
                    .has_value());

    auto const number = deploy(
        "alice.near", from_hex("6009600c60003960096000f3") + number_code);
    auto const res = engine("alice.near", 10, options)
                         .call(encode_call_args(
                             CallArgs{.contract = number, .value = 0, .input = {}}));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(decode_outcome(res.value()).output, word(777));

    // the stored block is ignored outside benchmark mode
    EXPECT_EQ(call("alice.near", number, {}).output, word(10));
}

TEST_F(EngineTest, begin_chain_balance_overflow)
{
    auto const genesis = 0x4444444444444444444444444444444444444444_address;
    EngineOptions options;
    options.benchmark_mode = true;

    auto const max = std::numeric_limits<uint256_t>::max();
    auto const before = store.data();
    EXPECT_EQ(
        engine(owner_id, 10, options)
            .begin_chain(encode_begin_chain_args(BeginChainArgs{
                .chain_id = 7, .genesis_alloc = {{genesis, max}, {genesis, 1}}}))
            .assume_error(),
        EngineError::BalanceOverflow);
    EXPECT_EQ(store.data(), before);
    EXPECT_EQ(engine("alice.near").get_chain_id().value(), word(chain_id));

    ASSERT_TRUE(engine(owner_id, 10, options)
                    .begin_chain(encode_begin_chain_args(BeginChainArgs{
                        .chain_id = 7, .genesis_alloc = {{genesis, max}}}))
                    .has_value());
    EXPECT_EQ(balance(genesis), max);

    // the allocation lands on top of the existing balance
    EXPECT_EQ(
        engine(owner_id, 10, options)
            .begin_chain(encode_begin_chain_args(BeginChainArgs{
                .chain_id = 7, .genesis_alloc = {{genesis, 1}}}))
            .assume_error(),
        EngineError::BalanceOverflow);
    EXPECT_EQ(balance(genesis), max);
}

TEST_F(EngineTest, dispatch)
{
    auto e = engine("alice.near");
    EXPECT_EQ(to_string_view(e.dispatch("get_owner", {}).value()), owner_id);
    EXPECT_EQ(
        e.dispatch("get_bridged_supply", {}).value(), byte_string(16, 0));
    EXPECT_EQ(
        e.dispatch("selfdestruct", {}).assume_error(),
        EngineError::UnknownMethod);
    EXPECT_EQ(
        e.dispatch("new", {}).assume_error(), EngineError::AlreadyInitialized);
}
