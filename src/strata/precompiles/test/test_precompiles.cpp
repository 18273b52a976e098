#include <strata/bridge/ledger.hpp>
#include <strata/core/address.hpp>
#include <strata/core/balance.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/evm/revision.hpp>
#include <strata/evm/status.hpp>
#include <strata/host/host_context.hpp>
#include <strata/host/in_memory_host_store.hpp>
#include <strata/precompiles/precompile_registry.hpp>
#include <strata/state/state.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstring>

using namespace strata;
using namespace strata::evm;

namespace
{
    constexpr auto caller = 0xaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa_address;

    bytes32_t topic(Address const &address)
    {
        bytes32_t word{};
        std::memcpy(word.bytes + 12, address.bytes, sizeof(Address));
        return word;
    }

    struct PrecompileTest : public ::testing::Test
    {
        InMemoryHostStore store;
        State state{store};
        HostContext host{
            .block_index = 7,
            .block_timestamp = 0,
            .predecessor_account_id = "alice.near",
            .current_account_id = "engine.near"};

        PrecompileCall make_call(
            Address const &address, byte_string_view const input,
            uint256_t const &value = 0, bool const is_static = false)
        {
            return PrecompileCall{
                .rev = latest_revision,
                .input = input,
                .caller = caller,
                .address = address,
                .value = value,
                .is_static = is_static,
                .state = state,
                .host = host};
        }

        PrecompileOutput
        run(Address const &address, PrecompileCall const &call)
        {
            auto const *const entry =
                default_registry().find(address, latest_revision);
            EXPECT_NE(entry, nullptr);
            return entry->run(call);
        }
    };
}

TEST(PrecompileRegistry, activation)
{
    auto const &registry = default_registry();
    EXPECT_EQ(registry.size(), 13);

    EXPECT_NE(registry.find(Address{1}, Revision::Frontier), nullptr);
    EXPECT_EQ(registry.find(Address{5}, Revision::Homestead), nullptr);
    EXPECT_NE(registry.find(Address{5}, Revision::Byzantium), nullptr);
    EXPECT_EQ(registry.find(Address{9}, Revision::Petersburg), nullptr);
    EXPECT_NE(registry.find(Address{9}, Revision::Istanbul), nullptr);
    EXPECT_EQ(registry.find(Address{10}, latest_revision), nullptr);
    EXPECT_NE(registry.find(exit_to_host_address(), latest_revision), nullptr);

    EXPECT_EQ(registry.active_addresses(Revision::Frontier).size(), 8);
    auto const active = registry.active_addresses(latest_revision);
    EXPECT_EQ(active.size(), 13);
    EXPECT_NE(
        std::find(active.begin(), active.end(), current_account_id_address()),
        active.end());
}

TEST(PrecompileRegistry, add_replaces)
{
    PrecompileRegistry registry;
    registry.add(
        Address{1},
        {.name = "a",
         .since = Revision::Frontier,
         .gas = [](byte_string_view, Revision) -> uint64_t { return 1; },
         .run = nullptr});
    registry.add(
        Address{1},
        {.name = "b",
         .since = Revision::Berlin,
         .gas = [](byte_string_view, Revision) -> uint64_t { return 2; },
         .run = nullptr});
    EXPECT_EQ(registry.size(), 1);
    EXPECT_EQ(registry.find(Address{1}, Revision::London)->gas({}, {}), 2);
    EXPECT_EQ(registry.find(Address{1}, Revision::Istanbul), nullptr);
}

TEST(PrecompileRegistry, host_addresses)
{
    EXPECT_EQ(exit_to_host_address(), host_account_to_address("exitToHost"));
    EXPECT_NE(exit_to_host_address(), exit_to_ethereum_address());
    EXPECT_NE(
        predecessor_account_id_address(), current_account_id_address());
}

TEST_F(PrecompileTest, identity)
{
    auto const input = evmc::from_hex("0102030405").value();
    auto const *const entry = default_registry().find(Address{4}, latest_revision);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->gas(input, latest_revision), 18);

    auto const output = entry->run(make_call(Address{4}, input));
    EXPECT_EQ(output.status, Status::Success);
    EXPECT_EQ(output.output, input);
}

TEST_F(PrecompileTest, sha256)
{
    auto const output = run(Address{2}, make_call(Address{2}, {}));
    EXPECT_EQ(output.status, Status::Success);
    EXPECT_EQ(
        evmc::hex(output.output),
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(PrecompileTest, account_ids)
{
    auto const predecessor = run(
        predecessor_account_id_address(),
        make_call(predecessor_account_id_address(), {}));
    EXPECT_EQ(predecessor.status, Status::Success);
    EXPECT_EQ(to_string_view(predecessor.output), "alice.near");

    auto const current = run(
        current_account_id_address(),
        make_call(current_account_id_address(), {}, 0, true));
    EXPECT_EQ(current.status, Status::Success);
    EXPECT_EQ(to_string_view(current.output), "engine.near");
}

TEST_F(PrecompileTest, exit_to_host)
{
    auto const &self = exit_to_host_address();
    auto const root = state.begin_overlay();
    state.add_to_balance(self, 1'000);

    auto const output = run(
        self, make_call(self, to_byte_string_view("bob.near"), 1'000));
    ASSERT_EQ(output.status, Status::Success);
    EXPECT_TRUE(output.output.empty());
    EXPECT_EQ(state.get_balance_u256(self), 0);
    EXPECT_EQ(get_bridged_balance(state, "bob.near"), Balance{1'000});
    EXPECT_EQ(get_bridged_supply(state), Balance{1'000});

    ASSERT_EQ(state.logs().size(), 1);
    auto const &log = state.logs().front();
    EXPECT_EQ(log.address, self);
    ASSERT_EQ(log.topics.size(), 2);
    EXPECT_EQ(log.topics[1], topic(caller));
    EXPECT_EQ(log.data.size(), 32 + 8);
    EXPECT_EQ(to_string_view(log.data.substr(32)), "bob.near");

    state.commit(root);
    State fresh{store};
    EXPECT_EQ(get_bridged_balance(fresh, "bob.near"), Balance{1'000});
}

TEST_F(PrecompileTest, exit_to_host_rejects)
{
    auto const &self = exit_to_host_address();
    auto const root = state.begin_overlay();
    state.add_to_balance(self, 1'000);

    // invalid account id
    EXPECT_EQ(
        run(self, make_call(self, to_byte_string_view("Bob"), 10)).status,
        Status::PrecompileFailure);
    // nothing attached
    EXPECT_EQ(
        run(self, make_call(self, to_byte_string_view("bob.near"), 0))
            .status,
        Status::PrecompileFailure);
    // static context
    EXPECT_EQ(
        run(self,
            make_call(self, to_byte_string_view("bob.near"), 10, true))
            .status,
        Status::PrecompileFailure);
    // delegated into another account
    EXPECT_EQ(
        run(self,
            make_call(caller, to_byte_string_view("bob.near"), 10))
            .status,
        Status::PrecompileFailure);
    // more than 128 bits
    EXPECT_EQ(
        run(self,
            make_call(
                self,
                to_byte_string_view("bob.near"),
                uint256_t{1} << 128))
            .status,
        Status::PrecompileFailure);

    EXPECT_EQ(state.get_balance_u256(self), 1'000);
    EXPECT_EQ(get_bridged_supply(state), Balance{});
    EXPECT_TRUE(state.logs().empty());
    state.discard(root);
}

TEST_F(PrecompileTest, exit_to_ethereum)
{
    auto const &self = exit_to_ethereum_address();
    auto const recipient = 0x1111111111111111111111111111111111111111_address;
    auto const root = state.begin_overlay();
    state.add_to_balance(self, 500);

    EXPECT_EQ(
        run(self, make_call(self, byte_string_view{recipient.bytes, 19}, 500))
            .status,
        Status::PrecompileFailure);

    auto const output = run(
        self,
        make_call(self, byte_string_view{recipient.bytes, 20}, 500));
    ASSERT_EQ(output.status, Status::Success);
    EXPECT_EQ(state.get_balance_u256(self), 0);

    ASSERT_EQ(state.logs().size(), 1);
    auto const &log = state.logs().front();
    ASSERT_EQ(log.topics.size(), 3);
    EXPECT_EQ(log.topics[2], topic(recipient));
    EXPECT_EQ(log.data, to_byte_string_view(intx::be::store<bytes32_t>(
                            uint256_t{500})));
    state.discard(root);
}
