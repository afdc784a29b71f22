// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <yieldpool/core/int.hpp>
#include <yieldpool/core/result.hpp>
#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/staking/genesis.hpp>
#include <yieldpool/execution/staking/protocol.hpp>
#include <yieldpool/execution/staking/satellite_strategy.hpp>
#include <yieldpool/execution/staking/util/caller.hpp>
#include <yieldpool/execution/staking/util/staking_error.hpp>
#include <yieldpool/execution/state/state.hpp>
#include <yieldpool/execution/token/erc20.hpp>
#include <yieldpool/test/protocol_fixture.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace yieldpool;
using namespace yieldpool::staking;
using namespace yieldpool::test;

namespace
{
    constexpr uint64_t GENESIS_TIME{1'700'000'000};

    std::string const GENESIS_JSON = R"({
        "timestamp": 1700000000,
        "log_level": "warning",
        "pool": "0x0000000000000000000000000000000000001000",
        "processor": "0x0000000000000000000000000000000000001001",
        "gateway": "0x0000000000000000000000000000000000001002",
        "oracle": "0x0000000000000000000000000000000000001003",
        "staking_token": "0x0000000000000000000000000000000000002000",
        "default_slippage_bps": 150,
        "max_price_age": 86400,
        "tokens": {
            "0x0000000000000000000000000000000000002000": {
                "decimals": 18,
                "alloc": {
                    "0x00000000000000000000000000000000000000a1":
                        "1000000000000000000000"
                }
            },
            "0x0000000000000000000000000000000000002001": {"decimals": 6},
            "0x0000000000000000000000000000000000002003": {
                "decimals": 18,
                "alloc": {
                    "0x00000000000000000000000000000000000000d1":
                        "0x3635c9adc5dea00000"
                }
            }
        },
        "rewards": [
            {
                "token": "0x0000000000000000000000000000000000002001",
                "distributor": "0x00000000000000000000000000000000000000d1",
                "duration": 604800
            },
            {
                "token": "0x0000000000000000000000000000000000002003",
                "distributor": "0x00000000000000000000000000000000000000d1",
                "duration": 86400
            }
        ],
        "routes": [
            {
                "token": "0x0000000000000000000000000000000000002001",
                "swap_pool": "0x0000000000000000000000000000000000001006"
            }
        ],
        "price_feeds": [
            {
                "token": "0x0000000000000000000000000000000000002000",
                "price": "2000000000000000000"
            },
            {
                "token": "0x0000000000000000000000000000000000002001",
                "price": 1000000000000000000
            }
        ],
        "swap_tokens": [
            "0x0000000000000000000000000000000000002000",
            "0x0000000000000000000000000000000000002001"
        ]
    })";

    nlohmann::json genesis_json()
    {
        return nlohmann::json::parse(GENESIS_JSON);
    }
}

struct Genesis : public ::testing::Test
{
    State state{};
    SatelliteDirectory directory{state, DIRECTORY};
    OracleSwapVenue venue{state, VENUE, ORACLE};
    Protocol protocol{
        state,
        ProtocolAddresses{
            .pool = POOL,
            .processor = PROCESSOR,
            .gateway = GATEWAY,
            .oracle = ORACLE},
        venue,
        directory};
};

TEST_F(Genesis, read_config)
{
    auto const res = read_protocol_config(genesis_json());
    ASSERT_FALSE(res.has_error()) << res.error().message().c_str();
    auto const &config = res.value();

    EXPECT_EQ(config.timestamp, GENESIS_TIME);
    EXPECT_EQ(config.log_level, quill::LogLevel::Warning);
    EXPECT_EQ(config.addresses.pool, POOL);
    EXPECT_EQ(config.addresses.oracle, ORACLE);
    EXPECT_EQ(config.staking_token, STAKING);
    EXPECT_EQ(config.default_slippage_bps, 150u);
    EXPECT_EQ(config.max_price_age, DAY);

    ASSERT_EQ(config.tokens.size(), 3u);
    EXPECT_EQ(config.tokens[0].token, STAKING);
    ASSERT_EQ(config.tokens[0].alloc.size(), 1u);
    EXPECT_EQ(config.tokens[0].alloc[0].first, ALICE);
    EXPECT_EQ(config.tokens[0].alloc[0].second, 1000 * E18);
    EXPECT_EQ(config.tokens[1].decimals, 6);
    EXPECT_TRUE(config.tokens[1].alloc.empty());
    ASSERT_EQ(config.tokens[2].alloc.size(), 1u);
    EXPECT_EQ(config.tokens[2].alloc[0].second, 1000 * E18);

    ASSERT_EQ(config.rewards.size(), 2u);
    EXPECT_EQ(config.rewards[1].token, REWARD18);
    EXPECT_EQ(config.rewards[1].duration, DAY);
    ASSERT_EQ(config.routes.size(), 1u);
    EXPECT_EQ(config.routes[0].swap_pool, SWAP_POOL);
    ASSERT_EQ(config.price_feeds.size(), 2u);
    EXPECT_EQ(config.price_feeds[1].price, E18);
    EXPECT_EQ(config.swap_tokens, (std::vector<Address>{STAKING, REWARD6}));
}

TEST_F(Genesis, read_config_rejects)
{
    auto j = genesis_json();
    j.erase("oracle");
    EXPECT_EQ(
        read_protocol_config(j).assume_error(), GenesisError::MalformedConfig);

    j = genesis_json();
    j["pool"] = "0x10zz";
    EXPECT_EQ(
        read_protocol_config(j).assume_error(), GenesisError::InvalidAddress);

    j = genesis_json();
    j["pool"] = 4096;
    EXPECT_EQ(
        read_protocol_config(j).assume_error(), GenesisError::InvalidAddress);

    j = genesis_json();
    j["price_feeds"][0]["price"] = "12x";
    EXPECT_EQ(
        read_protocol_config(j).assume_error(), GenesisError::InvalidAmount);

    j = genesis_json();
    j["max_price_age"] = "0x10000000000000000";
    EXPECT_EQ(
        read_protocol_config(j).assume_error(), GenesisError::InvalidAmount);

    constexpr auto staking_key = "0x0000000000000000000000000000000000002000";

    // wider than a byte, would wrap to 18
    j = genesis_json();
    j["tokens"][staking_key]["decimals"] = 274;
    EXPECT_EQ(
        read_protocol_config(j).assume_error(), GenesisError::InvalidDecimals);

    j = genesis_json();
    j["tokens"][staking_key]["decimals"] = Erc20::MAX_DECIMALS + 1;
    EXPECT_EQ(
        read_protocol_config(j).assume_error(), GenesisError::InvalidDecimals);

    j = genesis_json();
    j["tokens"][staking_key]["decimals"] = -6;
    EXPECT_EQ(
        read_protocol_config(j).assume_error(), GenesisError::InvalidAmount);

    j = genesis_json();
    j["log_level"] = "verbose";
    EXPECT_EQ(
        read_protocol_config(j).assume_error(), GenesisError::UnknownLogLevel);

    EXPECT_EQ(
        read_protocol_config(nlohmann::json::array()).assume_error(),
        GenesisError::MalformedConfig);
}

TEST_F(Genesis, read_config_file)
{
    auto const dir = std::filesystem::path{::testing::TempDir()};
    auto const good = dir / "yieldpool_genesis.json";
    auto const bad = dir / "yieldpool_genesis_bad.json";
    {
        std::ofstream out{good};
        out << GENESIS_JSON;
    }
    {
        std::ofstream out{bad};
        out << "{\"pool\": ";
    }

    auto const res = read_protocol_config(good);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().tokens.size(), 3u);

    EXPECT_EQ(
        read_protocol_config(bad).assume_error(),
        GenesisError::MalformedConfig);
    EXPECT_EQ(
        read_protocol_config(dir / "does_not_exist.json").assume_error(),
        GenesisError::UnreadableFile);

    std::filesystem::remove(good);
    std::filesystem::remove(bad);
}

TEST_F(Genesis, load)
{
    auto const config = read_protocol_config(genesis_json());
    ASSERT_FALSE(config.has_error());
    auto const res = load_genesis(protocol, admin, config.value());
    ASSERT_FALSE(res.has_error()) << res.error().message().c_str();

    EXPECT_EQ(state.timestamp(), GENESIS_TIME);
    EXPECT_EQ(Erc20(state, STAKING).balance_of(ALICE), 1000 * E18);
    EXPECT_EQ(Erc20(state, REWARD18).balance_of(DISTRIBUTOR), 1000 * E18);
    EXPECT_EQ(Erc20(state, REWARD6).decimals().value(), 6);

    EXPECT_EQ(protocol.pool().staking_token(), STAKING);
    EXPECT_EQ(
        protocol.pool().reward_tokens(),
        (std::vector<Address>{REWARD6, REWARD18}));
    EXPECT_EQ(protocol.pool().reward_data(REWARD18).value().duration, DAY);
    EXPECT_EQ(protocol.processor().reward_route(REWARD6), SWAP_POOL);
    EXPECT_EQ(protocol.oracle().max_price_age(), DAY);
    EXPECT_TRUE(protocol.oracle().has_feed(REWARD6));
    EXPECT_FALSE(protocol.oracle().has_feed(REWARD18));
    EXPECT_TRUE(protocol.gateway().is_token_allowed(STAKING));
    EXPECT_FALSE(protocol.gateway().is_token_allowed(REWARD18));
    EXPECT_EQ(protocol.processor().get_account_slippage(ALICE), 150u);

    // a loaded protocol is immediately usable
    ASSERT_FALSE(Erc20(state, REWARD18)
                     .approve(DISTRIBUTOR, POOL, 10 * E18)
                     .has_error());
    EXPECT_FALSE(protocol.scheduler()
                     .notify_reward_amount(distributor, REWARD18, 10 * E18)
                     .has_error());
}

TEST_F(Genesis, load_is_all_or_nothing)
{
    auto j = genesis_json();
    // the route names a token that is never registered as a reward
    j["routes"][0]["token"] = "0x0000000000000000000000000000000000002000";
    auto const config = read_protocol_config(j);
    ASSERT_FALSE(config.has_error());

    auto const res = load_genesis(protocol, admin, config.value());
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::UnknownRewardToken);

    EXPECT_FALSE(Erc20(state, STAKING).exists());
    EXPECT_EQ(Erc20(state, STAKING).balance_of(ALICE), 0);
    EXPECT_EQ(protocol.pool().staking_token(), ZERO_ADDRESS);
    EXPECT_TRUE(protocol.pool().reward_tokens().empty());
    EXPECT_TRUE(state.logs().empty());
}

TEST_F(Genesis, load_rejects_past_timestamp)
{
    state.set_timestamp(GENESIS_TIME + 1);
    auto const config = read_protocol_config(genesis_json());
    ASSERT_FALSE(config.has_error());
    auto const res = load_genesis(protocol, admin, config.value());
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GenesisError::TimestampInPast);
    EXPECT_FALSE(Erc20(state, STAKING).exists());
}
