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

#pragma once

#include <gtest/gtest.h>

#include <yieldpool/core/bytes.hpp>
#include <yieldpool/core/int.hpp>
#include <yieldpool/core/result.hpp>
#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/core/contract/big_endian.hpp>
#include <yieldpool/execution/core/contract/storage_variable.hpp>
#include <yieldpool/execution/staking/price_oracle.hpp>
#include <yieldpool/execution/staking/protocol.hpp>
#include <yieldpool/execution/staking/satellite_strategy.hpp>
#include <yieldpool/execution/staking/swap_gateway.hpp>
#include <yieldpool/execution/staking/util/caller.hpp>
#include <yieldpool/execution/state/state.hpp>
#include <yieldpool/test/config.hpp>

#include <cstdint>

YIELDPOOL_TEST_NAMESPACE_BEGIN

using namespace intx::literals;

/// Venue that fills at the oracle price, less `skew_bps`, out of its own
/// inventory. A nonzero `shortfall` is withheld from every settlement.
class OracleSwapVenue final : public staking::SwapVenue
{
    State &state_;
    Address const address_;
    staking::FeedPriceOracle oracle_;

public:
    uint64_t skew_bps{0};
    uint256_t shortfall{0};
    uint64_t settled{0};

    OracleSwapVenue(State &, Address const &venue, Address const &oracle);

    Address const &address() const override
    {
        return address_;
    }

    Result<uint256_t> propose(
        Address const &pool, Address const &sell_token,
        Address const &buy_token, uint256_t const &sell_amount) override;

    Result<void> settle(staking::SwapOrder const &) override;
};

/// Satellite vault holding deposits of a single asset. Its owner and
/// deposits live in the ledger so they follow checkpoint rollback.
class VaultSatellite final : public staking::SatelliteStrategy
{
    State &state_;
    Address const address_;
    Address const asset_;

    StorageVariable<Address> owner_var() const noexcept;
    StorageVariable<u256_be> deposited_var() const noexcept;

public:
    VaultSatellite(
        State &, Address const &satellite, Address const &owner,
        Address const &asset);

    Address const &address() const override
    {
        return address_;
    }

    Address owner() const override;

    Address asset() const override
    {
        return asset_;
    }

    Result<void>
    deposit(Address const &from, uint256_t const &amount) override;

    void set_owner(Address const &);

    uint256_t deposited() const;
};

inline constexpr auto ADMIN{
    0x00000000000000000000000000000000000000ad_address};
inline constexpr auto GUARDIAN{
    0x00000000000000000000000000000000000000a9_address};
inline constexpr auto BACKEND{
    0x00000000000000000000000000000000000000be_address};
inline constexpr auto ALICE{
    0x00000000000000000000000000000000000000a1_address};
inline constexpr auto BOB{
    0x00000000000000000000000000000000000000b0_address};
inline constexpr auto DISTRIBUTOR{
    0x00000000000000000000000000000000000000d1_address};

inline constexpr auto POOL{0x0000000000000000000000000000000000001000_address};
inline constexpr auto PROCESSOR{
    0x0000000000000000000000000000000000001001_address};
inline constexpr auto GATEWAY{
    0x0000000000000000000000000000000000001002_address};
inline constexpr auto ORACLE{
    0x0000000000000000000000000000000000001003_address};
inline constexpr auto DIRECTORY{
    0x0000000000000000000000000000000000001004_address};
inline constexpr auto VENUE{
    0x0000000000000000000000000000000000001005_address};
inline constexpr auto SWAP_POOL{
    0x0000000000000000000000000000000000001006_address};

inline constexpr auto STAKING{
    0x0000000000000000000000000000000000002000_address};
inline constexpr auto REWARD6{
    0x0000000000000000000000000000000000002001_address};
inline constexpr auto REWARD8{
    0x0000000000000000000000000000000000002002_address};
inline constexpr auto REWARD18{
    0x0000000000000000000000000000000000002003_address};

inline constexpr uint64_t START_TIME{1'700'000'000};
inline constexpr uint64_t DAY{86'400};
inline constexpr uint64_t WEEK{7 * DAY};

// 10^18
inline constexpr uint256_t E18{1'000'000'000'000'000'000_u256};

inline staking::Caller const admin{
    .address = ADMIN, .roles = staking::RoleAdmin};
inline staking::Caller const guardian{
    .address = GUARDIAN, .roles = staking::RoleGuardian};
inline staking::Caller const backend{
    .address = BACKEND, .roles = staking::RoleBackend};
inline staking::Caller const alice{.address = ALICE};
inline staking::Caller const bob{.address = BOB};
inline staking::Caller const distributor{.address = DISTRIBUTOR};

/// Deployed and initialised protocol over a fresh ledger. The staking token
/// and three reward tokens of 6, 8 and 18 decimals exist but no reward
/// token is registered with the pool.
struct ProtocolFixture : public ::testing::Test
{
    State state{START_TIME};
    staking::SatelliteDirectory directory{state, DIRECTORY};
    OracleSwapVenue venue{state, VENUE, ORACLE};
    staking::Protocol protocol{
        state,
        staking::ProtocolAddresses{
            .pool = POOL,
            .processor = PROCESSOR,
            .gateway = GATEWAY,
            .oracle = ORACLE},
        venue,
        directory};

    void SetUp() override;

    staking::RewardAccountingEngine &pool()
    {
        return protocol.pool();
    }

    staking::RewardEmissionScheduler &scheduler()
    {
        return protocol.scheduler();
    }

    staking::StrategyRewardProcessor &processor()
    {
        return protocol.processor();
    }

    staking::SwapGateway &gateway()
    {
        return protocol.gateway();
    }

    staking::FeedPriceOracle &oracle()
    {
        return protocol.oracle();
    }

    void deploy(Address const &token, uint8_t decimals);

    void mint(Address const &token, Address const &to, uint256_t const &);

    uint256_t balance(Address const &token, Address const &holder);

    void add_reward(Address const &token, uint64_t duration = WEEK);

    /// Funds the distributor and notifies `amount` of `token`
    void notify(Address const &token, uint256_t const &amount);

    /// Mints, approves and stakes for `account`
    void stake_as(Address const &account, uint256_t const &amount);

    void advance(uint64_t seconds);

    /// Prices every token and allow-lists it with the gateway
    void enable_swaps();
};

YIELDPOOL_TEST_NAMESPACE_END
