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

#include <yieldpool/core/bytes.hpp>
#include <yieldpool/core/int.hpp>
#include <yieldpool/core/result.hpp>
#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/core/contract/big_endian.hpp>
#include <yieldpool/execution/core/contract/storage_array.hpp>
#include <yieldpool/execution/core/contract/storage_variable.hpp>
#include <yieldpool/execution/staking/config.hpp>

#include <cstdint>
#include <vector>

YIELDPOOL_NAMESPACE_BEGIN

class State;

YIELDPOOL_NAMESPACE_END

YIELDPOOL_STAKING_NAMESPACE_BEGIN

struct RewardParams
{
    Address distributor;
    u8_be decimals;
    u64_be duration;
};

static_assert(StorageVariable<RewardParams>::N == 1);

struct RewardPeriod
{
    u64_be period_finish;
    u64_be last_update_time;
};

static_assert(StorageVariable<RewardPeriod>::N == 1);

// Plain copy of a token's emission state, for views and logging
struct RewardConfig
{
    Address token{};
    Address distributor{};
    uint8_t decimals{0};
    uint64_t duration{0};
    uint64_t period_finish{0};
    uint64_t last_update_time{0};
    uint256_t reward_rate{0};
    uint256_t reward_per_token_stored{0};
};

// Pool storage view over one reward token's emission state.
class RewardData
{
    State &state_;
    Address const &address_;
    uint256_t const key_;

public:
    ////////////
    // Layout //
    ////////////
    struct Offsets
    {
        static constexpr size_t params = 0;
        static constexpr size_t period =
            params + StorageVariable<RewardParams>::N;
        static constexpr size_t reward_rate =
            period + StorageVariable<RewardPeriod>::N;
        static constexpr size_t reward_per_token_stored =
            reward_rate + StorageVariable<u256_be>::N;
        static constexpr size_t generation =
            reward_per_token_stored + StorageVariable<u256_be>::N;
        static constexpr size_t registered_reward_per_token =
            generation + StorageVariable<u64_be>::N;
    };

    RewardData(State &state, Address const &address, bytes32_t const &key)
        : state_{state}
        , address_{address}
        , key_{intx::be::load<uint256_t>(key)}
    {
    }

    // Distributor, decimals and emission duration. Written by governance.
    StorageVariable<RewardParams> params() const noexcept
    {
        return {state_, address_, key_ + Offsets::params};
    }

    // End of the current emission window and the last time the accumulator
    // was brought up to date.
    StorageVariable<RewardPeriod> period() const noexcept
    {
        return {state_, address_, key_ + Offsets::period};
    }

    // Reward units per second, scaled by 10^(36 - decimals)
    StorageVariable<u256_be> reward_rate() const noexcept
    {
        return {state_, address_, key_ + Offsets::reward_rate};
    }

    // Monotonic accumulator. Frozen while the token is unregistered.
    StorageVariable<u256_be> reward_per_token_stored() const noexcept
    {
        return {state_, address_, key_ + Offsets::reward_per_token_stored};
    }

    // Number of times the token has been removed. Account snapshots taken
    // under an older generation belong to a previous registration.
    StorageVariable<u64_be> generation() const noexcept
    {
        return {state_, address_, key_ + Offsets::generation};
    }

    // Accumulator value when the current registration began. Accounts with
    // no snapshot in this generation accrue from here.
    StorageVariable<u256_be> registered_reward_per_token() const noexcept
    {
        return {state_, address_, key_ + Offsets::registered_reward_per_token};
    }
};

/// Indexed arena of reward tokens: a dense array of token addresses plus a
/// token -> (index + 1) map, with the per-token emission state kept beside
/// them. Removal swaps the last token into the freed position.
class RewardTokenRegistry
{
    State &state_;
    Address const &pool_;

    StorageArray<Address> tokens_;

    StorageVariable<u64_be> index_of(Address const &token) const noexcept;

public:
    RewardTokenRegistry(State &, Address const &pool);

    bool contains(Address const &token) const;

    uint64_t size() const;

    std::vector<Address> tokens() const;

    RewardData data(Address const &token) const noexcept;

    Result<RewardConfig> config(Address const &token) const;

    Result<void> insert(
        Address const &token, Address const &distributor, uint8_t decimals,
        uint64_t duration);

    Result<void> remove(Address const &token);
};

YIELDPOOL_STAKING_NAMESPACE_END
