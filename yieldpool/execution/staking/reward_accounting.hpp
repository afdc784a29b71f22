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

#include <yieldpool/core/int.hpp>
#include <yieldpool/core/result.hpp>
#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/core/contract/big_endian.hpp>
#include <yieldpool/execution/core/contract/storage_key.hpp>
#include <yieldpool/execution/core/contract/storage_variable.hpp>
#include <yieldpool/execution/staking/config.hpp>
#include <yieldpool/execution/staking/reward_token_registry.hpp>
#include <yieldpool/execution/staking/util/caller.hpp>

#include <cstdint>
#include <vector>

YIELDPOOL_NAMESPACE_BEGIN

class State;

YIELDPOOL_NAMESPACE_END

YIELDPOOL_STAKING_NAMESPACE_BEGIN

struct UserReward
{
    u256_be reward_per_token_paid;
    u256_be rewards;
    u64_be generation;
};

static_assert(StorageVariable<UserReward>::N == 3);

struct RewardPayout
{
    Address token;
    uint256_t amount;

    friend bool operator==(RewardPayout const &, RewardPayout const &) = default;
};

/// Shared staking pool. Tracks every account's staked balance and, for each
/// registered reward token, a reward-per-token-staked accumulator from which
/// any account's entitlement is derived without iterating over accounts.
///
/// Every mutating entry point runs in its own ledger checkpoint: it either
/// applies completely or leaves no trace.
class RewardAccountingEngine
{
    State &state_;
    Address const pool_;
    RewardTokenRegistry registry_;

    class Variables
    {
        State &state_;
        Address const &pool_;

    public:
        Variables(State &state, Address const &pool)
            : state_{state}
            , pool_{pool}
        {
        }

        // Token accepted by stake() and paid out by withdraw()
        StorageVariable<Address> staking_token{
            state_, pool_, variable_slot(1)};

        // Sum of all staked balances
        StorageVariable<u256_be> total_supply{
            state_, pool_, variable_slot(2)};

        // Deposits are halted while set. Never consulted by exits.
        StorageVariable<bool> paused{state_, pool_, variable_slot(3)};

        // mapping(address => uint256) balance
        StorageVariable<u256_be> balance(Address const &account) const noexcept;

        // mapping(address => mapping(address => UserReward))
        StorageVariable<UserReward>
        user_reward(Address const &account, Address const &token) const;
    };

    Variables vars_;

    Result<uint256_t> reward_per_token(RewardData const &) const;

    // account's snapshot for token; one taken before the token's last
    // removal reads as settled at the start of the current registration
    UserReward user_snapshot(
        Address const &account, Address const &token,
        RewardData const &) const;

    Result<uint256_t> earned(
        Address const &account, Address const &token, RewardData const &,
        uint256_t const &reward_per_token) const;

    Result<void> stake_(Caller const &, uint256_t const &amount);
    Result<void> withdraw_(Caller const &, uint256_t const &amount);
    Result<std::vector<RewardPayout>> get_reward_(Caller const &);

public:
    RewardAccountingEngine(State &, Address const &pool);

    RewardAccountingEngine(RewardAccountingEngine const &) = delete;
    RewardAccountingEngine &operator=(RewardAccountingEngine const &) = delete;

    State &state() noexcept
    {
        return state_;
    }

    Address const &address() const noexcept
    {
        return pool_;
    }

    RewardTokenRegistry &registry() noexcept
    {
        return registry_;
    }

    RewardTokenRegistry const &registry() const noexcept
    {
        return registry_;
    }

    ///////////////
    // Lifecycle //
    ///////////////

    Result<void> initialize(Caller const &, Address const &staking_token);

    Address staking_token() const;

    /// Guardian or admin only. Blocks stake(); withdraw, exit and harvest
    /// stay available.
    Result<void> set_paused(Caller const &, bool paused);

    bool paused() const;

    /// Sends tokens that are neither staked nor emitted back to the admin.
    Result<void> recover_erc20(
        Caller const &, Address const &token, uint256_t const &amount);

    ////////////////
    // Accounting //
    ////////////////

    /// Brings every reward token's accumulator up to date and, unless
    /// `account` is the zero address, settles that account's rewards. Runs
    /// in registry order.
    Result<void> update_reward(Address const &account);

    Result<void> stake(Caller const &, uint256_t const &amount);

    Result<void> withdraw(Caller const &, uint256_t const &amount);

    /// Pays out every nonzero accrued reward. Calling it again right away
    /// returns an empty list.
    Result<std::vector<RewardPayout>> get_reward(Caller const &);

    /// withdraw(balance) and get_reward() as one unit
    Result<std::vector<RewardPayout>> exit(Caller const &);

    ///////////
    // Views //
    ///////////

    Result<uint256_t>
    earned(Address const &account, Address const &token) const;

    Result<uint256_t> reward_per_token(Address const &token) const;

    Result<uint64_t> last_time_reward_applicable(Address const &token) const;

    uint256_t balance_of(Address const &account) const;

    uint256_t total_supply() const;

    Result<RewardConfig> reward_data(Address const &token) const;

    std::vector<Address> reward_tokens() const;
};

YIELDPOOL_STAKING_NAMESPACE_END
