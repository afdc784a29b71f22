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
#include <yieldpool/execution/core/contract/storage_variable.hpp>
#include <yieldpool/execution/staking/config.hpp>
#include <yieldpool/execution/staking/reward_accounting.hpp>
#include <yieldpool/execution/staking/slippage_guard.hpp>
#include <yieldpool/execution/staking/util/caller.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

YIELDPOOL_NAMESPACE_BEGIN

class State;

YIELDPOOL_NAMESPACE_END

YIELDPOOL_STAKING_NAMESPACE_BEGIN

class SatelliteStrategy;
class StrategyRegistry;
class SwapGateway;

enum class CompoundMode : uint8_t
{
    Compound = 0,
    Reinvest = 1,
};

struct AccountRecord
{
    Address owner;
    u8_be mode;
};

static_assert(StorageVariable<AccountRecord>::N == 1);

struct AccountInfo
{
    Address owner{};
    CompoundMode mode{CompoundMode::Compound};
    uint64_t slippage_bps{0};
};

struct ProcessingReport
{
    CompoundMode mode{CompoundMode::Compound};
    std::vector<RewardPayout> harvested{};
    uint256_t restaked{0};
};

/// Per-account reward policy. A backend periodically harvests an account's
/// rewards from the pool and either compounds everything into the staking
/// token or restakes the staking token and forwards the rest to the owner's
/// satellite strategies. A processing call applies completely or not at all.
///
/// Accounts stake in the pool under their own address; the owner moves the
/// staking token in and out through deposit and withdraw.
class StrategyRewardProcessor
{
    State &state_;
    Address const address_;
    RewardAccountingEngine &engine_;
    SwapGateway &gateway_;
    StrategyRegistry const &strategies_;
    SlippageGuard slippage_;

    StorageVariable<AccountRecord> record(Address const &account) const;
    StorageVariable<Address> route(Address const &token) const;

    Result<AccountRecord>
    owned_account(Caller const &, Address const &account) const;

    std::vector<Address> reinvest_tokens() const;

    Result<std::vector<SatelliteStrategy *>> resolve_destinations(
        AccountRecord const &, std::span<Address const> strategies) const;

    Result<void> restake(Address const &account, uint256_t const &amount);

    Result<ProcessingReport> process_rewards_(
        Caller const &, Address const &account,
        std::span<Address const> strategies);

public:
    StrategyRewardProcessor(
        State &, Address const &processor, RewardAccountingEngine &,
        SwapGateway &, StrategyRegistry const &);

    Address const &address() const noexcept
    {
        return address_;
    }

    SlippageGuard &slippage() noexcept
    {
        return slippage_;
    }

    //////////////
    // Accounts //
    //////////////

    /// Admin only, on behalf of the account factory
    Result<void> create_account(
        Caller const &, Address const &account, Address const &owner);

    Result<AccountInfo> account(Address const &account) const;

    Result<void>
    set_compound_mode(Caller const &, Address const &account, CompoundMode);

    Result<void> set_account_slippage(
        Caller const &, Address const &account, uint64_t bps);

    uint64_t get_account_slippage(Address const &account) const;

    Result<void> set_default_slippage(Caller const &, uint64_t bps);

    /// Pulls the staking token from the owner and stakes it for `account`
    Result<void>
    deposit(Caller const &, Address const &account, uint256_t const &amount);

    /// Unstakes and returns the tokens to the owner. Never pause-gated.
    Result<void>
    withdraw(Caller const &, Address const &account, uint256_t const &amount);

    /// Exits the pool and hands the principal and every pending reward to
    /// the owner.
    Result<std::vector<RewardPayout>>
    withdraw_all(Caller const &, Address const &account);

    ////////////
    // Routes //
    ////////////

    /// Swap pool used when `token` is compounded
    Result<void> set_reward_route(
        Caller const &, Address const &token, Address const &swap_pool);

    Result<void> remove_reward_route(Caller const &, Address const &token);

    std::optional<Address> reward_route(Address const &token) const;

    ////////////////
    // Processing //
    ////////////////

    /// Backend only. In reinvest mode `strategies` names one satellite per
    /// non-staking reward token, in registry order; it is ignored when
    /// compounding.
    Result<ProcessingReport> process_rewards(
        Caller const &, Address const &account,
        std::span<Address const> strategies);
};

YIELDPOOL_STAKING_NAMESPACE_END
