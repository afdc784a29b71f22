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
#include <yieldpool/execution/core/contract/storage_variable.hpp>
#include <yieldpool/execution/staking/config.hpp>
#include <yieldpool/execution/staking/util/caller.hpp>

#include <ankerl/unordered_dense.h>

YIELDPOOL_NAMESPACE_BEGIN

class State;

YIELDPOOL_NAMESPACE_END

YIELDPOOL_STAKING_NAMESPACE_BEGIN

/// Independent yield position owned by an end user. Receives one reward
/// token (its asset) when the owner's account runs in reinvest mode.
class SatelliteStrategy
{
public:
    virtual ~SatelliteStrategy() = default;

    virtual Address const &address() const = 0;

    virtual Address owner() const = 0;

    virtual Address asset() const = 0;

    /// Pulls `amount` of the asset from `from`, which has approved it.
    virtual Result<void>
    deposit(Address const &from, uint256_t const &amount) = 0;
};

class StrategyRegistry
{
public:
    virtual ~StrategyRegistry() = default;

    virtual bool
    is_user_strategy(Address const &owner, Address const &strategy) const = 0;

    /// nullptr if `strategy` is not a known satellite
    virtual SatelliteStrategy *find(Address const &strategy) const = 0;
};

/// Registry of satellites deployed for users. Ownership records are kept in
/// the ledger; the strategy objects themselves are not owned.
class SatelliteDirectory final : public StrategyRegistry
{
    State &state_;
    Address const address_;
    ankerl::unordered_dense::map<Address, SatelliteStrategy *> strategies_;

    StorageVariable<bool>
    user_strategy(Address const &owner, Address const &strategy) const;

public:
    SatelliteDirectory(State &, Address const &directory);

    Result<void> register_strategy(Caller const &, SatelliteStrategy &);

    bool is_user_strategy(
        Address const &owner, Address const &strategy) const override;

    SatelliteStrategy *find(Address const &strategy) const override;
};

YIELDPOOL_STAKING_NAMESPACE_END
