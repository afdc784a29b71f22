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

#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/staking/config.hpp>
#include <yieldpool/execution/staking/price_oracle.hpp>
#include <yieldpool/execution/staking/reward_accounting.hpp>
#include <yieldpool/execution/staking/reward_emission.hpp>
#include <yieldpool/execution/staking/strategy_reward_processor.hpp>
#include <yieldpool/execution/staking/swap_gateway.hpp>

YIELDPOOL_NAMESPACE_BEGIN

class State;

YIELDPOOL_NAMESPACE_END

YIELDPOOL_STAKING_NAMESPACE_BEGIN

class StrategyRegistry;

struct ProtocolAddresses
{
    Address pool{};
    Address processor{};
    Address gateway{};
    Address oracle{};
};

// The protocol contracts wired together over one ledger
class Protocol
{
    State &state_;
    RewardAccountingEngine pool_;
    RewardEmissionScheduler scheduler_;
    FeedPriceOracle oracle_;
    SwapGateway gateway_;
    StrategyRewardProcessor processor_;

public:
    Protocol(
        State &, ProtocolAddresses const &, SwapVenue &,
        StrategyRegistry const &);

    Protocol(Protocol const &) = delete;
    Protocol &operator=(Protocol const &) = delete;

    State &state() noexcept
    {
        return state_;
    }

    RewardAccountingEngine &pool() noexcept
    {
        return pool_;
    }

    RewardEmissionScheduler &scheduler() noexcept
    {
        return scheduler_;
    }

    FeedPriceOracle &oracle() noexcept
    {
        return oracle_;
    }

    SwapGateway &gateway() noexcept
    {
        return gateway_;
    }

    StrategyRewardProcessor &processor() noexcept
    {
        return processor_;
    }
};

YIELDPOOL_STAKING_NAMESPACE_END
