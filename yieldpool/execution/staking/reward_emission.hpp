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
#include <yieldpool/execution/staking/config.hpp>
#include <yieldpool/execution/staking/util/caller.hpp>

#include <cstdint>

YIELDPOOL_STAKING_NAMESPACE_BEGIN

class RewardAccountingEngine;

/// Reward token lifecycle and the notify/rollover algorithm that turns a
/// funded amount into a per-second emission rate.
class RewardEmissionScheduler
{
    RewardAccountingEngine &engine_;

public:
    explicit RewardEmissionScheduler(RewardAccountingEngine &);

    Result<void> add_reward(
        Caller const &, Address const &token, Address const &distributor,
        uint64_t duration);

    /// Only once the token's emission window has ended.
    Result<void> remove_reward(Caller const &, Address const &token);

    /// Pulls `amount` from the distributor and emits it over a fresh window.
    /// Anything still undistributed from the current window is rolled into
    /// the new rate.
    Result<void> notify_reward_amount(
        Caller const &, Address const &token, uint256_t const &amount);

    Result<void> set_rewards_duration(
        Caller const &, Address const &token, uint64_t duration);

    Result<void> set_rewards_distributor(
        Caller const &, Address const &token, Address const &distributor);

    /// Unscaled amount emitted over a full window at the current rate
    Result<uint256_t> reward_for_duration(Address const &token) const;
};

YIELDPOOL_STAKING_NAMESPACE_END
