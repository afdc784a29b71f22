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

#include <yieldpool/core/assert.h>
#include <yieldpool/core/likely.h>
#include <yieldpool/execution/core/contract/storage_key.hpp>
#include <yieldpool/execution/staking/reward_token_registry.hpp>
#include <yieldpool/execution/staking/util/staking_error.hpp>
#include <yieldpool/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>

YIELDPOOL_STAKING_ANONYMOUS_NAMESPACE_BEGIN

// Namespaces owned by the registry inside the pool's storage
constexpr auto TOKENS_SLOT{
    0x1000000000000000000000000000000000000000000000000000000000000000_bytes32};

enum Namespace : uint8_t
{
    NSRewardIndex = 0x11,
    NSRewardData = 0x12,
};

YIELDPOOL_STAKING_ANONYMOUS_NAMESPACE_END

YIELDPOOL_STAKING_NAMESPACE_BEGIN

RewardTokenRegistry::RewardTokenRegistry(State &state, Address const &pool)
    : state_{state}
    , pool_{pool}
    , tokens_{state, pool, TOKENS_SLOT}
{
}

StorageVariable<u64_be>
RewardTokenRegistry::index_of(Address const &token) const noexcept
{
    return {state_, pool_, mapping_slot(NSRewardIndex, token)};
}

bool RewardTokenRegistry::contains(Address const &token) const
{
    return index_of(token).load().native() != 0;
}

uint64_t RewardTokenRegistry::size() const
{
    return tokens_.length();
}

std::vector<Address> RewardTokenRegistry::tokens() const
{
    return tokens_.load_all();
}

RewardData RewardTokenRegistry::data(Address const &token) const noexcept
{
    return {state_, pool_, mapping_slot(NSRewardData, token)};
}

Result<RewardConfig> RewardTokenRegistry::config(Address const &token) const
{
    if (YIELDPOOL_UNLIKELY(!contains(token))) {
        return StakingError::UnknownRewardToken;
    }
    auto const rd = data(token);
    auto const params = rd.params().load();
    auto const period = rd.period().load();
    return RewardConfig{
        .token = token,
        .distributor = params.distributor,
        .decimals = params.decimals.native(),
        .duration = params.duration.native(),
        .period_finish = period.period_finish.native(),
        .last_update_time = period.last_update_time.native(),
        .reward_rate = rd.reward_rate().load().native(),
        .reward_per_token_stored = rd.reward_per_token_stored().load().native(),
    };
}

Result<void> RewardTokenRegistry::insert(
    Address const &token, Address const &distributor, uint8_t const decimals,
    uint64_t const duration)
{
    if (YIELDPOOL_UNLIKELY(contains(token))) {
        return StakingError::RewardTokenExists;
    }
    tokens_.push(token);
    index_of(token).store(tokens_.length());

    auto const rd = data(token);
    rd.params().store(RewardParams{
        .distributor = distributor, .decimals = decimals, .duration = duration});
    rd.period().clear();
    rd.reward_rate().clear();
    rd.registered_reward_per_token().store(rd.reward_per_token_stored().load());
    return outcome::success();
}

Result<void> RewardTokenRegistry::remove(Address const &token)
{
    auto index = index_of(token);
    uint64_t const position = index.load().native();
    if (YIELDPOOL_UNLIKELY(position == 0)) {
        return StakingError::UnknownRewardToken;
    }
    YIELDPOOL_ASSERT(position <= tokens_.length());
    YIELDPOOL_ASSERT(tokens_.get(position - 1).load() == token);

    auto const moved = tokens_.swap_remove(position - 1);
    if (moved.has_value()) {
        index_of(moved.value()).store(position);
    }
    index.clear();

    auto const rd = data(token);
    rd.params().clear();
    rd.period().clear();
    rd.reward_rate().clear();
    rd.generation().store(rd.generation().load().native() + 1);
    return outcome::success();
}

YIELDPOOL_STAKING_NAMESPACE_END
