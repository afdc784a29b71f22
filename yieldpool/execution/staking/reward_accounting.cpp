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
#include <yieldpool/core/likely.h>
#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/core/contract/abi_encode.hpp>
#include <yieldpool/execution/core/contract/checked_math.hpp>
#include <yieldpool/execution/core/contract/events.hpp>
#include <yieldpool/execution/core/contract/storage_key.hpp>
#include <yieldpool/execution/core/fmt/address_fmt.hpp>
#include <yieldpool/execution/staking/reward_accounting.hpp>
#include <yieldpool/execution/staking/util/constants.hpp>
#include <yieldpool/execution/staking/util/staking_error.hpp>
#include <yieldpool/execution/state/atomic.hpp>
#include <yieldpool/execution/state/state.hpp>
#include <yieldpool/execution/token/erc20.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>

YIELDPOOL_STAKING_ANONYMOUS_NAMESPACE_BEGIN

enum Namespace : uint8_t
{
    NSBalance = 0x01,
    NSUserReward = 0x02,
};

YIELDPOOL_STAKING_ANONYMOUS_NAMESPACE_END

YIELDPOOL_STAKING_NAMESPACE_BEGIN

StorageVariable<u256_be> RewardAccountingEngine::Variables::balance(
    Address const &account) const noexcept
{
    return {state_, pool_, mapping_slot(NSBalance, account)};
}

StorageVariable<UserReward> RewardAccountingEngine::Variables::user_reward(
    Address const &account, Address const &token) const
{
    return {state_, pool_, mapping_slot(NSUserReward, account, token)};
}

RewardAccountingEngine::RewardAccountingEngine(
    State &state, Address const &pool)
    : state_{state}
    , pool_{pool}
    , registry_{state, pool_}
    , vars_{state, pool_}
{
}

Result<void> RewardAccountingEngine::initialize(
    Caller const &caller, Address const &staking_token)
{
    return atomically(state_, [&]() -> Result<void> {
        if (YIELDPOOL_UNLIKELY(!caller.has(RoleAdmin))) {
            return StakingError::NotAdmin;
        }
        if (YIELDPOOL_UNLIKELY(staking_token == ZERO_ADDRESS)) {
            return StakingError::ZeroAddress;
        }
        if (YIELDPOOL_UNLIKELY(vars_.staking_token.load() != ZERO_ADDRESS)) {
            return StakingError::AlreadyInitialized;
        }
        BOOST_OUTCOME_TRY(Erc20(state_, staking_token).decimals());
        vars_.staking_token.store(staking_token);

        LOG_INFO("pool {} initialized, staking token {}", pool_, staking_token);
        return outcome::success();
    });
}

Address RewardAccountingEngine::staking_token() const
{
    return vars_.staking_token.load();
}

Result<void>
RewardAccountingEngine::set_paused(Caller const &caller, bool const paused)
{
    return atomically(state_, [&]() -> Result<void> {
        if (YIELDPOOL_UNLIKELY(
                !caller.has(RoleGuardian) && !caller.has(RoleAdmin))) {
            return StakingError::NotGuardian;
        }
        vars_.paused.store(paused);

        auto event =
            EventBuilder(
                pool_, paused ? "Paused(address)" : "Unpaused(address)")
                .add_data(abi_encode_address(caller.address))
                .build();
        state_.store_log(event);

        LOG_INFO(
            "pool {} deposits {} by {}",
            pool_,
            paused ? "paused" : "unpaused",
            caller.address);
        return outcome::success();
    });
}

bool RewardAccountingEngine::paused() const
{
    return vars_.paused.load();
}

Result<void> RewardAccountingEngine::recover_erc20(
    Caller const &caller, Address const &token, uint256_t const &amount)
{
    return atomically(state_, [&]() -> Result<void> {
        if (YIELDPOOL_UNLIKELY(!caller.has(RoleAdmin))) {
            return StakingError::NotAdmin;
        }
        if (YIELDPOOL_UNLIKELY(amount == 0)) {
            return StakingError::ZeroAmount;
        }
        if (YIELDPOOL_UNLIKELY(
                token == vars_.staking_token.load() ||
                registry_.contains(token))) {
            return StakingError::CannotRecoverToken;
        }
        BOOST_OUTCOME_TRY(
            Erc20(state_, token).transfer(pool_, caller.address, amount));

        auto event = EventBuilder(pool_, "Recovered(address,uint256)")
                         .add_topic(abi_encode_address(token))
                         .add_data(abi_encode_uint(amount))
                         .build();
        state_.store_log(event);
        return outcome::success();
    });
}

Result<uint256_t>
RewardAccountingEngine::reward_per_token(RewardData const &rd) const
{
    uint256_t const stored = rd.reward_per_token_stored().load().native();
    uint256_t const supply = vars_.total_supply.load().native();
    if (supply == 0) {
        return stored;
    }
    auto const period = rd.period().load();
    uint64_t const applicable =
        std::min(state_.timestamp(), period.period_finish.native());
    uint64_t const last = period.last_update_time.native();
    if (applicable <= last) {
        return stored;
    }
    BOOST_OUTCOME_TRY(
        auto const accrued,
        mul_div(applicable - last, rd.reward_rate().load().native(), supply));
    return checked_add(stored, accrued);
}

UserReward RewardAccountingEngine::user_snapshot(
    Address const &account, Address const &token, RewardData const &rd) const
{
    auto const user = vars_.user_reward(account, token).load();
    uint64_t const generation = rd.generation().load().native();
    if (user.generation.native() != generation) {
        return UserReward{
            .reward_per_token_paid = rd.registered_reward_per_token().load(),
            .rewards = uint256_t{0},
            .generation = generation};
    }
    return user;
}

Result<uint256_t> RewardAccountingEngine::earned(
    Address const &account, Address const &token, RewardData const &rd,
    uint256_t const &reward_per_token) const
{
    auto const user = user_snapshot(account, token, rd);
    auto const decimals = rd.params().load().decimals.native();
    BOOST_OUTCOME_TRY(
        auto const delta,
        checked_sub(reward_per_token, user.reward_per_token_paid.native()));
    BOOST_OUTCOME_TRY(
        auto const accrued,
        mul_div(
            vars_.balance(account).load().native(),
            delta,
            rate_scale(decimals)));
    return checked_add(user.rewards.native(), accrued);
}

Result<void> RewardAccountingEngine::update_reward(Address const &account)
{
    for (Address const &token : registry_.tokens()) {
        auto const rd = registry_.data(token);
        BOOST_OUTCOME_TRY(auto const rpt, reward_per_token(rd));
        rd.reward_per_token_stored().store(rpt);

        auto period = rd.period().load();
        period.last_update_time =
            std::min(state_.timestamp(), period.period_finish.native());
        rd.period().store(period);

        if (account != ZERO_ADDRESS) {
            BOOST_OUTCOME_TRY(auto const owed, earned(account, token, rd, rpt));
            vars_.user_reward(account, token)
                .store(UserReward{
                    .reward_per_token_paid = rpt,
                    .rewards = owed,
                    .generation = rd.generation().load()});
        }
    }
    return outcome::success();
}

Result<void>
RewardAccountingEngine::stake_(Caller const &caller, uint256_t const &amount)
{
    if (YIELDPOOL_UNLIKELY(amount == 0)) {
        return StakingError::ZeroAmount;
    }
    if (YIELDPOOL_UNLIKELY(caller.address == ZERO_ADDRESS)) {
        return StakingError::ZeroAddress;
    }
    Address const token = vars_.staking_token.load();
    if (YIELDPOOL_UNLIKELY(token == ZERO_ADDRESS)) {
        return StakingError::NotInitialized;
    }
    if (YIELDPOOL_UNLIKELY(vars_.paused.load())) {
        return StakingError::Paused;
    }

    BOOST_OUTCOME_TRY(update_reward(caller.address));
    BOOST_OUTCOME_TRY(Erc20(state_, token).transfer_from(
        pool_, caller.address, pool_, amount));

    BOOST_OUTCOME_TRY(
        auto const supply,
        checked_add(vars_.total_supply.load().native(), amount));
    vars_.total_supply.store(supply);
    auto balance = vars_.balance(caller.address);
    balance.store(balance.load().native() + amount);

    auto event = EventBuilder(pool_, "Staked(address,uint256)")
                     .add_topic(abi_encode_address(caller.address))
                     .add_data(abi_encode_uint(amount))
                     .build();
    state_.store_log(event);
    return outcome::success();
}

Result<void>
RewardAccountingEngine::withdraw_(Caller const &caller, uint256_t const &amount)
{
    if (YIELDPOOL_UNLIKELY(amount == 0)) {
        return StakingError::ZeroAmount;
    }
    auto balance = vars_.balance(caller.address);
    uint256_t const staked = balance.load().native();
    if (YIELDPOOL_UNLIKELY(staked < amount)) {
        return StakingError::InsufficientStake;
    }

    BOOST_OUTCOME_TRY(update_reward(caller.address));
    vars_.total_supply.store(vars_.total_supply.load().native() - amount);
    balance.store(staked - amount);
    BOOST_OUTCOME_TRY(Erc20(state_, vars_.staking_token.load())
                          .transfer(pool_, caller.address, amount));

    auto event = EventBuilder(pool_, "Withdrawn(address,uint256)")
                     .add_topic(abi_encode_address(caller.address))
                     .add_data(abi_encode_uint(amount))
                     .build();
    state_.store_log(event);
    return outcome::success();
}

Result<std::vector<RewardPayout>>
RewardAccountingEngine::get_reward_(Caller const &caller)
{
    BOOST_OUTCOME_TRY(update_reward(caller.address));

    std::vector<RewardPayout> payouts;
    for (Address const &token : registry_.tokens()) {
        auto user_reward = vars_.user_reward(caller.address, token);
        auto user = user_reward.load();
        uint256_t const reward = user.rewards.native();
        if (reward == 0) {
            continue;
        }
        user.rewards = 0;
        user_reward.store(user);
        BOOST_OUTCOME_TRY(
            Erc20(state_, token).transfer(pool_, caller.address, reward));

        auto event =
            EventBuilder(pool_, "RewardPaid(address,address,uint256)")
                .add_topic(abi_encode_address(caller.address))
                .add_topic(abi_encode_address(token))
                .add_data(abi_encode_uint(reward))
                .build();
        state_.store_log(event);
        payouts.push_back(RewardPayout{.token = token, .amount = reward});
    }
    return payouts;
}

Result<void>
RewardAccountingEngine::stake(Caller const &caller, uint256_t const &amount)
{
    return atomically(state_, [&] { return stake_(caller, amount); });
}

Result<void>
RewardAccountingEngine::withdraw(Caller const &caller, uint256_t const &amount)
{
    return atomically(state_, [&] { return withdraw_(caller, amount); });
}

Result<std::vector<RewardPayout>>
RewardAccountingEngine::get_reward(Caller const &caller)
{
    return atomically(state_, [&] { return get_reward_(caller); });
}

Result<std::vector<RewardPayout>>
RewardAccountingEngine::exit(Caller const &caller)
{
    return atomically(
        state_, [&]() -> Result<std::vector<RewardPayout>> {
            uint256_t const staked =
                vars_.balance(caller.address).load().native();
            if (YIELDPOOL_UNLIKELY(staked == 0)) {
                return StakingError::NothingToWithdraw;
            }
            BOOST_OUTCOME_TRY(withdraw_(caller, staked));
            return get_reward_(caller);
        });
}

Result<uint256_t> RewardAccountingEngine::earned(
    Address const &account, Address const &token) const
{
    if (YIELDPOOL_UNLIKELY(!registry_.contains(token))) {
        return StakingError::UnknownRewardToken;
    }
    auto const rd = registry_.data(token);
    BOOST_OUTCOME_TRY(auto const rpt, reward_per_token(rd));
    return earned(account, token, rd, rpt);
}

Result<uint256_t>
RewardAccountingEngine::reward_per_token(Address const &token) const
{
    if (YIELDPOOL_UNLIKELY(!registry_.contains(token))) {
        return StakingError::UnknownRewardToken;
    }
    return reward_per_token(registry_.data(token));
}

Result<uint64_t>
RewardAccountingEngine::last_time_reward_applicable(Address const &token) const
{
    if (YIELDPOOL_UNLIKELY(!registry_.contains(token))) {
        return StakingError::UnknownRewardToken;
    }
    auto const period = registry_.data(token).period().load();
    return std::min(state_.timestamp(), period.period_finish.native());
}

uint256_t RewardAccountingEngine::balance_of(Address const &account) const
{
    return vars_.balance(account).load().native();
}

uint256_t RewardAccountingEngine::total_supply() const
{
    return vars_.total_supply.load().native();
}

Result<RewardConfig>
RewardAccountingEngine::reward_data(Address const &token) const
{
    return registry_.config(token);
}

std::vector<Address> RewardAccountingEngine::reward_tokens() const
{
    return registry_.tokens();
}

YIELDPOOL_STAKING_NAMESPACE_END
