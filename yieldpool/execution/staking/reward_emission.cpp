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
#include <yieldpool/execution/core/fmt/address_fmt.hpp>
#include <yieldpool/execution/core/fmt/int_fmt.hpp>
#include <yieldpool/execution/staking/reward_accounting.hpp>
#include <yieldpool/execution/staking/reward_emission.hpp>
#include <yieldpool/execution/staking/reward_token_registry.hpp>
#include <yieldpool/execution/staking/util/constants.hpp>
#include <yieldpool/execution/staking/util/staking_error.hpp>
#include <yieldpool/execution/state/atomic.hpp>
#include <yieldpool/execution/state/state.hpp>
#include <yieldpool/execution/token/erc20.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

YIELDPOOL_STAKING_NAMESPACE_BEGIN

RewardEmissionScheduler::RewardEmissionScheduler(RewardAccountingEngine &engine)
    : engine_{engine}
{
}

Result<void> RewardEmissionScheduler::add_reward(
    Caller const &caller, Address const &token, Address const &distributor,
    uint64_t const duration)
{
    return atomically(engine_.state(), [&]() -> Result<void> {
        if (YIELDPOOL_UNLIKELY(!caller.has(RoleAdmin))) {
            return StakingError::NotAdmin;
        }
        if (YIELDPOOL_UNLIKELY(
                token == ZERO_ADDRESS || distributor == ZERO_ADDRESS)) {
            return StakingError::ZeroAddress;
        }
        if (YIELDPOOL_UNLIKELY(engine_.staking_token() == ZERO_ADDRESS)) {
            return StakingError::NotInitialized;
        }
        if (YIELDPOOL_UNLIKELY(duration == 0)) {
            return StakingError::InvalidDuration;
        }
        if (YIELDPOOL_UNLIKELY(engine_.registry().contains(token))) {
            return StakingError::RewardTokenExists;
        }
        BOOST_OUTCOME_TRY(
            auto const decimals, Erc20(engine_.state(), token).decimals());
        if (YIELDPOOL_UNLIKELY(
                decimals < MIN_REWARD_DECIMALS ||
                decimals > MAX_REWARD_DECIMALS)) {
            return StakingError::UnsupportedDecimals;
        }
        BOOST_OUTCOME_TRY(
            engine_.registry().insert(token, distributor, decimals, duration));

        LOG_INFO(
            "reward token {} added: decimals={} duration={}s distributor={}",
            token,
            decimals,
            duration,
            distributor);
        return outcome::success();
    });
}

Result<void> RewardEmissionScheduler::remove_reward(
    Caller const &caller, Address const &token)
{
    return atomically(engine_.state(), [&]() -> Result<void> {
        if (YIELDPOOL_UNLIKELY(!caller.has(RoleAdmin))) {
            return StakingError::NotAdmin;
        }
        auto &registry = engine_.registry();
        if (YIELDPOOL_UNLIKELY(!registry.contains(token))) {
            return StakingError::UnknownRewardToken;
        }
        auto const period = registry.data(token).period().load();
        if (YIELDPOOL_UNLIKELY(
                engine_.state().timestamp() <=
                period.period_finish.native())) {
            return StakingError::RewardPeriodActive;
        }
        // fold the tail of the finished window into the accumulator before
        // the token stops being settled
        BOOST_OUTCOME_TRY(engine_.update_reward(ZERO_ADDRESS));
        BOOST_OUTCOME_TRY(registry.remove(token));

        LOG_INFO("reward token {} removed", token);
        return outcome::success();
    });
}

Result<void> RewardEmissionScheduler::notify_reward_amount(
    Caller const &caller, Address const &token, uint256_t const &amount)
{
    return atomically(engine_.state(), [&]() -> Result<void> {
        auto &registry = engine_.registry();
        if (YIELDPOOL_UNLIKELY(!registry.contains(token))) {
            return StakingError::UnknownRewardToken;
        }
        auto const rd = registry.data(token);
        auto const params = rd.params().load();
        if (YIELDPOOL_UNLIKELY(caller.address != params.distributor)) {
            return StakingError::NotDistributor;
        }
        if (YIELDPOOL_UNLIKELY(amount == 0)) {
            return StakingError::ZeroAmount;
        }

        BOOST_OUTCOME_TRY(engine_.update_reward(ZERO_ADDRESS));

        Erc20 reward_token{engine_.state(), token};
        BOOST_OUTCOME_TRY(reward_token.transfer_from(
            engine_.address(), caller.address, engine_.address(), amount));

        uint64_t const now = engine_.state().timestamp();
        uint64_t const duration = params.duration.native();
        uint256_t const scale = rate_scale(params.decimals.native());
        auto period = rd.period().load();

        BOOST_OUTCOME_TRY(auto funded, checked_mul(amount, scale));
        if (now < period.period_finish.native()) {
            BOOST_OUTCOME_TRY(
                auto const leftover,
                checked_mul(
                    period.period_finish.native() - now,
                    rd.reward_rate().load().native()));
            BOOST_OUTCOME_TRY(auto const total, checked_add(funded, leftover));
            funded = total;
            LOG_INFO(
                "reward token {} rolled over {}s of the current window",
                token,
                period.period_finish.native() - now);
        }
        uint256_t const rate = funded / uint256_t{duration};

        // the new rate must be covered by what the pool actually holds,
        // excluding staked principal when the reward is the staking token
        uint256_t balance = reward_token.balance_of(engine_.address());
        if (token == engine_.staking_token()) {
            balance -= engine_.total_supply();
        }
        BOOST_OUTCOME_TRY(auto const ceiling, mul_div(balance, scale, duration));
        if (YIELDPOOL_UNLIKELY(rate > ceiling)) {
            return StakingError::RewardTooHigh;
        }

        rd.reward_rate().store(rate);
        period.last_update_time = now;
        period.period_finish = now + duration;
        rd.period().store(period);

        auto event =
            EventBuilder(engine_.address(), "RewardAdded(address,uint256)")
                .add_topic(abi_encode_address(token))
                .add_data(abi_encode_uint(amount))
                .build();
        engine_.state().store_log(event);

        LOG_INFO(
            "reward token {} notified {}: rate={} period_finish={}",
            token,
            amount,
            rate,
            now + duration);
        return outcome::success();
    });
}

Result<void> RewardEmissionScheduler::set_rewards_duration(
    Caller const &caller, Address const &token, uint64_t const duration)
{
    return atomically(engine_.state(), [&]() -> Result<void> {
        if (YIELDPOOL_UNLIKELY(!caller.has(RoleAdmin))) {
            return StakingError::NotAdmin;
        }
        auto &registry = engine_.registry();
        if (YIELDPOOL_UNLIKELY(!registry.contains(token))) {
            return StakingError::UnknownRewardToken;
        }
        if (YIELDPOOL_UNLIKELY(duration == 0)) {
            return StakingError::InvalidDuration;
        }
        auto const rd = registry.data(token);
        if (YIELDPOOL_UNLIKELY(
                engine_.state().timestamp() <=
                rd.period().load().period_finish.native())) {
            return StakingError::RewardPeriodActive;
        }
        auto params = rd.params().load();
        params.duration = duration;
        rd.params().store(params);

        auto event =
            EventBuilder(
                engine_.address(), "RewardsDurationUpdated(address,uint256)")
                .add_topic(abi_encode_address(token))
                .add_data(abi_encode_uint(u64_be{duration}))
                .build();
        engine_.state().store_log(event);
        return outcome::success();
    });
}

Result<void> RewardEmissionScheduler::set_rewards_distributor(
    Caller const &caller, Address const &token, Address const &distributor)
{
    return atomically(engine_.state(), [&]() -> Result<void> {
        if (YIELDPOOL_UNLIKELY(!caller.has(RoleAdmin))) {
            return StakingError::NotAdmin;
        }
        if (YIELDPOOL_UNLIKELY(distributor == ZERO_ADDRESS)) {
            return StakingError::ZeroAddress;
        }
        auto &registry = engine_.registry();
        if (YIELDPOOL_UNLIKELY(!registry.contains(token))) {
            return StakingError::UnknownRewardToken;
        }
        auto const rd = registry.data(token);
        auto params = rd.params().load();
        params.distributor = distributor;
        rd.params().store(params);
        return outcome::success();
    });
}

Result<uint256_t>
RewardEmissionScheduler::reward_for_duration(Address const &token) const
{
    BOOST_OUTCOME_TRY(auto const config, engine_.reward_data(token));
    return mul_div(
        config.reward_rate, config.duration, rate_scale(config.decimals));
}

YIELDPOOL_STAKING_NAMESPACE_END
