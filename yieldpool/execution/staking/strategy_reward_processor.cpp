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
#include <yieldpool/core/int.hpp>
#include <yieldpool/core/likely.h>
#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/core/contract/abi_encode.hpp>
#include <yieldpool/execution/core/contract/checked_math.hpp>
#include <yieldpool/execution/core/contract/events.hpp>
#include <yieldpool/execution/core/contract/storage_key.hpp>
#include <yieldpool/execution/core/fmt/address_fmt.hpp>
#include <yieldpool/execution/core/fmt/int_fmt.hpp>
#include <yieldpool/execution/staking/satellite_strategy.hpp>
#include <yieldpool/execution/staking/strategy_reward_processor.hpp>
#include <yieldpool/execution/staking/swap_gateway.hpp>
#include <yieldpool/execution/staking/util/staking_error.hpp>
#include <yieldpool/execution/state/atomic.hpp>
#include <yieldpool/execution/state/state.hpp>
#include <yieldpool/execution/token/erc20.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstddef>

YIELDPOOL_STAKING_ANONYMOUS_NAMESPACE_BEGIN

enum Namespace : uint8_t
{
    NSAccount = 0x01,
    NSRoute = 0x02,
};

constexpr char const *mode_name(CompoundMode const mode)
{
    return mode == CompoundMode::Reinvest ? "reinvest" : "compound";
}

YIELDPOOL_STAKING_ANONYMOUS_NAMESPACE_END

YIELDPOOL_STAKING_NAMESPACE_BEGIN

StrategyRewardProcessor::StrategyRewardProcessor(
    State &state, Address const &processor, RewardAccountingEngine &engine,
    SwapGateway &gateway, StrategyRegistry const &strategies)
    : state_{state}
    , address_{processor}
    , engine_{engine}
    , gateway_{gateway}
    , strategies_{strategies}
    , slippage_{state, address_}
{
}

StorageVariable<AccountRecord>
StrategyRewardProcessor::record(Address const &account) const
{
    return {state_, address_, mapping_slot(NSAccount, account)};
}

StorageVariable<Address>
StrategyRewardProcessor::route(Address const &token) const
{
    return {state_, address_, mapping_slot(NSRoute, token)};
}

Result<AccountRecord> StrategyRewardProcessor::owned_account(
    Caller const &caller, Address const &account) const
{
    auto const rec = record(account).load();
    if (YIELDPOOL_UNLIKELY(rec.owner == ZERO_ADDRESS)) {
        return StakingError::UnknownAccount;
    }
    if (YIELDPOOL_UNLIKELY(caller.address != rec.owner)) {
        return StakingError::NotOwner;
    }
    return rec;
}

Result<void> StrategyRewardProcessor::create_account(
    Caller const &caller, Address const &account, Address const &owner)
{
    return atomically(state_, [&]() -> Result<void> {
        if (YIELDPOOL_UNLIKELY(!caller.has(RoleAdmin))) {
            return StakingError::NotAdmin;
        }
        if (YIELDPOOL_UNLIKELY(
                account == ZERO_ADDRESS || owner == ZERO_ADDRESS)) {
            return StakingError::ZeroAddress;
        }
        auto rec = record(account);
        if (YIELDPOOL_UNLIKELY(rec.load().owner != ZERO_ADDRESS)) {
            return StakingError::AccountExists;
        }
        rec.store(AccountRecord{
            .owner = owner,
            .mode = static_cast<uint8_t>(CompoundMode::Compound)});

        LOG_INFO("account {} created for owner {}", account, owner);
        return outcome::success();
    });
}

Result<AccountInfo>
StrategyRewardProcessor::account(Address const &account) const
{
    auto const rec = record(account).load();
    if (YIELDPOOL_UNLIKELY(rec.owner == ZERO_ADDRESS)) {
        return StakingError::UnknownAccount;
    }
    return AccountInfo{
        .owner = rec.owner,
        .mode = static_cast<CompoundMode>(rec.mode.native()),
        .slippage_bps = slippage_.account_slippage(account)};
}

Result<void> StrategyRewardProcessor::set_compound_mode(
    Caller const &caller, Address const &account, CompoundMode const mode)
{
    return atomically(state_, [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(auto rec, owned_account(caller, account));
        rec.mode = static_cast<uint8_t>(mode);
        record(account).store(rec);

        auto event =
            EventBuilder(address_, "CompoundModeUpdated(address,uint8)")
                .add_topic(abi_encode_address(account))
                .add_data(abi_encode_uint(rec.mode))
                .build();
        state_.store_log(event);
        return outcome::success();
    });
}

Result<void> StrategyRewardProcessor::set_account_slippage(
    Caller const &caller, Address const &account, uint64_t const bps)
{
    return atomically(state_, [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(owned_account(caller, account));
        return slippage_.set_account_slippage(account, bps);
    });
}

uint64_t
StrategyRewardProcessor::get_account_slippage(Address const &account) const
{
    return slippage_.get_account_slippage(account);
}

Result<void> StrategyRewardProcessor::set_default_slippage(
    Caller const &caller, uint64_t const bps)
{
    return atomically(
        state_, [&] { return slippage_.set_default_slippage(caller, bps); });
}

Result<void> StrategyRewardProcessor::restake(
    Address const &account, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(Erc20(state_, engine_.staking_token())
                          .approve(account, engine_.address(), amount));
    return engine_.stake(Caller{.address = account}, amount);
}

Result<void> StrategyRewardProcessor::deposit(
    Caller const &caller, Address const &account, uint256_t const &amount)
{
    return atomically(state_, [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(owned_account(caller, account));
        if (YIELDPOOL_UNLIKELY(amount == 0)) {
            return StakingError::ZeroAmount;
        }
        BOOST_OUTCOME_TRY(Erc20(state_, engine_.staking_token())
                              .transfer(caller.address, account, amount));
        return restake(account, amount);
    });
}

Result<void> StrategyRewardProcessor::withdraw(
    Caller const &caller, Address const &account, uint256_t const &amount)
{
    return atomically(state_, [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(owned_account(caller, account));
        BOOST_OUTCOME_TRY(engine_.withdraw(Caller{.address = account}, amount));
        return Erc20(state_, engine_.staking_token())
            .transfer(account, caller.address, amount);
    });
}

Result<std::vector<RewardPayout>> StrategyRewardProcessor::withdraw_all(
    Caller const &caller, Address const &account)
{
    return atomically(
        state_, [&]() -> Result<std::vector<RewardPayout>> {
            BOOST_OUTCOME_TRY(owned_account(caller, account));
            Address const staking_token = engine_.staking_token();
            uint256_t const principal = engine_.balance_of(account);
            BOOST_OUTCOME_TRY(
                auto payouts, engine_.exit(Caller{.address = account}));

            uint256_t to_owner = principal;
            for (auto const &payout : payouts) {
                if (payout.token == staking_token) {
                    BOOST_OUTCOME_TRY(
                        auto const sum, checked_add(to_owner, payout.amount));
                    to_owner = sum;
                    continue;
                }
                BOOST_OUTCOME_TRY(Erc20(state_, payout.token)
                                      .transfer(
                                          account,
                                          caller.address,
                                          payout.amount));
            }
            BOOST_OUTCOME_TRY(Erc20(state_, staking_token)
                                  .transfer(account, caller.address, to_owner));
            return payouts;
        });
}

Result<void> StrategyRewardProcessor::set_reward_route(
    Caller const &caller, Address const &token, Address const &swap_pool)
{
    return atomically(state_, [&]() -> Result<void> {
        if (YIELDPOOL_UNLIKELY(!caller.has(RoleAdmin))) {
            return StakingError::NotAdmin;
        }
        if (YIELDPOOL_UNLIKELY(swap_pool == ZERO_ADDRESS)) {
            return StakingError::ZeroAddress;
        }
        if (YIELDPOOL_UNLIKELY(!engine_.registry().contains(token))) {
            return StakingError::UnknownRewardToken;
        }
        route(token).store(swap_pool);
        LOG_INFO("reward token {} routed through {}", token, swap_pool);
        return outcome::success();
    });
}

Result<void> StrategyRewardProcessor::remove_reward_route(
    Caller const &caller, Address const &token)
{
    return atomically(state_, [&]() -> Result<void> {
        if (YIELDPOOL_UNLIKELY(!caller.has(RoleAdmin))) {
            return StakingError::NotAdmin;
        }
        auto r = route(token);
        if (YIELDPOOL_UNLIKELY(r.load() == ZERO_ADDRESS)) {
            return StakingError::UnknownRoute;
        }
        r.clear();
        LOG_INFO("reward route for {} removed", token);
        return outcome::success();
    });
}

std::optional<Address>
StrategyRewardProcessor::reward_route(Address const &token) const
{
    return route(token).load_checked();
}

std::vector<Address> StrategyRewardProcessor::reinvest_tokens() const
{
    Address const staking_token = engine_.staking_token();
    std::vector<Address> tokens = engine_.reward_tokens();
    std::erase(tokens, staking_token);
    return tokens;
}

Result<std::vector<SatelliteStrategy *>>
StrategyRewardProcessor::resolve_destinations(
    AccountRecord const &rec, std::span<Address const> const strategies) const
{
    auto const tokens = reinvest_tokens();
    if (YIELDPOOL_UNLIKELY(strategies.size() != tokens.size())) {
        return StakingError::LengthMismatch;
    }

    std::vector<SatelliteStrategy *> destinations;
    destinations.reserve(tokens.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
        SatelliteStrategy *const satellite = strategies_.find(strategies[i]);
        if (YIELDPOOL_UNLIKELY(satellite == nullptr)) {
            return StakingError::UnknownStrategy;
        }
        if (YIELDPOOL_UNLIKELY(
                !strategies_.is_user_strategy(rec.owner, strategies[i]) ||
                satellite->owner() != rec.owner)) {
            return StakingError::StrategyOwnerMismatch;
        }
        if (YIELDPOOL_UNLIKELY(satellite->asset() != tokens[i])) {
            return StakingError::StrategyAssetMismatch;
        }
        destinations.push_back(satellite);
    }
    return destinations;
}

Result<ProcessingReport> StrategyRewardProcessor::process_rewards_(
    Caller const &caller, Address const &account,
    std::span<Address const> const strategies)
{
    if (YIELDPOOL_UNLIKELY(!caller.has(RoleBackend))) {
        return StakingError::NotBackend;
    }
    auto const rec = record(account).load();
    if (YIELDPOOL_UNLIKELY(rec.owner == ZERO_ADDRESS)) {
        return StakingError::UnknownAccount;
    }
    auto const mode = static_cast<CompoundMode>(rec.mode.native());
    Address const staking_token = engine_.staking_token();

    // every destination is validated before anything is harvested
    std::vector<SatelliteStrategy *> destinations;
    if (mode == CompoundMode::Reinvest) {
        BOOST_OUTCOME_TRY(
            auto resolved, resolve_destinations(rec, strategies));
        destinations = std::move(resolved);
    }

    BOOST_OUTCOME_TRY(
        auto harvested, engine_.get_reward(Caller{.address = account}));

    ProcessingReport report{.mode = mode, .harvested = harvested};
    if (harvested.empty()) {
        return report;
    }

    if (mode == CompoundMode::Compound) {
        uint64_t const bps = slippage_.get_account_slippage(account);
        uint256_t total = 0;
        for (auto const &payout : harvested) {
            uint256_t received = payout.amount;
            if (payout.token != staking_token) {
                auto const swap_pool = route(payout.token).load();
                if (YIELDPOOL_UNLIKELY(swap_pool == ZERO_ADDRESS)) {
                    return StakingError::UnknownRoute;
                }
                BOOST_OUTCOME_TRY(
                    auto const out,
                    gateway_.swap(
                        account,
                        payout.token,
                        staking_token,
                        payout.amount,
                        bps,
                        swap_pool));
                received = out;
            }
            BOOST_OUTCOME_TRY(auto const sum, checked_add(total, received));
            total = sum;
        }
        if (total > 0) {
            BOOST_OUTCOME_TRY(restake(account, total));
            auto event =
                EventBuilder(address_, "RewardsCompounded(address,uint256)")
                    .add_topic(abi_encode_address(account))
                    .add_data(abi_encode_uint(total))
                    .build();
            state_.store_log(event);
        }
        report.restaked = total;
        return report;
    }

    auto const tokens = reinvest_tokens();
    for (auto const &payout : harvested) {
        if (payout.token == staking_token) {
            BOOST_OUTCOME_TRY(restake(account, payout.amount));
            report.restaked = payout.amount;
            continue;
        }
        auto const it = std::ranges::find(tokens, payout.token);
        YIELDPOOL_ASSERT(it != tokens.end());
        SatelliteStrategy *const satellite =
            destinations[static_cast<size_t>(it - tokens.begin())];

        BOOST_OUTCOME_TRY(Erc20(state_, payout.token)
                              .approve(
                                  account, satellite->address(), payout.amount));
        BOOST_OUTCOME_TRY(satellite->deposit(account, payout.amount));

        auto event =
            EventBuilder(
                address_, "RewardsReinvested(address,address,address,uint256)")
                .add_topic(abi_encode_address(account))
                .add_topic(abi_encode_address(payout.token))
                .add_data(abi_encode_address(satellite->address()))
                .add_data(abi_encode_uint(payout.amount))
                .build();
        state_.store_log(event);
    }
    return report;
}

Result<ProcessingReport> StrategyRewardProcessor::process_rewards(
    Caller const &caller, Address const &account,
    std::span<Address const> const strategies)
{
    auto res = atomically(
        state_, [&] { return process_rewards_(caller, account, strategies); });
    if (res.has_error()) {
        LOG_WARNING(
            "processing for account {} rejected: {}",
            account,
            res.error().message().c_str());
        return res;
    }
    auto const &report = res.value();
    LOG_INFO(
        "processed account {} in {} mode: {} tokens harvested, {} restaked",
        account,
        mode_name(report.mode),
        report.harvested.size(),
        report.restaked);
    return res;
}

YIELDPOOL_STAKING_NAMESPACE_END
