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

#include <yieldpool/execution/staking/util/staking_error.hpp>

#include <boost/outcome/config.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<yieldpool::staking::StakingError>::mapping> const &
quick_status_code_from_enum<yieldpool::staking::StakingError>::value_mappings()
{
    using yieldpool::staking::StakingError;

    static std::initializer_list<mapping> const v = {
        {StakingError::Success, "success", {errc::success}},
        {StakingError::ZeroAmount, "amount must be nonzero", {}},
        {StakingError::ZeroAddress, "zero address", {}},
        {StakingError::InvalidSlippage, "slippage exceeds maximum", {}},
        {StakingError::LengthMismatch, "strategies length mismatch", {}},
        {StakingError::NotAdmin, "caller is not admin", {}},
        {StakingError::NotGuardian, "caller is not guardian", {}},
        {StakingError::NotBackend, "caller is not backend", {}},
        {StakingError::NotOwner, "caller is not account owner", {}},
        {StakingError::NotDistributor, "caller is not distributor", {}},
        {StakingError::AlreadyInitialized, "already initialized", {}},
        {StakingError::NotInitialized, "not initialized", {}},
        {StakingError::Paused, "staking is paused", {}},
        {StakingError::InsufficientStake, "insufficient stake", {}},
        {StakingError::NothingToWithdraw, "nothing to withdraw", {}},
        {StakingError::RewardTokenExists, "reward token exists", {}},
        {StakingError::UnknownRewardToken, "unknown reward token", {}},
        {StakingError::InvalidDuration, "invalid duration", {}},
        {StakingError::UnsupportedDecimals,
         "reward token decimals out of range",
         {}},
        {StakingError::RewardPeriodActive, "reward period still active", {}},
        {StakingError::RewardTooHigh, "provided reward too high", {}},
        {StakingError::UnknownAccount, "unknown account", {}},
        {StakingError::AccountExists, "account exists", {}},
        {StakingError::UnknownStrategy, "unknown strategy", {}},
        {StakingError::StrategyOwnerMismatch, "strategy owner mismatch", {}},
        {StakingError::StrategyAssetMismatch, "strategy asset mismatch", {}},
        {StakingError::UnknownRoute, "unknown route", {}},
        {StakingError::TokenNotSwappable, "token not allowed for swap", {}},
        {StakingError::MissingPriceFeed, "missing price feed", {}},
        {StakingError::StalePrice, "stale price", {}},
        {StakingError::PriceCheckFailed, "price check failed", {}},
        {StakingError::InsufficientOutput, "swap output below order", {}},
        {StakingError::CannotRecoverToken, "cannot recover token", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
