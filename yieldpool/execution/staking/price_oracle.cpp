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
#include <yieldpool/execution/core/contract/checked_math.hpp>
#include <yieldpool/execution/core/contract/storage_key.hpp>
#include <yieldpool/execution/core/fmt/address_fmt.hpp>
#include <yieldpool/execution/core/fmt/int_fmt.hpp>
#include <yieldpool/execution/staking/price_oracle.hpp>
#include <yieldpool/execution/staking/util/constants.hpp>
#include <yieldpool/execution/staking/util/staking_error.hpp>
#include <yieldpool/execution/state/atomic.hpp>
#include <yieldpool/execution/state/state.hpp>
#include <yieldpool/execution/token/erc20.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

YIELDPOOL_STAKING_ANONYMOUS_NAMESPACE_BEGIN

enum Namespace : uint8_t
{
    NSPriceFeed = 0x01,
};

YIELDPOOL_STAKING_ANONYMOUS_NAMESPACE_END

YIELDPOOL_STAKING_NAMESPACE_BEGIN

Result<void> PriceOracle::check_price(
    uint256_t const &amount_in, Address const &token_in,
    Address const &token_out, uint256_t const &amount_out_proposed,
    uint64_t const slippage_bps) const
{
    if (YIELDPOOL_UNLIKELY(slippage_bps > MAX_SLIPPAGE_BPS)) {
        return StakingError::InvalidSlippage;
    }
    BOOST_OUTCOME_TRY(auto const fair, quote(amount_in, token_in, token_out));
    BOOST_OUTCOME_TRY(
        auto const minimum,
        mul_div(fair, BPS_DIVISOR - slippage_bps, BPS_DIVISOR));
    if (YIELDPOOL_UNLIKELY(amount_out_proposed < minimum)) {
        LOG_DEBUG(
            "price check failed {} -> {}: proposed {} below minimum {}",
            token_in,
            token_out,
            amount_out_proposed,
            minimum);
        return StakingError::PriceCheckFailed;
    }
    return outcome::success();
}

FeedPriceOracle::FeedPriceOracle(State &state, Address const &oracle)
    : state_{state}
    , address_{oracle}
{
}

StorageVariable<PriceFeed>
FeedPriceOracle::feed(Address const &token) const noexcept
{
    return {state_, address_, mapping_slot(NSPriceFeed, token)};
}

StorageVariable<u64_be> FeedPriceOracle::max_age() const noexcept
{
    return {state_, address_, variable_slot(1)};
}

Result<void> FeedPriceOracle::set_price(
    Caller const &caller, Address const &token, uint256_t const &price)
{
    return atomically(state_, [&]() -> Result<void> {
        if (YIELDPOOL_UNLIKELY(!caller.has(RoleAdmin))) {
            return StakingError::NotAdmin;
        }
        if (YIELDPOOL_UNLIKELY(price == 0)) {
            return StakingError::ZeroAmount;
        }
        BOOST_OUTCOME_TRY(auto const decimals, Erc20(state_, token).decimals());
        feed(token).store(PriceFeed{
            .price = price,
            .updated_at = state_.timestamp(),
            .decimals = decimals});
        LOG_DEBUG("price feed {} set to {}", token, price);
        return outcome::success();
    });
}

Result<void>
FeedPriceOracle::set_max_price_age(Caller const &caller, uint64_t const seconds)
{
    return atomically(state_, [&]() -> Result<void> {
        if (YIELDPOOL_UNLIKELY(!caller.has(RoleAdmin))) {
            return StakingError::NotAdmin;
        }
        if (YIELDPOOL_UNLIKELY(seconds == 0)) {
            return StakingError::ZeroAmount;
        }
        max_age().store(seconds);
        return outcome::success();
    });
}

uint64_t FeedPriceOracle::max_price_age() const
{
    uint64_t const age = max_age().load().native();
    return age == 0 ? DEFAULT_MAX_PRICE_AGE : age;
}

bool FeedPriceOracle::has_feed(Address const &token) const
{
    return feed(token).load_checked().has_value();
}

Result<PriceFeed> FeedPriceOracle::fresh_feed(Address const &token) const
{
    auto const f = feed(token).load_checked();
    if (YIELDPOOL_UNLIKELY(!f.has_value())) {
        return StakingError::MissingPriceFeed;
    }
    uint64_t const now = state_.timestamp();
    uint64_t const updated_at = f->updated_at.native();
    if (YIELDPOOL_UNLIKELY(
            now > updated_at && now - updated_at > max_price_age())) {
        return StakingError::StalePrice;
    }
    return f.value();
}

Result<uint256_t> FeedPriceOracle::quote(
    uint256_t const &amount_in, Address const &token_in,
    Address const &token_out) const
{
    BOOST_OUTCOME_TRY(auto const in, fresh_feed(token_in));
    BOOST_OUTCOME_TRY(auto const out, fresh_feed(token_out));

    // value in USD at 1e18, then into units of the output token
    BOOST_OUTCOME_TRY(
        auto const usd,
        mul_div(amount_in, in.price.native(), pow10(in.decimals.native())));
    return mul_div(usd, pow10(out.decimals.native()), out.price.native());
}

YIELDPOOL_STAKING_NAMESPACE_END
