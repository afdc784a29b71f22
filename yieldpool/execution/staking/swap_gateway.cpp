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
#include <yieldpool/execution/core/contract/storage_key.hpp>
#include <yieldpool/execution/core/fmt/address_fmt.hpp>
#include <yieldpool/execution/core/fmt/int_fmt.hpp>
#include <yieldpool/execution/staking/price_oracle.hpp>
#include <yieldpool/execution/staking/swap_gateway.hpp>
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
    NSAllowedToken = 0x01,
};

YIELDPOOL_STAKING_ANONYMOUS_NAMESPACE_END

YIELDPOOL_STAKING_NAMESPACE_BEGIN

SwapGateway::SwapGateway(
    State &state, Address const &gateway, PriceOracle const &oracle,
    SwapVenue &venue)
    : state_{state}
    , address_{gateway}
    , oracle_{oracle}
    , venue_{venue}
{
}

StorageVariable<bool> SwapGateway::allowed(Address const &token) const noexcept
{
    return {state_, address_, mapping_slot(NSAllowedToken, token)};
}

Result<void> SwapGateway::set_token_allowed(
    Caller const &caller, Address const &token, bool const allow)
{
    return atomically(state_, [&]() -> Result<void> {
        if (YIELDPOOL_UNLIKELY(!caller.has(RoleAdmin))) {
            return StakingError::NotAdmin;
        }
        if (YIELDPOOL_UNLIKELY(token == ZERO_ADDRESS)) {
            return StakingError::ZeroAddress;
        }
        if (allow && YIELDPOOL_UNLIKELY(!oracle_.has_feed(token))) {
            return StakingError::MissingPriceFeed;
        }
        allowed(token).store(allow);
        LOG_INFO("swap token {} {}", token, allow ? "allowed" : "disallowed");
        return outcome::success();
    });
}

bool SwapGateway::is_token_allowed(Address const &token) const
{
    return allowed(token).load();
}

Result<void> SwapGateway::quote_and_check(
    uint256_t const &amount_in, Address const &token_in,
    Address const &token_out, uint256_t const &amount_out_proposed,
    uint64_t const slippage_bps) const
{
    if (YIELDPOOL_UNLIKELY(
            !is_token_allowed(token_in) || !is_token_allowed(token_out))) {
        return StakingError::TokenNotSwappable;
    }
    return oracle_.check_price(
        amount_in, token_in, token_out, amount_out_proposed, slippage_bps);
}

Result<uint256_t> SwapGateway::swap(
    Address const &owner, Address const &token_in, Address const &token_out,
    uint256_t const &amount_in, uint64_t const slippage_bps,
    Address const &pool)
{
    return atomically(state_, [&]() -> Result<uint256_t> {
        if (YIELDPOOL_UNLIKELY(amount_in == 0)) {
            return StakingError::ZeroAmount;
        }
        BOOST_OUTCOME_TRY(
            auto const proposed,
            venue_.propose(pool, token_in, token_out, amount_in));
        BOOST_OUTCOME_TRY(quote_and_check(
            amount_in, token_in, token_out, proposed, slippage_bps));

        SwapOrder const order{
            .owner = owner,
            .sell_token = token_in,
            .buy_token = token_out,
            .sell_amount = amount_in,
            .buy_amount = proposed,
            .pool = pool};

        Erc20 sell{state_, token_in};
        Erc20 buy{state_, token_out};
        BOOST_OUTCOME_TRY(sell.approve(owner, venue_.address(), amount_in));

        uint256_t const before = buy.balance_of(owner);
        BOOST_OUTCOME_TRY(venue_.settle(order));
        uint256_t const after = buy.balance_of(owner);

        uint256_t const received = after > before ? after - before : uint256_t{0};
        if (YIELDPOOL_UNLIKELY(received < order.buy_amount)) {
            return StakingError::InsufficientOutput;
        }
        LOG_DEBUG(
            "swapped {} {} for {} {} via {}",
            amount_in,
            token_in,
            received,
            token_out,
            pool);
        return received;
    });
}

YIELDPOOL_STAKING_NAMESPACE_END
