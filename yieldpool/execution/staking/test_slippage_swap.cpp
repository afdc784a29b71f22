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
#include <yieldpool/core/result.hpp>
#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/core/contract/abi_encode.hpp>
#include <yieldpool/execution/staking/price_oracle.hpp>
#include <yieldpool/execution/staking/slippage_guard.hpp>
#include <yieldpool/execution/staking/swap_gateway.hpp>
#include <yieldpool/execution/staking/util/caller.hpp>
#include <yieldpool/execution/staking/util/constants.hpp>
#include <yieldpool/execution/staking/util/staking_error.hpp>
#include <yieldpool/execution/state/state.hpp>
#include <yieldpool/execution/token/erc20.hpp>
#include <yieldpool/execution/token/token_error.hpp>
#include <yieldpool/test/protocol_fixture.hpp>

#include <cstdint>

#include <gtest/gtest.h>

using namespace yieldpool;
using namespace yieldpool::staking;
using namespace yieldpool::test;

namespace
{
    constexpr auto UNPRICED{
        0x0000000000000000000000000000000000003005_address};
    constexpr auto GUARD_HOME{
        0x0000000000000000000000000000000000003006_address};

    // 100 REWARD6 ($1) is worth 50 of the $2 staking token
    constexpr uint64_t SELL_AMOUNT{100'000'000};
}

class SwapFixture : public ProtocolFixture
{
protected:
    void SetUp() override
    {
        ProtocolFixture::SetUp();
        enable_swaps();
    }
};

/////////////////////
// oracle
/////////////////////

TEST_F(SwapFixture, quote_across_decimals)
{
    EXPECT_EQ(oracle().quote(SELL_AMOUNT, REWARD6, STAKING).value(), 50 * E18);
    EXPECT_EQ(oracle().quote(pow10(8), REWARD8, REWARD6).value(), 3'000'000);
    EXPECT_EQ(oracle().quote(E18, REWARD18, REWARD8).value(), pow10(8) / 6);
    EXPECT_TRUE(oracle().has_feed(REWARD8));

    deploy(UNPRICED, 18);
    EXPECT_FALSE(oracle().has_feed(UNPRICED));
    auto const missing = oracle().quote(E18, UNPRICED, STAKING);
    ASSERT_TRUE(missing.has_error());
    EXPECT_EQ(missing.assume_error(), StakingError::MissingPriceFeed);
}

TEST_F(SwapFixture, set_price_rejects)
{
    auto res = oracle().set_price(alice, STAKING, E18);
    EXPECT_EQ(res.assume_error(), StakingError::NotAdmin);
    res = oracle().set_price(admin, STAKING, 0);
    EXPECT_EQ(res.assume_error(), StakingError::ZeroAmount);
    res = oracle().set_price(admin, UNPRICED, E18);
    EXPECT_EQ(res.assume_error(), TokenError::UnknownToken);
    res = oracle().set_max_price_age(alice, 60);
    EXPECT_EQ(res.assume_error(), StakingError::NotAdmin);
    res = oracle().set_max_price_age(admin, 0);
    EXPECT_EQ(res.assume_error(), StakingError::ZeroAmount);
}

TEST_F(SwapFixture, stale_price)
{
    FeedPriceOracle fresh{state, 0x3007_address};
    EXPECT_EQ(fresh.max_price_age(), DEFAULT_MAX_PRICE_AGE);

    ASSERT_FALSE(oracle().set_max_price_age(admin, 3600).has_error());
    EXPECT_EQ(oracle().max_price_age(), 3600u);

    advance(3600);
    EXPECT_FALSE(oracle().quote(SELL_AMOUNT, REWARD6, STAKING).has_error());

    advance(1);
    auto const stale = oracle().quote(SELL_AMOUNT, REWARD6, STAKING);
    ASSERT_TRUE(stale.has_error());
    EXPECT_EQ(stale.assume_error(), StakingError::StalePrice);

    // refreshing one side is not enough
    ASSERT_FALSE(oracle().set_price(admin, REWARD6, E18).has_error());
    EXPECT_EQ(
        oracle().quote(SELL_AMOUNT, REWARD6, STAKING).assume_error(),
        StakingError::StalePrice);
    ASSERT_FALSE(oracle().set_price(admin, STAKING, 2 * E18).has_error());
    EXPECT_EQ(
        oracle().quote(SELL_AMOUNT, REWARD6, STAKING).value(), 50 * E18);
}

TEST_F(SwapFixture, price_check_boundary)
{
    // 1% below 50 tokens
    uint256_t const minimum = 49 * E18 + E18 / 2;

    EXPECT_FALSE(
        gateway()
            .quote_and_check(SELL_AMOUNT, REWARD6, STAKING, minimum, 100)
            .has_error());
    auto res = gateway().quote_and_check(
        SELL_AMOUNT, REWARD6, STAKING, minimum - 1, 100);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::PriceCheckFailed);

    EXPECT_FALSE(
        gateway()
            .quote_and_check(SELL_AMOUNT, REWARD6, STAKING, 50 * E18, 0)
            .has_error());
    res = gateway().quote_and_check(
        SELL_AMOUNT, REWARD6, STAKING, 50 * E18, MAX_SLIPPAGE_BPS + 1);
    EXPECT_EQ(res.assume_error(), StakingError::InvalidSlippage);
}

/////////////////////
// allow-list
/////////////////////

TEST_F(SwapFixture, allow_list)
{
    deploy(UNPRICED, 18);

    auto res = gateway().set_token_allowed(admin, UNPRICED, true);
    EXPECT_EQ(res.assume_error(), StakingError::MissingPriceFeed);
    EXPECT_FALSE(gateway().is_token_allowed(UNPRICED));
    res = gateway().set_token_allowed(alice, REWARD6, false);
    EXPECT_EQ(res.assume_error(), StakingError::NotAdmin);
    res = gateway().set_token_allowed(admin, ZERO_ADDRESS, false);
    EXPECT_EQ(res.assume_error(), StakingError::ZeroAddress);

    // removal needs no feed
    EXPECT_FALSE(
        gateway().set_token_allowed(admin, UNPRICED, false).has_error());

    ASSERT_FALSE(gateway().set_token_allowed(admin, REWARD6, false).has_error());
    EXPECT_FALSE(gateway().is_token_allowed(REWARD6));
    res = gateway().quote_and_check(
        SELL_AMOUNT, REWARD6, STAKING, 50 * E18, 100);
    EXPECT_EQ(res.assume_error(), StakingError::TokenNotSwappable);
}

/////////////////////
// swap
/////////////////////

TEST_F(SwapFixture, swap)
{
    mint(REWARD6, ALICE, SELL_AMOUNT);
    uint256_t const venue_staking = balance(STAKING, VENUE);

    auto const received =
        gateway().swap(ALICE, REWARD6, STAKING, SELL_AMOUNT, 100, SWAP_POOL);
    ASSERT_FALSE(received.has_error());
    EXPECT_EQ(received.value(), 50 * E18);
    EXPECT_EQ(balance(STAKING, ALICE), 50 * E18);
    EXPECT_EQ(balance(REWARD6, ALICE), 0);
    EXPECT_EQ(balance(STAKING, VENUE), venue_staking - 50 * E18);
    EXPECT_EQ(venue.settled, 1u);
}

TEST_F(SwapFixture, skewed_proposal_is_rejected_before_approval)
{
    mint(REWARD6, ALICE, SELL_AMOUNT);
    venue.skew_bps = 200;
    auto const logs_before = state.logs().size();

    auto const res =
        gateway().swap(ALICE, REWARD6, STAKING, SELL_AMOUNT, 100, SWAP_POOL);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::PriceCheckFailed);
    EXPECT_EQ(venue.settled, 0u);
    EXPECT_EQ(Erc20(state, REWARD6).allowance(ALICE, VENUE), 0);
    EXPECT_EQ(balance(REWARD6, ALICE), SELL_AMOUNT);
    EXPECT_EQ(state.logs().size(), logs_before);

    // within tolerance once the account accepts 3%
    auto const accepted =
        gateway().swap(ALICE, REWARD6, STAKING, SELL_AMOUNT, 300, SWAP_POOL);
    ASSERT_FALSE(accepted.has_error());
    EXPECT_EQ(accepted.value(), 49 * E18);
}

TEST_F(SwapFixture, short_delivery_rolls_back)
{
    mint(REWARD6, ALICE, SELL_AMOUNT);
    venue.shortfall = 1;
    uint256_t const venue_reward = balance(REWARD6, VENUE);
    auto const logs_before = state.logs().size();

    auto const res =
        gateway().swap(ALICE, REWARD6, STAKING, SELL_AMOUNT, 100, SWAP_POOL);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::InsufficientOutput);
    EXPECT_EQ(venue.settled, 1u);
    EXPECT_EQ(balance(REWARD6, ALICE), SELL_AMOUNT);
    EXPECT_EQ(balance(STAKING, ALICE), 0);
    EXPECT_EQ(balance(REWARD6, VENUE), venue_reward);
    EXPECT_EQ(Erc20(state, REWARD6).allowance(ALICE, VENUE), 0);
    EXPECT_EQ(state.logs().size(), logs_before);
}

TEST_F(SwapFixture, swap_rejects)
{
    auto res = gateway().swap(ALICE, REWARD6, STAKING, 0, 100, SWAP_POOL);
    EXPECT_EQ(res.assume_error(), StakingError::ZeroAmount);

    // the venue is authorised but the owner holds nothing to sell
    res = gateway().swap(ALICE, REWARD6, STAKING, SELL_AMOUNT, 100, SWAP_POOL);
    EXPECT_EQ(res.assume_error(), TokenError::InsufficientBalance);
    EXPECT_EQ(Erc20(state, REWARD6).allowance(ALICE, VENUE), 0);

    ASSERT_FALSE(
        gateway().set_token_allowed(admin, STAKING, false).has_error());
    mint(REWARD6, ALICE, SELL_AMOUNT);
    res = gateway().swap(ALICE, REWARD6, STAKING, SELL_AMOUNT, 100, SWAP_POOL);
    EXPECT_EQ(res.assume_error(), StakingError::TokenNotSwappable);
}

/////////////////////
// slippage
/////////////////////

TEST_F(SwapFixture, slippage_guard)
{
    SlippageGuard guard{state, GUARD_HOME};
    EXPECT_EQ(guard.default_slippage(), DEFAULT_SLIPPAGE_BPS);
    EXPECT_EQ(guard.get_account_slippage(ALICE), DEFAULT_SLIPPAGE_BPS);

    auto res = guard.set_default_slippage(alice, 50);
    EXPECT_EQ(res.assume_error(), StakingError::NotAdmin);
    res = guard.set_default_slippage(admin, 0);
    EXPECT_EQ(res.assume_error(), StakingError::InvalidSlippage);
    res = guard.set_default_slippage(admin, MAX_SLIPPAGE_BPS + 1);
    EXPECT_EQ(res.assume_error(), StakingError::InvalidSlippage);

    ASSERT_FALSE(guard.set_default_slippage(admin, MAX_SLIPPAGE_BPS).has_error());
    EXPECT_EQ(guard.default_slippage(), MAX_SLIPPAGE_BPS);

    auto const &log = state.logs().back();
    EXPECT_EQ(log.address, GUARD_HOME);
    EXPECT_EQ(abi_decode_address(log.topics[1]), ZERO_ADDRESS);
    EXPECT_EQ(abi_decode_uint(log.data, 0), MAX_SLIPPAGE_BPS);

    ASSERT_FALSE(guard.set_account_slippage(ALICE, 30).has_error());
    EXPECT_EQ(guard.account_slippage(ALICE), 30u);
    EXPECT_EQ(guard.get_account_slippage(ALICE), 30u);
    EXPECT_EQ(guard.get_account_slippage(BOB), MAX_SLIPPAGE_BPS);

    res = guard.set_account_slippage(ALICE, MAX_SLIPPAGE_BPS + 1);
    EXPECT_EQ(res.assume_error(), StakingError::InvalidSlippage);

    // zero defers to the default again
    ASSERT_FALSE(guard.set_account_slippage(ALICE, 0).has_error());
    EXPECT_EQ(guard.get_account_slippage(ALICE), MAX_SLIPPAGE_BPS);
}
