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
#include <yieldpool/execution/core/contract/big_endian.hpp>
#include <yieldpool/execution/core/contract/storage_variable.hpp>
#include <yieldpool/execution/staking/config.hpp>
#include <yieldpool/execution/staking/util/caller.hpp>

#include <cstdint>

YIELDPOOL_NAMESPACE_BEGIN

class State;

YIELDPOOL_NAMESPACE_END

YIELDPOOL_STAKING_NAMESPACE_BEGIN

/// Fair-value quotes between two tokens.
class PriceOracle
{
public:
    virtual ~PriceOracle() = default;

    virtual bool has_feed(Address const &token) const = 0;

    /// Amount of `token_out` worth `amount_in` of `token_in`
    virtual Result<uint256_t> quote(
        uint256_t const &amount_in, Address const &token_in,
        Address const &token_out) const = 0;

    /// Fails with a price-check error if `amount_out_proposed` is below the
    /// quote less `slippage_bps`.
    Result<void> check_price(
        uint256_t const &amount_in, Address const &token_in,
        Address const &token_out, uint256_t const &amount_out_proposed,
        uint64_t slippage_bps) const;
};

struct PriceFeed
{
    u256_be price;
    u64_be updated_at;
    u8_be decimals;
};

static_assert(StorageVariable<PriceFeed>::N == 2);

/// Oracle backed by per-token USD prices (1e18 = $1) pushed by an admin. A
/// feed older than the maximum age cannot be quoted.
class FeedPriceOracle final : public PriceOracle
{
    State &state_;
    Address const address_;

    StorageVariable<PriceFeed> feed(Address const &token) const noexcept;
    StorageVariable<u64_be> max_age() const noexcept;

    Result<PriceFeed> fresh_feed(Address const &token) const;

public:
    FeedPriceOracle(State &, Address const &oracle);

    Address const &address() const noexcept
    {
        return address_;
    }

    Result<void>
    set_price(Caller const &, Address const &token, uint256_t const &price);

    Result<void> set_max_price_age(Caller const &, uint64_t seconds);

    uint64_t max_price_age() const;

    bool has_feed(Address const &token) const override;

    Result<uint256_t> quote(
        uint256_t const &amount_in, Address const &token_in,
        Address const &token_out) const override;
};

YIELDPOOL_STAKING_NAMESPACE_END
