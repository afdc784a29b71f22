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
#include <yieldpool/execution/core/contract/storage_variable.hpp>
#include <yieldpool/execution/staking/config.hpp>
#include <yieldpool/execution/staking/util/caller.hpp>

#include <cstdint>

YIELDPOOL_NAMESPACE_BEGIN

class State;

YIELDPOOL_NAMESPACE_END

YIELDPOOL_STAKING_NAMESPACE_BEGIN

class PriceOracle;

struct SwapOrder
{
    Address owner;
    Address sell_token;
    Address buy_token;
    uint256_t sell_amount;
    uint256_t buy_amount;
    Address pool;
};

/// External swap execution. The venue proposes an output for a sell order
/// and, once authorised, settles it by pulling the sell side from the owner
/// and delivering at least `buy_amount` of the buy side.
class SwapVenue
{
public:
    virtual ~SwapVenue() = default;

    virtual Address const &address() const = 0;

    virtual Result<uint256_t> propose(
        Address const &pool, Address const &sell_token,
        Address const &buy_token, uint256_t const &sell_amount) = 0;

    virtual Result<void> settle(SwapOrder const &) = 0;
};

/// Converts reward tokens through the venue, bounded by the oracle. Orders
/// are only authorised after both tokens are allow-listed and the venue's
/// proposal passes the price check.
class SwapGateway
{
    State &state_;
    Address const address_;
    PriceOracle const &oracle_;
    SwapVenue &venue_;

    StorageVariable<bool> allowed(Address const &token) const noexcept;

public:
    SwapGateway(
        State &, Address const &gateway, PriceOracle const &, SwapVenue &);

    Address const &address() const noexcept
    {
        return address_;
    }

    /// Allow-listing requires a price feed for the token
    Result<void>
    set_token_allowed(Caller const &, Address const &token, bool allow);

    bool is_token_allowed(Address const &token) const;

    Result<void> quote_and_check(
        uint256_t const &amount_in, Address const &token_in,
        Address const &token_out, uint256_t const &amount_out_proposed,
        uint64_t slippage_bps) const;

    /// Sells `amount_in` of `token_in` held by `owner` for `token_out`.
    /// Returns the output actually received.
    Result<uint256_t> swap(
        Address const &owner, Address const &token_in,
        Address const &token_out, uint256_t const &amount_in,
        uint64_t slippage_bps, Address const &pool);
};

YIELDPOOL_STAKING_NAMESPACE_END
