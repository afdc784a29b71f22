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

#include <yieldpool/core/config.hpp>
#include <yieldpool/core/int.hpp>
#include <yieldpool/core/result.hpp>
#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/core/contract/big_endian.hpp>
#include <yieldpool/execution/core/contract/storage_variable.hpp>
#include <yieldpool/execution/token/token_error.hpp>

#include <cstdint>

YIELDPOOL_NAMESPACE_BEGIN

class State;

/// Fungible token with ERC20 semantics. All of its state lives in the ledger
/// under the token's own address; an `Erc20` is a cheap view that may be
/// constructed whenever a token needs to be touched.
class Erc20
{
    State &state_;
    Address address_;

    struct Meta
    {
        u8_be created;
        u8_be decimals;
    };

    static_assert(StorageVariable<Meta>::N == 1);

    StorageVariable<Meta> meta() const noexcept;
    StorageVariable<u256_be> supply() const noexcept;
    StorageVariable<u256_be> balance(Address const &holder) const noexcept;
    StorageVariable<u256_be>
    allowance_of(Address const &owner, Address const &spender) const;

    Result<void> move(Address const &from, Address const &to, uint256_t const &);

public:
    static constexpr uint8_t MAX_DECIMALS = 36;

    Erc20(State &, Address const &token);

    Erc20(Erc20 const &) = delete;
    Erc20 &operator=(Erc20 const &) = delete;

    Address const &address() const noexcept
    {
        return address_;
    }

    /// Deploys the token. Fails if it already exists.
    Result<void> create(uint8_t decimals);

    bool exists() const;

    Result<uint8_t> decimals() const;

    uint256_t total_supply() const;
    uint256_t balance_of(Address const &holder) const;
    uint256_t allowance(Address const &owner, Address const &spender) const;

    Result<void>
    transfer(Address const &from, Address const &to, uint256_t const &amount);

    /// `spender` moves `amount` from `from` to `to` against its allowance.
    Result<void> transfer_from(
        Address const &spender, Address const &from, Address const &to,
        uint256_t const &amount);

    Result<void> approve(
        Address const &owner, Address const &spender, uint256_t const &amount);

    Result<void> mint(Address const &to, uint256_t const &amount);
};

YIELDPOOL_NAMESPACE_END
