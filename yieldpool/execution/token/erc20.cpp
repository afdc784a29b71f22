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

#include <yieldpool/core/config.hpp>
#include <yieldpool/core/int.hpp>
#include <yieldpool/core/likely.h>
#include <yieldpool/core/result.hpp>
#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/core/contract/abi_encode.hpp>
#include <yieldpool/execution/core/contract/big_endian.hpp>
#include <yieldpool/execution/core/contract/checked_math.hpp>
#include <yieldpool/execution/core/contract/events.hpp>
#include <yieldpool/execution/core/contract/storage_key.hpp>
#include <yieldpool/execution/core/contract/storage_variable.hpp>
#include <yieldpool/execution/state/state.hpp>
#include <yieldpool/execution/token/erc20.hpp>
#include <yieldpool/execution/token/token_error.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>

YIELDPOOL_ANONYMOUS_NAMESPACE_BEGIN

constexpr auto META_SLOT = variable_slot(1);
constexpr auto SUPPLY_SLOT = variable_slot(2);

enum Namespace : uint8_t
{
    NSBalance = 0x01,
    NSAllowance = 0x02,
};

YIELDPOOL_ANONYMOUS_NAMESPACE_END

YIELDPOOL_NAMESPACE_BEGIN

Erc20::Erc20(State &state, Address const &token)
    : state_{state}
    , address_{token}
{
}

StorageVariable<Erc20::Meta> Erc20::meta() const noexcept
{
    return {state_, address_, META_SLOT};
}

StorageVariable<u256_be> Erc20::supply() const noexcept
{
    return {state_, address_, SUPPLY_SLOT};
}

StorageVariable<u256_be> Erc20::balance(Address const &holder) const noexcept
{
    return {state_, address_, mapping_slot(NSBalance, holder)};
}

StorageVariable<u256_be>
Erc20::allowance_of(Address const &owner, Address const &spender) const
{
    return {state_, address_, mapping_slot(NSAllowance, owner, spender)};
}

Result<void> Erc20::create(uint8_t const decimals)
{
    if (YIELDPOOL_UNLIKELY(exists())) {
        return TokenError::TokenExists;
    }
    if (YIELDPOOL_UNLIKELY(decimals > MAX_DECIMALS)) {
        return TokenError::InvalidDecimals;
    }
    meta().store(Meta{.created = 1, .decimals = decimals});
    return outcome::success();
}

bool Erc20::exists() const
{
    return meta().load().created.native() != 0;
}

Result<uint8_t> Erc20::decimals() const
{
    auto const m = meta().load();
    if (YIELDPOOL_UNLIKELY(m.created.native() == 0)) {
        return TokenError::UnknownToken;
    }
    return m.decimals.native();
}

uint256_t Erc20::total_supply() const
{
    return supply().load().native();
}

uint256_t Erc20::balance_of(Address const &holder) const
{
    return balance(holder).load().native();
}

uint256_t Erc20::allowance(Address const &owner, Address const &spender) const
{
    return allowance_of(owner, spender).load().native();
}

Result<void>
Erc20::move(Address const &from, Address const &to, uint256_t const &amount)
{
    if (YIELDPOOL_UNLIKELY(!exists())) {
        return TokenError::UnknownToken;
    }
    if (YIELDPOOL_UNLIKELY(to == ZERO_ADDRESS)) {
        return TokenError::InvalidReceiver;
    }
    auto from_balance = balance(from);
    uint256_t const available = from_balance.load().native();
    if (YIELDPOOL_UNLIKELY(available < amount)) {
        return TokenError::InsufficientBalance;
    }
    from_balance.store(available - amount);

    auto to_balance = balance(to);
    BOOST_OUTCOME_TRY(
        auto const credited, checked_add(to_balance.load().native(), amount));
    to_balance.store(credited);

    auto event = EventBuilder(address_, "Transfer(address,address,uint256)")
                     .add_topic(abi_encode_address(from))
                     .add_topic(abi_encode_address(to))
                     .add_data(abi_encode_uint(amount))
                     .build();
    state_.store_log(event);
    return outcome::success();
}

Result<void> Erc20::transfer(
    Address const &from, Address const &to, uint256_t const &amount)
{
    return move(from, to, amount);
}

Result<void> Erc20::transfer_from(
    Address const &spender, Address const &from, Address const &to,
    uint256_t const &amount)
{
    auto allowed = allowance_of(from, spender);
    uint256_t const remaining = allowed.load().native();
    if (YIELDPOOL_UNLIKELY(remaining < amount)) {
        return TokenError::InsufficientAllowance;
    }
    // unlimited approvals are never consumed
    if (remaining != UINT256_MAX) {
        allowed.store(remaining - amount);
    }
    return move(from, to, amount);
}

Result<void> Erc20::approve(
    Address const &owner, Address const &spender, uint256_t const &amount)
{
    if (YIELDPOOL_UNLIKELY(!exists())) {
        return TokenError::UnknownToken;
    }
    if (YIELDPOOL_UNLIKELY(spender == ZERO_ADDRESS)) {
        return TokenError::InvalidReceiver;
    }
    allowance_of(owner, spender).store(amount);

    auto event = EventBuilder(address_, "Approval(address,address,uint256)")
                     .add_topic(abi_encode_address(owner))
                     .add_topic(abi_encode_address(spender))
                     .add_data(abi_encode_uint(amount))
                     .build();
    state_.store_log(event);
    return outcome::success();
}

Result<void> Erc20::mint(Address const &to, uint256_t const &amount)
{
    if (YIELDPOOL_UNLIKELY(!exists())) {
        return TokenError::UnknownToken;
    }
    if (YIELDPOOL_UNLIKELY(to == ZERO_ADDRESS)) {
        return TokenError::InvalidReceiver;
    }
    BOOST_OUTCOME_TRY(auto const new_supply, checked_add(total_supply(), amount));
    supply().store(new_supply);
    auto to_balance = balance(to);
    to_balance.store(to_balance.load().native() + amount);

    auto event = EventBuilder(address_, "Transfer(address,address,uint256)")
                     .add_topic(abi_encode_address(ZERO_ADDRESS))
                     .add_topic(abi_encode_address(to))
                     .add_data(abi_encode_uint(amount))
                     .build();
    state_.store_log(event);
    return outcome::success();
}

YIELDPOOL_NAMESPACE_END
