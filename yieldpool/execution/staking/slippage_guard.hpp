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

// Swap tolerance in basis points: a registry-wide default plus an optional
// per-account override, where zero defers to the default.
class SlippageGuard
{
    State &state_;
    Address const &home_;

    StorageVariable<u64_be> default_bps() const noexcept;
    StorageVariable<u64_be> account_bps(Address const &account) const noexcept;

public:
    SlippageGuard(State &, Address const &home);

    Result<void> set_default_slippage(Caller const &, uint64_t bps);

    uint64_t default_slippage() const;

    /// Ownership of `account` is the caller's concern
    Result<void> set_account_slippage(Address const &account, uint64_t bps);

    /// Raw per-account setting, zero when unset
    uint64_t account_slippage(Address const &account) const;

    /// Effective tolerance for swaps made on behalf of `account`
    uint64_t get_account_slippage(Address const &account) const;
};

YIELDPOOL_STAKING_NAMESPACE_END
