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

#include <yieldpool/core/likely.h>
#include <yieldpool/execution/core/contract/abi_encode.hpp>
#include <yieldpool/execution/core/contract/events.hpp>
#include <yieldpool/execution/core/contract/storage_key.hpp>
#include <yieldpool/execution/core/fmt/address_fmt.hpp>
#include <yieldpool/execution/staking/slippage_guard.hpp>
#include <yieldpool/execution/staking/util/constants.hpp>
#include <yieldpool/execution/staking/util/staking_error.hpp>
#include <yieldpool/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>

#include <quill/Quill.h>

YIELDPOOL_STAKING_ANONYMOUS_NAMESPACE_BEGIN

constexpr auto DEFAULT_SLIPPAGE_SLOT{
    0x2000000000000000000000000000000000000000000000000000000000000000_bytes32};

enum Namespace : uint8_t
{
    NSAccountSlippage = 0x21,
};

void emit_slippage_updated(
    State &state, Address const &home, Address const &account,
    uint64_t const bps)
{
    auto event = EventBuilder(home, "SlippageUpdated(address,uint256)")
                     .add_topic(abi_encode_address(account))
                     .add_data(abi_encode_uint(u64_be{bps}))
                     .build();
    state.store_log(event);
}

YIELDPOOL_STAKING_ANONYMOUS_NAMESPACE_END

YIELDPOOL_STAKING_NAMESPACE_BEGIN

SlippageGuard::SlippageGuard(State &state, Address const &home)
    : state_{state}
    , home_{home}
{
}

StorageVariable<u64_be> SlippageGuard::default_bps() const noexcept
{
    return {state_, home_, DEFAULT_SLIPPAGE_SLOT};
}

StorageVariable<u64_be>
SlippageGuard::account_bps(Address const &account) const noexcept
{
    return {state_, home_, mapping_slot(NSAccountSlippage, account)};
}

Result<void>
SlippageGuard::set_default_slippage(Caller const &caller, uint64_t const bps)
{
    if (YIELDPOOL_UNLIKELY(!caller.has(RoleAdmin))) {
        return StakingError::NotAdmin;
    }
    if (YIELDPOOL_UNLIKELY(bps == 0 || bps > MAX_SLIPPAGE_BPS)) {
        return StakingError::InvalidSlippage;
    }
    default_bps().store(bps);
    emit_slippage_updated(state_, home_, ZERO_ADDRESS, bps);
    LOG_INFO("default slippage set to {} bps", bps);
    return outcome::success();
}

uint64_t SlippageGuard::default_slippage() const
{
    uint64_t const bps = default_bps().load().native();
    return bps == 0 ? DEFAULT_SLIPPAGE_BPS : bps;
}

Result<void> SlippageGuard::set_account_slippage(
    Address const &account, uint64_t const bps)
{
    if (YIELDPOOL_UNLIKELY(bps > MAX_SLIPPAGE_BPS)) {
        return StakingError::InvalidSlippage;
    }
    account_bps(account).store(bps);
    emit_slippage_updated(state_, home_, account, bps);
    return outcome::success();
}

uint64_t SlippageGuard::account_slippage(Address const &account) const
{
    return account_bps(account).load().native();
}

uint64_t SlippageGuard::get_account_slippage(Address const &account) const
{
    uint64_t const bps = account_slippage(account);
    return bps == 0 ? default_slippage() : bps;
}

YIELDPOOL_STAKING_NAMESPACE_END
