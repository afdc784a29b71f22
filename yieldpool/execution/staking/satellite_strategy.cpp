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
#include <yieldpool/execution/core/contract/storage_key.hpp>
#include <yieldpool/execution/core/fmt/address_fmt.hpp>
#include <yieldpool/execution/staking/satellite_strategy.hpp>
#include <yieldpool/execution/staking/util/staking_error.hpp>
#include <yieldpool/execution/state/atomic.hpp>
#include <yieldpool/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

YIELDPOOL_STAKING_ANONYMOUS_NAMESPACE_BEGIN

enum Namespace : uint8_t
{
    NSUserStrategy = 0x01,
};

YIELDPOOL_STAKING_ANONYMOUS_NAMESPACE_END

YIELDPOOL_STAKING_NAMESPACE_BEGIN

SatelliteDirectory::SatelliteDirectory(State &state, Address const &directory)
    : state_{state}
    , address_{directory}
{
}

StorageVariable<bool> SatelliteDirectory::user_strategy(
    Address const &owner, Address const &strategy) const
{
    return {state_, address_, mapping_slot(NSUserStrategy, owner, strategy)};
}

Result<void> SatelliteDirectory::register_strategy(
    Caller const &caller, SatelliteStrategy &strategy)
{
    BOOST_OUTCOME_TRY(atomically(state_, [&]() -> Result<void> {
        if (YIELDPOOL_UNLIKELY(!caller.has(RoleAdmin))) {
            return StakingError::NotAdmin;
        }
        Address const owner = strategy.owner();
        if (YIELDPOOL_UNLIKELY(
                owner == ZERO_ADDRESS || strategy.address() == ZERO_ADDRESS)) {
            return StakingError::ZeroAddress;
        }
        user_strategy(owner, strategy.address()).store(true);
        return outcome::success();
    }));

    // in-memory lookup, only once the ledger write has been accepted
    strategies_[strategy.address()] = &strategy;
    LOG_INFO(
        "satellite {} registered for owner {} with asset {}",
        strategy.address(),
        strategy.owner(),
        strategy.asset());
    return outcome::success();
}

bool SatelliteDirectory::is_user_strategy(
    Address const &owner, Address const &strategy) const
{
    return user_strategy(owner, strategy).load();
}

SatelliteStrategy *SatelliteDirectory::find(Address const &strategy) const
{
    auto const it = strategies_.find(strategy);
    return it == strategies_.end() ? nullptr : it->second;
}

YIELDPOOL_STAKING_NAMESPACE_END
