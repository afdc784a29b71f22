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

#include <yieldpool/execution/staking/protocol.hpp>
#include <yieldpool/execution/staking/satellite_strategy.hpp>
#include <yieldpool/execution/state/state.hpp>

YIELDPOOL_STAKING_NAMESPACE_BEGIN

Protocol::Protocol(
    State &state, ProtocolAddresses const &addresses, SwapVenue &venue,
    StrategyRegistry const &strategies)
    : state_{state}
    , pool_{state, addresses.pool}
    , scheduler_{pool_}
    , oracle_{state, addresses.oracle}
    , gateway_{state, addresses.gateway, oracle_, venue}
    , processor_{state, addresses.processor, pool_, gateway_, strategies}
{
}

YIELDPOOL_STAKING_NAMESPACE_END
