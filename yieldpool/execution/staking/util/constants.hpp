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
#include <yieldpool/execution/staking/config.hpp>

#include <intx/intx.hpp>

#include <cstdint>

YIELDPOOL_STAKING_NAMESPACE_BEGIN

using namespace intx::literals;

// Slippage is expressed in basis points of the quoted output
inline constexpr uint64_t BPS_DIVISOR{10'000};
inline constexpr uint64_t MAX_SLIPPAGE_BPS{2'500};
inline constexpr uint64_t DEFAULT_SLIPPAGE_BPS{100};

// Reward tokens must carry between 1 and 18 decimals
inline constexpr uint8_t MIN_REWARD_DECIMALS{1};
inline constexpr uint8_t MAX_REWARD_DECIMALS{18};

// Reward rates are stored scaled by 10^(36 - decimals) so that every reward
// token accrues with 36 digits of precision regardless of its own decimals
inline constexpr unsigned RATE_PRECISION{36};

inline constexpr uint64_t DEFAULT_MAX_PRICE_AGE{3600};

constexpr uint256_t rate_scale(uint8_t const decimals) noexcept
{
    return pow10(RATE_PRECISION - decimals);
}

static_assert(MAX_SLIPPAGE_BPS < BPS_DIVISOR);
static_assert(DEFAULT_SLIPPAGE_BPS <= MAX_SLIPPAGE_BPS);
static_assert(MAX_REWARD_DECIMALS < RATE_PRECISION);

YIELDPOOL_STAKING_NAMESPACE_END
