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

#include <evmc/evmc.hpp>

#include <bit>
#include <functional>

YIELDPOOL_NAMESPACE_BEGIN

using bytes32_t = ::evmc::bytes32;

static_assert(sizeof(bytes32_t) == 32);
static_assert(alignof(bytes32_t) == 1);

using namespace evmc::literals;

YIELDPOOL_NAMESPACE_END

namespace boost
{
    inline size_t hash_value(yieldpool::bytes32_t const &bytes) noexcept
    {
        return std::hash<yieldpool::bytes32_t>{}(bytes);
    }
}
