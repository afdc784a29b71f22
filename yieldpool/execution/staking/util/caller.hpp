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

#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/staking/config.hpp>

#include <cstdint>

YIELDPOOL_STAKING_NAMESPACE_BEGIN

enum Role : uint8_t
{
    RoleNone = 0,
    RoleAdmin = (1 << 0),
    RoleGuardian = (1 << 1),
    RoleBackend = (1 << 2),
};

// The sender of a call together with the roles it was granted
struct Caller
{
    Address address{};
    uint8_t roles{RoleNone};

    bool has(Role const role) const noexcept
    {
        return (roles & role) != 0;
    }
};

YIELDPOOL_STAKING_NAMESPACE_END
