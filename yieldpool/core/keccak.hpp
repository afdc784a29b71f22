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

#include <yieldpool/core/byte_string.hpp>
#include <yieldpool/core/bytes.hpp>
#include <yieldpool/core/config.hpp>

#include <ethash/keccak.hpp>

#include <bit>
#include <string_view>

YIELDPOOL_NAMESPACE_BEGIN

inline bytes32_t keccak256(byte_string_view const bytes)
{
    auto const hash = ethash::keccak256(bytes.data(), bytes.size());
    return std::bit_cast<bytes32_t>(hash);
}

inline bytes32_t keccak256(std::string_view const s)
{
    return keccak256(byte_string_view{
        reinterpret_cast<unsigned char const *>(s.data()), s.size()});
}

YIELDPOOL_NAMESPACE_END
