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

#include <yieldpool/core/bytes.hpp>
#include <yieldpool/core/config.hpp>
#include <yieldpool/core/keccak.hpp>
#include <yieldpool/execution/core/address.hpp>

#include <bit>
#include <cstdint>

YIELDPOOL_NAMESPACE_BEGIN

// Slot of a single constant variable, numbered from 1 under prefix 0x00.
constexpr bytes32_t variable_slot(uint8_t const index) noexcept
{
    bytes32_t key{};
    key.bytes[31] = index;
    return key;
}

// mapping(address => T) under `prefix`. The low 11 bytes are left free so a
// value may span several consecutive slots.
constexpr bytes32_t mapping_slot(uint8_t const prefix, Address const &key)
{
    struct
    {
        uint8_t mask;
        Address address;
        uint8_t slots[11];
    } packed{.mask = prefix, .address = key, .slots = {}};

    static_assert(sizeof(packed) == sizeof(bytes32_t));
    return std::bit_cast<bytes32_t>(packed);
}

// mapping(address => mapping(address => T)) under `prefix`. Two addresses do
// not fit in one slot, so the packed key is hashed.
inline bytes32_t
mapping_slot(uint8_t const prefix, Address const &outer, Address const &inner)
{
    struct
    {
        uint8_t mask;
        Address outer;
        Address inner;
    } packed{.mask = prefix, .outer = outer, .inner = inner};

    static_assert(sizeof(packed) == 41);
    return keccak256(byte_string_view{
        reinterpret_cast<unsigned char const *>(&packed), sizeof(packed)});
}

YIELDPOOL_NAMESPACE_END
