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
#include <yieldpool/core/int.hpp>
#include <yieldpool/core/unaligned.hpp>
#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/core/contract/big_endian.hpp>

YIELDPOOL_NAMESPACE_BEGIN

constexpr bytes32_t abi_encode_address(Address const &address)
{
    bytes32_t output{};
    unaligned_store(&output.bytes[12], address);
    return output;
}

template <BigEndianType I>
constexpr bytes32_t abi_encode_uint(I const &i)
{
    static_assert(sizeof(I) <= sizeof(bytes32_t));

    constexpr size_t offset = sizeof(bytes32_t) - sizeof(I);
    bytes32_t output{};
    unaligned_store(&output.bytes[offset], i);
    return output;
}

constexpr bytes32_t abi_encode_uint(uint256_t const &i)
{
    return abi_encode_uint(u256_be{i});
}

constexpr bytes32_t abi_encode_bool(bool const b)
{
    return abi_encode_uint(u8_be{static_cast<uint8_t>(b ? 1 : 0)});
}

constexpr Address abi_decode_address(bytes32_t const &word)
{
    return unaligned_load<Address>(&word.bytes[12]);
}

inline uint256_t abi_decode_uint(byte_string_view const data, size_t const index)
{
    bytes32_t word{};
    auto const offset = index * sizeof(bytes32_t);
    if (offset + sizeof(bytes32_t) <= data.size()) {
        word = unaligned_load<bytes32_t>(data.data() + offset);
    }
    return intx::be::load<uint256_t>(word);
}

YIELDPOOL_NAMESPACE_END
