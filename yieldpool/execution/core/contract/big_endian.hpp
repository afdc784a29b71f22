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
#include <yieldpool/core/unaligned.hpp>

#include <algorithm>
#include <bit>

YIELDPOOL_NAMESPACE_BEGIN

// Unsigned integer stored most significant byte first with alignment 1.
// Storage records are built from these so that their byte image is the
// same on every host and carries no padding.
template <typename T>
    requires(unsigned_integral<T>)
struct BigEndian
{
    using native_type = T;

    unsigned char bytes[sizeof(T)];

    BigEndian() = default;

    constexpr BigEndian(T const &x) noexcept
    {
        set(x);
    }

    constexpr BigEndian &operator=(T const &x) noexcept
    {
        set(x);
        return *this;
    }

    [[nodiscard]] constexpr T native() const noexcept
    {
        return intx::bswap(std::bit_cast<T>(bytes));
    }

    friend constexpr bool
    operator==(BigEndian const &a, BigEndian const &b) noexcept
    {
        return std::ranges::equal(a.bytes, b.bytes);
    }

private:
    constexpr void set(T const &x) noexcept
    {
        unaligned_store(bytes, intx::bswap(x));
    }
};

using u8_be = BigEndian<uint8_t>;
using u64_be = BigEndian<uint64_t>;
using u256_be = BigEndian<uint256_t>;

static_assert(sizeof(u8_be) == 1 && alignof(u8_be) == 1);
static_assert(sizeof(u64_be) == 8 && alignof(u64_be) == 1);
static_assert(sizeof(u256_be) == 32 && alignof(u256_be) == 1);

template <typename T>
inline constexpr bool is_big_endian_v = false;

template <typename U>
inline constexpr bool is_big_endian_v<BigEndian<U>> = true;

template <typename T>
concept BigEndianType = is_big_endian_v<T>;

YIELDPOOL_NAMESPACE_END
