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
#include <yieldpool/core/unaligned.hpp>
#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/core/contract/big_endian.hpp>
#include <yieldpool/execution/state/state.hpp>

#include <intx/intx.hpp>

#include <algorithm>
#include <array>
#include <cstring>
#include <optional>
#include <type_traits>

YIELDPOOL_NAMESPACE_BEGIN

// Typed view of contract storage. A T occupies ceil(sizeof(T) / 32)
// consecutive slots starting at the variable's key; unused tail bytes of the
// last slot are zero.
template <typename T>
    requires std::has_unique_object_representations_v<T>
class StorageVariable
{
public:
    static constexpr size_t N =
        (sizeof(T) + sizeof(bytes32_t) - 1) / sizeof(bytes32_t);
    using Slots = std::array<bytes32_t, N>;

private:
    State &state_;
    Address const &address_;
    uint256_t const base_;

    bytes32_t slot_key(size_t const i) const
    {
        return intx::be::store<bytes32_t>(base_ + i);
    }

    Slots read() const
    {
        Slots slots;
        for (size_t i = 0; i < N; ++i) {
            slots[i] = state_.get_storage(address_, slot_key(i));
        }
        return slots;
    }

    void write(Slots const &slots)
    {
        for (size_t i = 0; i < N; ++i) {
            state_.set_storage(address_, slot_key(i), slots[i]);
        }
    }

    static T decode(Slots const &slots)
    {
        return unaligned_load<T>(&slots[0].bytes[0]);
    }

    static Slots encode(T const &value)
    {
        Slots slots{};
        std::memcpy(&slots[0].bytes, &value, sizeof(T));
        return slots;
    }

public:
    StorageVariable(State &state, Address const &address, bytes32_t const &key)
        : StorageVariable{state, address, intx::be::load<uint256_t>(key)}
    {
    }

    StorageVariable(State &state, Address const &address, uint256_t const &key)
        : state_{state}
        , address_{address}
        , base_{key}
    {
    }

    T load() const
    {
        return decode(read());
    }

    // nullopt if the variable was never written or has been cleared
    std::optional<T> load_checked() const
    {
        Slots const slots = read();
        bool const empty = std::ranges::all_of(
            slots, [](bytes32_t const &s) { return s == bytes32_t{}; });
        if (empty) {
            return std::nullopt;
        }
        return decode(slots);
    }

    void store(T const &value)
    {
        write(encode(value));
    }

    void clear()
    {
        write(Slots{});
    }
};

YIELDPOOL_NAMESPACE_END
