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

#include <yieldpool/core/assert.h>
#include <yieldpool/execution/core/contract/storage_variable.hpp>

#include <intx/intx.hpp>

#include <vector>

YIELDPOOL_NAMESPACE_BEGIN

// Dense array in contract storage: the length lives at `slot`, elements
// follow from `slot + 1`.
template <typename T>
    requires std::has_unique_object_representations_v<T>
class StorageArray
{
    State &state_;
    Address const &address_;
    StorageVariable<u64_be> length_;
    uint256_t const start_index_;

    static constexpr size_t SLOT_PER_ELEM = StorageVariable<T>::N;

public:
    StorageArray(State &state, Address const &address, bytes32_t const &slot)
        : state_{state}
        , address_{address}
        , length_{StorageVariable<u64_be>(state, address, slot)}
        , start_index_{intx::be::load<uint256_t>(slot) + 1}
    {
    }

    uint64_t length() const noexcept
    {
        return length_.load().native();
    }

    bool empty() const noexcept
    {
        return length() == 0;
    }

    StorageVariable<T> get(uint64_t const index) const noexcept
    {
        uint256_t const offset = start_index_ + index * SLOT_PER_ELEM;
        return StorageVariable<T>{
            state_, address_, intx::be::store<bytes32_t>(offset)};
    }

    void push(T const &value) noexcept
    {
        auto const len = length();
        get(len).store(value);
        length_.store(len + 1);
    }

    T pop() noexcept
    {
        uint64_t len = length();
        YIELDPOOL_ASSERT(len > 0);
        len = len - 1;
        auto var = get(len);
        T const value = var.load();
        var.clear();
        length_.store(len);
        return value;
    }

    // Moves the last element into `index` and truncates. Returns the element
    // that now occupies `index`, or nothing if `index` was the last one.
    std::optional<T> swap_remove(uint64_t const index) noexcept
    {
        auto const len = length();
        YIELDPOOL_ASSERT(index < len);
        T const last = pop();
        if (index == len - 1) {
            return std::nullopt;
        }
        get(index).store(last);
        return last;
    }

    std::vector<T> load_all() const
    {
        std::vector<T> out;
        auto const len = length();
        out.reserve(len);
        for (uint64_t i = 0; i < len; ++i) {
            out.push_back(get(i).load());
        }
        return out;
    }
};

YIELDPOOL_NAMESPACE_END
