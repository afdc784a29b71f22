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

#include <yieldpool/core/bytes.hpp>
#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/core/contract/big_endian.hpp>
#include <yieldpool/execution/core/contract/storage_array.hpp>
#include <yieldpool/execution/core/contract/storage_key.hpp>
#include <yieldpool/execution/core/contract/storage_variable.hpp>
#include <yieldpool/execution/state/state.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

using namespace yieldpool;
using namespace intx::literals;

struct Storage : public ::testing::Test
{
    static constexpr auto ADDRESS{
        0x36928500bc1dcd7af6a2b4008875cc336b927d57_address};
    State state{};
};

TEST_F(Storage, variable)
{
    StorageVariable<u256_be> var(state, ADDRESS, bytes32_t{6000});
    ASSERT_FALSE(var.load_checked().has_value());
    var.store(5_u256);
    ASSERT_TRUE(var.load_checked().has_value());
    EXPECT_EQ(var.load().native(), 5_u256);
    var.store(2000_u256);
    EXPECT_EQ(var.load().native(), 2000_u256);
    var.clear();
    EXPECT_FALSE(var.load_checked().has_value());
}

TEST_F(Storage, multi_slot_struct)
{
    struct S
    {
        Address who;
        u64_be x;
        u256_be z;
    };

    StorageVariable<S> var(state, ADDRESS, mapping_slot(0x07, ADDRESS));
    static_assert(StorageVariable<S>::N == 2);

    ASSERT_FALSE(var.load_checked().has_value());
    var.store(S{.who = ADDRESS, .x = 4, .z = 6_u256});
    S s = var.load();
    EXPECT_EQ(s.who, ADDRESS);
    EXPECT_EQ(s.x.native(), 4);
    EXPECT_EQ(s.z.native(), 6_u256);

    // second slot sits right after the first
    auto const base = mapping_slot(0x07, ADDRESS);
    auto const next = intx::be::store<bytes32_t>(
        intx::be::load<uint256_t>(base) + 1);
    EXPECT_NE(state.get_storage(ADDRESS, next), bytes32_t{});

    var.clear();
    EXPECT_FALSE(var.load_checked().has_value());
    EXPECT_EQ(state.get_storage(ADDRESS, next), bytes32_t{});
}

TEST_F(Storage, array)
{
    struct SomeType
    {
        u256_be blob;
        u64_be counter;
    };

    StorageArray<SomeType> arr(state, ADDRESS, bytes32_t{100});
    EXPECT_EQ(arr.length(), 0);
    EXPECT_TRUE(arr.empty());

    for (uint64_t i = 0; i < 100; ++i) {
        arr.push(SomeType{.blob = 2000_u256, .counter = i});
        EXPECT_EQ(arr.length(), i + 1);
    }

    for (uint64_t i = 0; i < 100; ++i) {
        auto const res = arr.get(i);
        ASSERT_TRUE(res.load_checked().has_value())
            << "Could not load at index: " << i << std::endl;
        EXPECT_EQ(res.load().counter.native(), i);
    }

    for (uint64_t i = 100; i > 0; --i) {
        EXPECT_EQ(arr.pop().counter.native(), i - 1);
        EXPECT_EQ(arr.length(), i - 1);
    }
}

TEST_F(Storage, array_swap_remove)
{
    StorageArray<Address> arr(state, ADDRESS, bytes32_t{100});
    for (uint64_t i = 1; i <= 4; ++i) {
        arr.push(Address{i});
    }

    // removing from the middle moves the last element into the hole
    auto const moved = arr.swap_remove(1);
    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(moved.value(), Address{4});
    EXPECT_EQ(
        arr.load_all(), (std::vector<Address>{Address{1}, Address{4}, Address{3}}));

    // removing the tail moves nothing
    EXPECT_FALSE(arr.swap_remove(2).has_value());
    EXPECT_EQ(arr.load_all(), (std::vector<Address>{Address{1}, Address{4}}));
    EXPECT_FALSE(arr.get(2).load_checked().has_value());
}

TEST_F(Storage, mapping_slots)
{
    constexpr auto A{0x00000000000000000000000000000000000000aa_address};
    constexpr auto B{0x00000000000000000000000000000000000000bb_address};

    EXPECT_NE(mapping_slot(0x01, A), mapping_slot(0x02, A));
    EXPECT_NE(mapping_slot(0x01, A), mapping_slot(0x01, B));
    EXPECT_EQ(mapping_slot(0x01, A).bytes[0], 0x01);

    EXPECT_NE(mapping_slot(0x01, A, B), mapping_slot(0x01, B, A));
    EXPECT_NE(mapping_slot(0x01, A, B), mapping_slot(0x02, A, B));
    EXPECT_EQ(mapping_slot(0x01, A, B), mapping_slot(0x01, A, B));

    EXPECT_NE(variable_slot(1), variable_slot(2));
    EXPECT_EQ(variable_slot(3).bytes[31], 3);
}
